#pragma once

#include <string>

#include "common.hpp"
#include "hyprland.hpp"
#include "niri.hpp"

// Narrow interface to the "which window is focused" primitive.
class WindowProbe {
  public:
    virtual ~WindowProbe() = default;

    // Invalid FocusedWindow when nothing is focused or the session is locked.
    // Throws ProbeError when the window system cannot be reached.
    virtual FocusedWindow GetFocusedWindow() = 0;
};

class Window : public WindowProbe {
  public:
    enum WM { NONE, NIRI, HYPRLAND };

    Window();
    FocusedWindow GetFocusedWindow() override;
    WM GetWM() const;
    std::string GetWMName() const;

  private:
    WM m_WM = NONE;
    NiriIPC m_Niri;
    HyprlandIPC m_Hypr;
};
