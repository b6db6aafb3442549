#include "window.hpp"

#include <spdlog/spdlog.h>

#include "errors.hpp"

// ─────────────────────────────────────
Window::Window() {
    if (m_Niri.IsAvailable()) {
        m_WM = NIRI;
    } else if (m_Hypr.IsAvailable()) {
        m_WM = HYPRLAND;
    } else {
        m_WM = NONE;
        spdlog::error("No supported window manager detected (NIRI_SOCKET or "
                      "HYPRLAND_INSTANCE_SIGNATURE must be set)");
        return;
    }
    spdlog::info("Window manager detected: {}", GetWMName());
}

// ─────────────────────────────────────
FocusedWindow Window::GetFocusedWindow() {
    std::optional<FocusedWindow> focus;
    switch (m_WM) {
    case NIRI:
        focus = m_Niri.GetFocusedWindow();
        break;
    case HYPRLAND:
        focus = m_Hypr.GetFocusedWindow();
        break;
    default:
        throw ProbeError("no supported window manager");
    }

    if (!focus.has_value()) {
        throw ProbeError(GetWMName() + " IPC did not answer");
    }
    return *focus;
}

// ─────────────────────────────────────
Window::WM Window::GetWM() const {
    return m_WM;
}

// ─────────────────────────────────────
std::string Window::GetWMName() const {
    switch (m_WM) {
    case NIRI:
        return "NIRI";
    case HYPRLAND:
        return "HYPRLAND";
    default:
        return "NONE";
    }
}
