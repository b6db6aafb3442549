#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "common.hpp"

class HyprlandIPC {
  public:
    HyprlandIPC();

    HyprlandIPC(const HyprlandIPC &) = delete;
    HyprlandIPC &operator=(const HyprlandIPC &) = delete;

    bool IsAvailable() const;

    // Socket1 JSON request (hyprctl-like), e.g. "activewindow". One connection per request.
    std::optional<nlohmann::json> SendJsonRequest(
        const std::string &rq,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) const;

    // nullopt when Hyprland could not be reached; an invalid window when nothing is focused.
    // Uses `activewindow`, falling back to `activeworkspace` + `clients`.
    std::optional<FocusedWindow> GetFocusedWindow(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) const;

    static FocusedWindow ParseClient(const nlohmann::json &client);

  private:
    static std::filesystem::path ResolveBaseDir();

  private:
    std::string m_InstanceSig;
    std::filesystem::path m_SocketFolder;
};
