#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

#include "common.hpp"

class NiriIPC {
  public:
    NiriIPC();

    NiriIPC(const NiriIPC &) = delete;
    NiriIPC &operator=(const NiriIPC &) = delete;

    bool IsAvailable() const;

    // Sends a serde-enum request like "\"FocusedWindow\"\n" and parses the one-line reply.
    // niri answers one request per connection, so every call connects anew.
    std::optional<nlohmann::json> SendEnumRequest(
        const std::string &enum_name,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) const;

    // nullopt when niri could not be reached; an invalid window when nothing is focused.
    std::optional<FocusedWindow> GetFocusedWindow(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) const;

    static FocusedWindow ParseFocusedWindow(const nlohmann::json &reply);

  private:
    std::string m_SocketPath;
};
