#include "niri.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

#include "unix_socket.hpp"

// ─────────────────────────────────────
NiriIPC::NiriIPC() {
    const char *env = std::getenv("NIRI_SOCKET");
    if (env != nullptr) {
        m_SocketPath = env;
    }
}

// ─────────────────────────────────────
bool NiriIPC::IsAvailable() const {
    return !m_SocketPath.empty();
}

// ─────────────────────────────────────
std::optional<nlohmann::json> NiriIPC::SendEnumRequest(const std::string &enum_name,
                                                       std::chrono::milliseconds timeout) const {
    if (!IsAvailable()) {
        return std::nullopt;
    }

    UnixSocket socket;
    if (!socket.Connect(m_SocketPath)) {
        return std::nullopt;
    }

    if (!socket.SendAll("\"" + enum_name + "\"\n")) {
        spdlog::warn("Failed to send niri IPC request {}", enum_name);
        return std::nullopt;
    }

    std::string line;
    if (!socket.ReadLine(line, timeout)) {
        spdlog::debug("No response from niri IPC (timeout/disconnect)");
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(line);
    } catch (const std::exception &e) {
        spdlog::warn("Failed to parse niri IPC response JSON: {}", e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
std::optional<FocusedWindow> NiriIPC::GetFocusedWindow(std::chrono::milliseconds timeout) const {
    auto reply = SendEnumRequest("FocusedWindow", timeout);
    if (!reply.has_value()) {
        return std::nullopt;
    }
    if (reply->contains("Err")) {
        spdlog::debug("niri returned an error: {}", (*reply)["Err"].dump());
        return std::nullopt;
    }
    return ParseFocusedWindow(*reply);
}

// ─────────────────────────────────────
FocusedWindow NiriIPC::ParseFocusedWindow(const nlohmann::json &reply) {
    FocusedWindow focus;

    // Expected: { "Ok": { "FocusedWindow": { ... } | null } }
    if (!reply.is_object() || !reply.contains("Ok") || !reply["Ok"].is_object() ||
        !reply["Ok"].contains("FocusedWindow")) {
        spdlog::debug("Unexpected niri IPC response format");
        return focus;
    }

    const auto &fw = reply["Ok"]["FocusedWindow"];
    if (!fw.is_object()) {
        return focus;
    }

    if (fw.contains("app_id") && fw["app_id"].is_string()) {
        focus.app_id = fw["app_id"].get<std::string>();
    }
    if (fw.contains("title") && fw["title"].is_string()) {
        focus.title = fw["title"].get<std::string>();
    }

    const bool is_focused =
        !fw.contains("is_focused") || (fw["is_focused"].is_boolean() && fw["is_focused"].get<bool>());
    focus.valid = is_focused && !focus.app_id.empty();
    return focus;
}
