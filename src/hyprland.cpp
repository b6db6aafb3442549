#include "hyprland.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

#include "unix_socket.hpp"

// ─────────────────────────────────────
HyprlandIPC::HyprlandIPC() {
    const char *env = std::getenv("HYPRLAND_INSTANCE_SIGNATURE");
    if (env != nullptr && *env) {
        m_InstanceSig = env;
        m_SocketFolder = ResolveBaseDir() / m_InstanceSig;
    }
}

// ─────────────────────────────────────
std::filesystem::path HyprlandIPC::ResolveBaseDir() {
    const char *runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir != nullptr && *runtime_dir) {
        std::error_code ec;
        const auto candidate = std::filesystem::path(runtime_dir) / "hypr";
        if (std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }

    // Older Hyprland releases keep their sockets under /tmp.
    spdlog::debug("$XDG_RUNTIME_DIR/hypr does not exist, falling back to /tmp/hypr");
    return std::filesystem::path("/tmp") / "hypr";
}

// ─────────────────────────────────────
bool HyprlandIPC::IsAvailable() const {
    return !m_InstanceSig.empty();
}

// ─────────────────────────────────────
std::optional<nlohmann::json> HyprlandIPC::SendJsonRequest(const std::string &rq,
                                                           std::chrono::milliseconds timeout) const {
    if (!IsAvailable()) {
        return std::nullopt;
    }

    UnixSocket socket;
    if (!socket.Connect((m_SocketFolder / ".socket.sock").string())) {
        return std::nullopt;
    }

    // "j/" prefix asks for a JSON reply.
    if (!socket.SendAll("j/" + rq)) {
        spdlog::debug("Hyprland IPC: failed to send '{}'", rq);
        return std::nullopt;
    }

    auto response = socket.ReadToEnd(timeout);
    if (!response.has_value()) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(*response);
    } catch (const std::exception &e) {
        spdlog::debug("Hyprland IPC: failed to parse JSON reply for '{}': {}", rq, e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
FocusedWindow HyprlandIPC::ParseClient(const nlohmann::json &client) {
    FocusedWindow focus;
    if (!client.is_object()) {
        return focus;
    }
    if (client.contains("class") && client["class"].is_string()) {
        focus.app_id = client["class"].get<std::string>();
    }
    if (client.contains("title") && client["title"].is_string()) {
        focus.title = client["title"].get<std::string>();
    }
    focus.valid = !focus.app_id.empty();
    return focus;
}

// ─────────────────────────────────────
std::optional<FocusedWindow> HyprlandIPC::GetFocusedWindow(std::chrono::milliseconds timeout) const {
    const auto active = SendJsonRequest("activewindow", timeout);
    if (active.has_value()) {
        FocusedWindow focus = ParseClient(*active);
        if (focus.valid) {
            return focus;
        }
    }

    const auto ws = SendJsonRequest("activeworkspace", timeout);
    if (!ws.has_value()) {
        // Neither request got an answer: the compositor is unreachable.
        return active.has_value() ? std::optional<FocusedWindow>(FocusedWindow{}) : std::nullopt;
    }
    if (!ws->is_object() || !ws->contains("lastwindow") || !(*ws)["lastwindow"].is_string()) {
        return FocusedWindow{};
    }

    const std::string last_window = (*ws)["lastwindow"].get<std::string>();
    if (last_window.empty() || last_window == "0x0") {
        return FocusedWindow{};
    }

    const auto clients = SendJsonRequest("clients", timeout);
    if (!clients.has_value() || !clients->is_array()) {
        return FocusedWindow{};
    }

    for (const auto &c : *clients) {
        if (!c.is_object() || !c.contains("address") || !c["address"].is_string()) {
            continue;
        }
        if (c["address"].get<std::string>() != last_window) {
            continue;
        }
        FocusedWindow focus = ParseClient(c);
        if (focus.title.empty() && ws->contains("lastwindowtitle") &&
            (*ws)["lastwindowtitle"].is_string()) {
            focus.title = (*ws)["lastwindowtitle"].get<std::string>();
        }
        return focus;
    }

    return FocusedWindow{};
}
