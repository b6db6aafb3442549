#include "unix_socket.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// ─────────────────────────────────────
UnixSocket::~UnixSocket() {
    Close();
}

// ─────────────────────────────────────
bool UnixSocket::Connect(const std::string &path) {
    if (m_Fd >= 0) {
        return true;
    }

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Invalid IPC socket path '{}'", path);
        return false;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::error("Failed to create IPC socket: {}", std::strerror(errno));
        return false;
    }

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        spdlog::debug("Failed to connect to {}: {}", path, std::strerror(errno));
        ::close(fd);
        return false;
    }

    m_Fd = fd;
    m_Buffer.clear();
    return true;
}

// ─────────────────────────────────────
void UnixSocket::Close() {
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
    }
    m_Buffer.clear();
}

// ─────────────────────────────────────
bool UnixSocket::SendAll(const std::string &data) {
    if (m_Fd < 0) {
        return false;
    }

    const char *ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t sent = ::send(m_Fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (sent == 0) {
            return false;
        }
        ptr += static_cast<std::size_t>(sent);
        remaining -= static_cast<std::size_t>(sent);
    }
    return true;
}

// ─────────────────────────────────────
bool UnixSocket::ReadLine(std::string &out_line, std::chrono::milliseconds timeout) {
    out_line.clear();
    if (m_Fd < 0) {
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto pos = m_Buffer.find('\n'); pos != std::string::npos) {
            out_line = m_Buffer.substr(0, pos);
            m_Buffer.erase(0, pos + 1);
            return true;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }

        pollfd pfd;
        pfd.fd = m_Fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc <= 0) {
            return false;
        }
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            return false;
        }

        char tmp[4096];
        const ssize_t n = ::recv(m_Fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            return false;
        }
        m_Buffer.append(tmp, static_cast<std::size_t>(n));
    }
}

// ─────────────────────────────────────
std::optional<std::string> UnixSocket::ReadToEnd(std::chrono::milliseconds timeout) {
    if (m_Fd < 0) {
        return std::nullopt;
    }

    std::string response = std::move(m_Buffer);
    m_Buffer.clear();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        pollfd pfd;
        pfd.fd = m_Fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc <= 0) {
            break;
        }

        // POLLIN and POLLHUP often arrive together when the peer replies and closes.
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            break;
        }
        if ((pfd.revents & POLLIN) == 0) {
            if ((pfd.revents & POLLHUP) != 0) {
                break;
            }
            continue;
        }

        char tmp[8192];
        const ssize_t n = ::recv(m_Fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            break;
        }
        response.append(tmp, static_cast<std::size_t>(n));
    }

    if (response.empty()) {
        return std::nullopt;
    }
    return response;
}
