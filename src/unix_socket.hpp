#pragma once

#include <chrono>
#include <optional>
#include <string>

// Stream UNIX socket used for compositor IPC. Owns its descriptor.
class UnixSocket {
  public:
    UnixSocket() = default;
    ~UnixSocket();

    UnixSocket(const UnixSocket &) = delete;
    UnixSocket &operator=(const UnixSocket &) = delete;

    bool Connect(const std::string &path);
    void Close();

    bool SendAll(const std::string &data);

    // Reads one '\n' terminated line. Bytes after the newline are kept for the next call.
    bool ReadLine(std::string &out_line, std::chrono::milliseconds timeout);

    // Reads until the peer closes the connection or the timeout expires.
    std::optional<std::string> ReadToEnd(std::chrono::milliseconds timeout);

  private:
    int m_Fd = -1;
    std::string m_Buffer;
};
