#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstring>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "errors.hpp"
#include "sampler.hpp"
#include "session_builder.hpp"
#include "test_helpers.hpp"
#include "window.hpp"

namespace {

class ScopedEnv {
  public:
    ScopedEnv(const char *name, const char *value) : m_Name(name) {
        if (const char *old = std::getenv(name)) {
            m_Old = old;
        }
        if (value != nullptr) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (m_Old.has_value()) {
            ::setenv(m_Name.c_str(), m_Old->c_str(), 1);
        } else {
            ::unsetenv(m_Name.c_str());
        }
    }

  private:
    std::string m_Name;
    std::optional<std::string> m_Old;
};

// Compositor IPC endpoint that, like niri and Hyprland, answers one request per
// connection and then closes it.
class FakeIpcServer {
  public:
    using Handler = std::function<std::string(const std::string &request)>;

    FakeIpcServer(const std::filesystem::path &path, Handler handler)
        : m_Handler(std::move(handler)) {
        m_Fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (m_Fd < 0 || ::bind(m_Fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
            ::listen(m_Fd, 4) != 0) {
            throw std::runtime_error("cannot listen on " + path.string());
        }
        m_Thread = std::thread([this]() { Serve(); });
    }
    ~FakeIpcServer() {
        ::shutdown(m_Fd, SHUT_RDWR);
        ::close(m_Fd);
        m_Thread.join();
    }

    std::vector<std::string> Requests() {
        std::lock_guard<std::mutex> lk(m_Mutex);
        return m_Requests;
    }

  private:
    void Serve() {
        while (true) {
            const int client = ::accept(m_Fd, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            char chunk[512];
            const ssize_t n = ::read(client, chunk, sizeof(chunk));
            if (n > 0) {
                const std::string request(chunk, static_cast<std::size_t>(n));
                {
                    std::lock_guard<std::mutex> lk(m_Mutex);
                    m_Requests.push_back(request);
                }
                const std::string reply = m_Handler(request);
                if (::send(client, reply.data(), reply.size(), MSG_NOSIGNAL) < 0) {
                    ::close(client);
                    return;
                }
            }
            ::close(client);
        }
    }

    int m_Fd = -1;
    Handler m_Handler;
    std::thread m_Thread;
    std::mutex m_Mutex;
    std::vector<std::string> m_Requests;
};

} // namespace

TEST(Window, NoCompositorMeansProbeError) {
    ScopedEnv niri("NIRI_SOCKET", nullptr);
    ScopedEnv hypr("HYPRLAND_INSTANCE_SIGNATURE", nullptr);

    Window window;
    EXPECT_EQ(window.GetWM(), Window::NONE);
    EXPECT_EQ(window.GetWMName(), "NONE");
    EXPECT_THROW(window.GetFocusedWindow(), ProbeError);
}

TEST(Window, UnreachableNiriSocketIsProbeError) {
    TempDir dir;
    const std::string path = (dir / "gone.sock").string();
    ScopedEnv niri("NIRI_SOCKET", path.c_str());

    Window window;
    EXPECT_EQ(window.GetWM(), Window::NIRI);
    EXPECT_THROW(window.GetFocusedWindow(), ProbeError);
}

TEST(Window, QueriesNiriWithOneConnectionPerRequest) {
    TempDir dir;
    const auto path = dir / "niri.sock";
    FakeIpcServer server(path, [](const std::string &) {
        return std::string(R"({"Ok":{"FocusedWindow":{"id":7,"title":"Inbox",)"
                           R"("app_id":"thunderbird","is_focused":true}}})"
                           "\n");
    });
    ScopedEnv niri("NIRI_SOCKET", path.c_str());
    ScopedEnv hypr("HYPRLAND_INSTANCE_SIGNATURE", nullptr);

    Window window;
    ASSERT_EQ(window.GetWM(), Window::NIRI);
    for (int i = 0; i < 3; ++i) {
        const FocusedWindow focus = window.GetFocusedWindow();
        EXPECT_TRUE(focus.valid);
        EXPECT_EQ(focus.app_id, "thunderbird");
        EXPECT_EQ(focus.title, "Inbox");
    }
    EXPECT_EQ(server.Requests(),
              (std::vector<std::string>(3, "\"FocusedWindow\"\n")));
}

TEST(Window, NiriSamplesBuildOneInterval) {
    TempDir dir;
    const auto path = dir / "niri.sock";
    FakeIpcServer server(path, [](const std::string &) {
        return std::string(R"({"Ok":{"FocusedWindow":{"title":"t","app_id":"kitty"}}})"
                           "\n");
    });
    ScopedEnv niri("NIRI_SOCKET", path.c_str());

    Window window;
    double t = 0.0;
    Sampler sampler(window, [&t]() { return t += 10.0; });
    std::vector<ActivityInterval> emitted;
    SessionBuilder builder(15.0, [&emitted](const ActivityInterval &i) { emitted.push_back(i); });
    for (int i = 0; i < 6; ++i) {
        builder.Push(sampler.Poll());
    }
    builder.Flush();

    EXPECT_EQ(sampler.GetProbeFailures(), 0u);
    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0], (ActivityInterval{10, 60, "kitty", "t"}));
}

class HyprlandTest : public ::testing::Test {
  protected:
    void SetUp() override {
        std::filesystem::create_directories(dir / "hypr" / "sig");
    }

    std::filesystem::path SocketPath() const {
        return dir / "hypr" / "sig" / ".socket.sock";
    }

    TempDir dir;
    ScopedEnv niri{"NIRI_SOCKET", nullptr};
    ScopedEnv hypr{"HYPRLAND_INSTANCE_SIGNATURE", "sig"};
    ScopedEnv runtime{"XDG_RUNTIME_DIR", dir.Path().c_str()};
};

TEST_F(HyprlandTest, ActiveWindowIsQueriedAsJson) {
    FakeIpcServer server(SocketPath(), [](const std::string &request) {
        if (request == "j/activewindow") {
            return std::string(R"({"address":"0xabc","class":"kitty","title":"zsh"})");
        }
        return std::string("unknown request");
    });

    Window window;
    ASSERT_EQ(window.GetWM(), Window::HYPRLAND);
    const FocusedWindow focus = window.GetFocusedWindow();
    EXPECT_TRUE(focus.valid);
    EXPECT_EQ(focus.app_id, "kitty");
    EXPECT_EQ(focus.title, "zsh");
    EXPECT_EQ(server.Requests(), (std::vector<std::string>{"j/activewindow"}));
}

TEST_F(HyprlandTest, FallsBackToWorkspaceClients) {
    FakeIpcServer server(SocketPath(), [](const std::string &request) {
        if (request == "j/activewindow") {
            return std::string("{}");
        }
        if (request == "j/activeworkspace") {
            return std::string(R"({"id":1,"lastwindow":"0xbeef","lastwindowtitle":"Docs"})");
        }
        return std::string(R"([{"address":"0x1","class":"kitty","title":"zsh"},)"
                           R"({"address":"0xbeef","class":"firefox","title":""}])");
    });

    HyprlandIPC ipc;
    const auto focus = ipc.GetFocusedWindow();
    ASSERT_TRUE(focus.has_value());
    EXPECT_TRUE(focus->valid);
    EXPECT_EQ(focus->app_id, "firefox");
    EXPECT_EQ(focus->title, "Docs");
    EXPECT_EQ(server.Requests(), (std::vector<std::string>{"j/activewindow", "j/activeworkspace",
                                                           "j/clients"}));
}

TEST_F(HyprlandTest, EmptyWorkspaceIsNoFocus) {
    FakeIpcServer server(SocketPath(), [](const std::string &request) {
        if (request == "j/activeworkspace") {
            return std::string(R"({"id":1,"lastwindow":"0x0","lastwindowtitle":""})");
        }
        return std::string("{}");
    });

    HyprlandIPC ipc;
    const auto focus = ipc.GetFocusedWindow();
    ASSERT_TRUE(focus.has_value());
    EXPECT_FALSE(focus->valid);
}

TEST_F(HyprlandTest, MissingSocketIsAProbeError) {
    Window window;
    ASSERT_EQ(window.GetWM(), Window::HYPRLAND);
    EXPECT_THROW(window.GetFocusedWindow(), ProbeError);
}

TEST(NiriIPC, ParsesFocusedWindowReplies) {
    const auto focused = NiriIPC::ParseFocusedWindow(nlohmann::json::parse(
        R"({"Ok":{"FocusedWindow":{"title":"t","app_id":"firefox","is_focused":true}}})"));
    EXPECT_TRUE(focused.valid);
    EXPECT_EQ(focused.app_id, "firefox");

    const auto nothing =
        NiriIPC::ParseFocusedWindow(nlohmann::json::parse(R"({"Ok":{"FocusedWindow":null}})"));
    EXPECT_FALSE(nothing.valid);

    const auto no_app = NiriIPC::ParseFocusedWindow(
        nlohmann::json::parse(R"({"Ok":{"FocusedWindow":{"title":"t","app_id":null}}})"));
    EXPECT_FALSE(no_app.valid);

    EXPECT_FALSE(NiriIPC::ParseFocusedWindow(nlohmann::json::parse(R"({"Err":"bad"})")).valid);
}

TEST(HyprlandIPC, ParsesClients) {
    const auto client =
        HyprlandIPC::ParseClient(nlohmann::json::parse(R"({"class":"kitty","title":"zsh"})"));
    EXPECT_TRUE(client.valid);
    EXPECT_EQ(client.app_id, "kitty");
    EXPECT_EQ(client.title, "zsh");

    EXPECT_FALSE(HyprlandIPC::ParseClient(nlohmann::json::parse(R"({"class":""})")).valid);
    EXPECT_FALSE(HyprlandIPC::ParseClient(nlohmann::json::parse("[]")).valid);
}
