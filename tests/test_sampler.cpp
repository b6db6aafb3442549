#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "sampler.hpp"

namespace {

// Plays back a script of focused windows; nullopt entries throw ProbeError.
class ScriptedProbe : public WindowProbe {
  public:
    explicit ScriptedProbe(std::deque<std::optional<FocusedWindow>> script)
        : m_Script(std::move(script)) {}

    FocusedWindow GetFocusedWindow() override {
        ++calls;
        if (m_Script.empty()) {
            return FocusedWindow{"idle-app", "", false};
        }
        auto next = m_Script.front();
        m_Script.pop_front();
        if (!next.has_value()) {
            throw ProbeError("compositor went away");
        }
        return *next;
    }

    int calls = 0;

  private:
    std::deque<std::optional<FocusedWindow>> m_Script;
};

Sampler::Clock CountingClock(double start, double step) {
    auto t = std::make_shared<double>(start - step);
    return [t, step]() { return *t += step; };
}

} // namespace

TEST(Sampler, PollTurnsWindowsIntoSamples) {
    ScriptedProbe probe({FocusedWindow{"code", "main.cpp", true},
                         FocusedWindow{"", "", false}});
    Sampler sampler(probe, CountingClock(100, 10));

    const Sample first = sampler.Poll();
    EXPECT_EQ(first.timestamp, 100);
    EXPECT_EQ(first.app, "code");
    EXPECT_EQ(first.title, "main.cpp");

    const Sample second = sampler.Poll();
    EXPECT_EQ(second.timestamp, 110);
    EXPECT_TRUE(second.IsIdle());
}

TEST(Sampler, ProbeFailureBecomesIdleSample) {
    ScriptedProbe probe({std::nullopt, std::nullopt, FocusedWindow{"code", "x", true}});
    Sampler sampler(probe, CountingClock(0, 1));

    EXPECT_TRUE(sampler.Poll().IsIdle());
    EXPECT_TRUE(sampler.Poll().IsIdle());
    EXPECT_EQ(sampler.GetProbeFailures(), 2u);
    EXPECT_EQ(sampler.Poll().app, "code");
    EXPECT_EQ(sampler.GetProbeFailures(), 2u);
}

TEST(Sampler, RunEmitsOneSamplePerTickUntilStopped) {
    ScriptedProbe probe({FocusedWindow{"a", "", true}, std::nullopt, FocusedWindow{"b", "", true},
                         FocusedWindow{"b", "", true}});
    Sampler sampler(probe, CountingClock(0, 10));

    std::vector<Sample> samples;
    sampler.Run(
        std::chrono::milliseconds(1), [&samples](const Sample &s) { samples.push_back(s); },
        [&samples]() { return samples.size() >= 4; });

    ASSERT_EQ(samples.size(), 4u);
    EXPECT_EQ(samples[0].app, "a");
    EXPECT_TRUE(samples[1].IsIdle());
    EXPECT_EQ(samples[2].app, "b");
    EXPECT_EQ(samples[3].timestamp, 30);
    EXPECT_EQ(probe.calls, 4);
}

TEST(Sampler, StopRequestedBeforeRunTakesNoSamples) {
    ScriptedProbe probe({});
    Sampler sampler(probe, CountingClock(0, 1));
    sampler.RequestStop();

    int samples = 0;
    sampler.Run(
        std::chrono::milliseconds(1), [&samples](const Sample &) { ++samples; }, nullptr);
    EXPECT_EQ(samples, 0);
}

TEST(Sampler, RequestStopInterruptsALongWait) {
    ScriptedProbe probe({});
    Sampler sampler(probe, CountingClock(0, 1));

    int samples = 0;
    const auto begin = std::chrono::steady_clock::now();
    std::thread stopper([&sampler]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        sampler.RequestStop();
    });
    sampler.Run(
        std::chrono::seconds(30), [&samples](const Sample &) { ++samples; }, nullptr);
    stopper.join();

    EXPECT_EQ(samples, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST(Sampler, CallbackExceptionsPropagate) {
    ScriptedProbe probe({});
    Sampler sampler(probe, CountingClock(0, 1));
    EXPECT_THROW(sampler.Run(
                     std::chrono::milliseconds(1),
                     [](const Sample &) { throw PersistenceError("disk full"); }, nullptr),
                 PersistenceError);
}
