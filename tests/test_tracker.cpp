#include <gtest/gtest.h>

#include <deque>
#include <memory>
#include <vector>

#include "csv_log_store.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include "tracker.hpp"

namespace {

class FixedProbe : public WindowProbe {
  public:
    explicit FixedProbe(std::deque<FocusedWindow> script) : m_Script(std::move(script)) {}

    FocusedWindow GetFocusedWindow() override {
        ++calls;
        if (m_Script.empty()) {
            return FocusedWindow{};
        }
        FocusedWindow next = m_Script.front();
        m_Script.pop_front();
        return next;
    }

    int calls = 0;

  private:
    std::deque<FocusedWindow> m_Script;
};

class RejectingStore : public LogStore {
  public:
    void PrepareForAppend() override {}
    void Append(const ActivityInterval &) override {
        ++attempts;
        throw PersistenceError("disk full");
    }
    LogReadResult ReadAll(const DateRange &) override {
        return {};
    }
    std::string Describe() const override {
        return "rejecting store";
    }

    int attempts = 0;
};

Sampler::Clock TenSecondTicks(double start) {
    auto t = std::make_shared<double>(start - 10.0);
    return [t]() { return *t += 10.0; };
}

TrackOptions FastOptions(const std::filesystem::path &log) {
    TrackOptions options;
    options.interval = 0.001;
    options.inactivityThreshold = 15.0;
    options.logFile = log.string();
    return options;
}

} // namespace

TEST(Tracker, WritesClosedIntervalsToTheLog) {
    TempDir dir;
    const auto log = dir / "activity_log.csv";
    FixedProbe probe({FocusedWindow{"code", "main.cpp", true},
                      FocusedWindow{"code", "main.cpp", true},
                      FocusedWindow{"code", "main.cpp", true},
                      FocusedWindow{"firefox", "Docs", true},
                      FocusedWindow{"firefox", "Docs", true},
                      FocusedWindow{"", "", false}});

    Tracker tracker(FastOptions(log), probe, std::make_unique<CsvLogStore>(log),
                    TenSecondTicks(100));
    EXPECT_EQ(tracker.Run([&probe]() { return probe.calls >= 6; }), TIMETRACKER_EXIT_OK);
    EXPECT_EQ(tracker.GetWrittenIntervals(), 2u);

    const auto read = CsvLogStore(log).ReadAll();
    EXPECT_EQ(read.skipped, 0u);
    ASSERT_EQ(read.intervals.size(), 2u);
    EXPECT_EQ(read.intervals[0], (ActivityInterval{100, 120, "code", "main.cpp"}));
    EXPECT_EQ(read.intervals[1], (ActivityInterval{130, 140, "firefox", "Docs"}));
}

TEST(Tracker, FlushesTheOpenIntervalOnStop) {
    TempDir dir;
    const auto log = dir / "activity_log.csv";
    FixedProbe probe({FocusedWindow{"kitty", "vim", true}, FocusedWindow{"kitty", "vim", true}});

    Tracker tracker(FastOptions(log), probe, std::make_unique<CsvLogStore>(log),
                    TenSecondTicks(500));
    EXPECT_EQ(tracker.Run([&probe]() { return probe.calls >= 2; }), TIMETRACKER_EXIT_OK);

    const auto read = CsvLogStore(log).ReadAll();
    ASSERT_EQ(read.intervals.size(), 1u);
    EXPECT_EQ(read.intervals[0], (ActivityInterval{500, 510, "kitty", "vim"}));
}

TEST(Tracker, RequestStopEndsTheRun) {
    TempDir dir;
    const auto log = dir / "activity_log.csv";
    FixedProbe probe({FocusedWindow{"kitty", "vim", true}});

    Tracker tracker(FastOptions(log), probe, std::make_unique<CsvLogStore>(log),
                    TenSecondTicks(0));
    tracker.RequestStop();
    EXPECT_EQ(tracker.Run(nullptr), TIMETRACKER_EXIT_OK);
    EXPECT_EQ(probe.calls, 0);
    EXPECT_EQ(tracker.GetWrittenIntervals(), 0u);
}

TEST(Tracker, UnopenableLogFails) {
    TempDir dir;
    const auto log = dir / "missing" / "activity_log.csv";
    FixedProbe probe({FocusedWindow{"kitty", "vim", true}});

    Tracker tracker(FastOptions(log), probe, std::make_unique<CsvLogStore>(log),
                    TenSecondTicks(0));
    EXPECT_EQ(tracker.Run([]() { return false; }), TIMETRACKER_EXIT_FAILURE);
    EXPECT_EQ(probe.calls, 0);
}

TEST(Tracker, AppendFailureStopsWithFailure) {
    FixedProbe probe({FocusedWindow{"code", "a", true}, FocusedWindow{"code", "a", true},
                      FocusedWindow{"firefox", "b", true}, FocusedWindow{"firefox", "b", true}});
    auto store = std::make_unique<RejectingStore>();
    RejectingStore &rejecting = *store;

    Tracker tracker(FastOptions("unused.csv"), probe, std::move(store), TenSecondTicks(0));
    EXPECT_EQ(tracker.Run([&probe]() { return probe.calls >= 10; }), TIMETRACKER_EXIT_FAILURE);
    EXPECT_GE(rejecting.attempts, 1);
    EXPECT_EQ(tracker.GetWrittenIntervals(), 0u);
    EXPECT_LT(probe.calls, 10);
}
