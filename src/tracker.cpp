#include "tracker.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstring>

#include <signal.h>

#include "errors.hpp"
#include "session_builder.hpp"

namespace {

std::atomic<bool> g_StopSignal{false};

// ─────────────────────────────────────
extern "C" void OnStopSignal(int) {
    g_StopSignal.store(true);
}

// ─────────────────────────────────────
void InstallStopHandlers() {
    struct sigaction sa {};
    sa.sa_handler = OnStopSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
        spdlog::warn("Cannot install SIGINT/SIGTERM handlers: {}", std::strerror(errno));
    }
}

} // namespace

// ─────────────────────────────────────
Tracker::Tracker(const TrackOptions &options, WindowProbe &probe,
                 std::unique_ptr<LogStore> store, Sampler::Clock clock)
    : m_Options(options), m_Store(std::move(store)), m_Sampler(probe, std::move(clock)) {}

// ─────────────────────────────────────
void Tracker::RequestStop() {
    m_Sampler.RequestStop();
}

// ─────────────────────────────────────
std::size_t Tracker::GetWrittenIntervals() const {
    return m_Written;
}

// ─────────────────────────────────────
int Tracker::Run(const Sampler::StopPredicate &shouldStop) {
    try {
        m_Store->PrepareForAppend();
    } catch (const PersistenceError &e) {
        spdlog::error("Cannot open activity log: {}", e.what());
        return TIMETRACKER_EXIT_FAILURE;
    }

    const double threshold = m_Options.EffectiveThreshold();
    SessionBuilder builder(threshold, [this](const ActivityInterval &interval) {
        m_Store->Append(interval);
        ++m_Written;
    });

    const auto interval =
        std::chrono::milliseconds(std::llround(m_Options.interval * 1000.0));
    spdlog::info("Tracking every {}s into {} (inactivity threshold {}s)", m_Options.interval,
                 m_Store->Describe(), threshold);

    int rc = TIMETRACKER_EXIT_OK;
    try {
        m_Sampler.Run(
            interval, [&builder](const Sample &sample) { builder.Push(sample); }, shouldStop);
    } catch (const PersistenceError &e) {
        spdlog::error("Activity log write failed, stopping: {}", e.what());
        rc = TIMETRACKER_EXIT_FAILURE;
    }

    // The open interval is written even when sampling ended on an error.
    try {
        builder.Flush();
    } catch (const PersistenceError &e) {
        spdlog::error("Cannot write the last interval: {}", e.what());
        rc = TIMETRACKER_EXIT_FAILURE;
    }

    spdlog::info("Tracking stopped, {} interval(s) written ({} probe failures)", m_Written,
                 m_Sampler.GetProbeFailures());
    return rc;
}

// ─────────────────────────────────────
int RunTrackCommand(const TrackOptions &options) {
    Window window;

    InstallStopHandlers();
    Tracker tracker(options, window, OpenLogStore(options.logFile));
    return tracker.Run([]() { return g_StopSignal.load(); });
}
