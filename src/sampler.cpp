#include "sampler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "errors.hpp"

// Upper bound on how long a stop predicate can go unchecked while waiting for a tick.
static constexpr std::chrono::milliseconds kStopCheckEvery{200};

// ─────────────────────────────────────
double SystemClockSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ─────────────────────────────────────
Sampler::Sampler(WindowProbe &probe) : m_Probe(probe), m_Clock(SystemClockSeconds) {}

// ─────────────────────────────────────
Sampler::Sampler(WindowProbe &probe, Clock clock) : m_Probe(probe), m_Clock(std::move(clock)) {}

// ─────────────────────────────────────
Sample Sampler::Poll() {
    Sample sample;
    sample.timestamp = m_Clock();

    try {
        FocusedWindow fw = m_Probe.GetFocusedWindow();
        if (m_FailureStreak > 0) {
            spdlog::info("Window probe recovered after {} failed polls", m_FailureStreak);
            m_FailureStreak = 0;
        }
        if (fw.valid) {
            sample.app = fw.app_id;
            sample.title = fw.title;
        }
    } catch (const std::exception &e) {
        ++m_ProbeFailures;
        ++m_FailureStreak;
        if (m_FailureStreak == 1) {
            spdlog::warn("Window probe failed, recording idle: {}", e.what());
        } else {
            spdlog::debug("Window probe failed ({} in a row): {}", m_FailureStreak, e.what());
        }
    }

    if (sample.IsIdle()) {
        spdlog::debug("Sample at {:.0f}: idle", sample.timestamp);
    } else {
        spdlog::debug("Sample at {:.0f}: {} - {}", sample.timestamp, sample.app, sample.title);
    }
    return sample;
}

// ─────────────────────────────────────
void Sampler::Run(std::chrono::milliseconds interval, const SampleCallback &onSample,
                  const StopPredicate &shouldStop) {
    auto next_tick = std::chrono::steady_clock::now();

    while (!StopRequested(shouldStop)) {
        onSample(Poll());

        next_tick += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            // Suspend or a slow probe: skip the missed ticks instead of bursting.
            next_tick = now;
        }
        if (!WaitForNextTick(next_tick, shouldStop)) {
            break;
        }
    }
    spdlog::debug("Sampler stopped");
}

// ─────────────────────────────────────
bool Sampler::WaitForNextTick(std::chrono::steady_clock::time_point deadline,
                              const StopPredicate &shouldStop) {
    while (true) {
        if (StopRequested(shouldStop)) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto slice = std::min(deadline, now + kStopCheckEvery);
        std::unique_lock<std::mutex> lk(m_Mutex);
        m_Cv.wait_until(lk, slice, [this] { return m_StopRequested.load(); });
    }
}

// ─────────────────────────────────────
bool Sampler::StopRequested(const StopPredicate &shouldStop) const {
    if (m_StopRequested.load()) {
        return true;
    }
    return shouldStop && shouldStop();
}

// ─────────────────────────────────────
void Sampler::RequestStop() {
    {
        std::lock_guard<std::mutex> lk(m_Mutex);
        m_StopRequested.store(true);
    }
    m_Cv.notify_all();
}

// ─────────────────────────────────────
std::size_t Sampler::GetProbeFailures() const {
    return m_ProbeFailures;
}
