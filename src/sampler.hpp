#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

#include "common.hpp"
#include "window.hpp"

// Polls a WindowProbe at a fixed interval and emits one Sample per tick.
class Sampler {
  public:
    using SampleCallback = std::function<void(const Sample &)>;
    using StopPredicate = std::function<bool()>;
    using Clock = std::function<double()>;

    explicit Sampler(WindowProbe &probe);
    Sampler(WindowProbe &probe, Clock clock);

    // Blocks until shouldStop returns true or RequestStop is called. Exceptions thrown by
    // onSample propagate; probe failures never do.
    void Run(std::chrono::milliseconds interval, const SampleCallback &onSample,
             const StopPredicate &shouldStop);

    // Safe to call from another thread.
    void RequestStop();

    Sample Poll();
    std::size_t GetProbeFailures() const;

  private:
    bool WaitForNextTick(std::chrono::steady_clock::time_point deadline,
                         const StopPredicate &shouldStop);
    bool StopRequested(const StopPredicate &shouldStop) const;

  private:
    WindowProbe &m_Probe;
    Clock m_Clock;

    std::atomic<bool> m_StopRequested{false};
    std::mutex m_Mutex;
    std::condition_variable m_Cv;

    std::size_t m_ProbeFailures = 0;
    std::size_t m_FailureStreak = 0;
};

double SystemClockSeconds();
