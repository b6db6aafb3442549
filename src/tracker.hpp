#pragma once

#include <cstddef>
#include <memory>

#include "log_store.hpp"
#include "options.hpp"
#include "sampler.hpp"
#include "window.hpp"

// Tracking mode: probe -> sampler -> session builder -> log store.
class Tracker {
  public:
    Tracker(const TrackOptions &options, WindowProbe &probe, std::unique_ptr<LogStore> store,
            Sampler::Clock clock = SystemClockSeconds);

    // Samples until shouldStop returns true or RequestStop is called, then closes the open
    // interval. Returns the process exit code.
    int Run(const Sampler::StopPredicate &shouldStop);

    void RequestStop();
    std::size_t GetWrittenIntervals() const;

  private:
    TrackOptions m_Options;
    std::unique_ptr<LogStore> m_Store;
    Sampler m_Sampler;
    std::size_t m_Written = 0;
};

// Entry point of timetracker-track: detects the compositor and stops on SIGINT/SIGTERM.
int RunTrackCommand(const TrackOptions &options);
