#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#include "common.hpp"

// Turns the sample stream into closed ActivityIntervals. Consecutive samples of the same
// (app, title) extend one interval; a window change, an idle sample or a gap longer than
// the inactivity threshold closes it at the last sample time seen before the break.
class SessionBuilder {
  public:
    using IntervalCallback = std::function<void(const ActivityInterval &)>;

    SessionBuilder(double inactivityThreshold, IntervalCallback onInterval);

    void Push(const Sample &sample);

    // Closes the open interval, if any, at the last sample time.
    void Flush();

    bool HasOpenInterval() const;
    std::optional<ActivityInterval> GetOpenInterval() const;
    double GetInactivityThreshold() const;
    std::size_t GetEmittedCount() const;

    static double DefaultThreshold(double pollIntervalSeconds);

  private:
    void CloseOpenInterval(const char *reasonForLog);

  private:
    double m_InactivityThreshold;
    IntervalCallback m_OnInterval;

    std::optional<ActivityInterval> m_Open;
    std::optional<double> m_LastSampleTime;
    std::size_t m_Emitted = 0;
};
