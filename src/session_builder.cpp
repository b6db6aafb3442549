#include "session_builder.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

// ─────────────────────────────────────
SessionBuilder::SessionBuilder(double inactivityThreshold, IntervalCallback onInterval)
    : m_InactivityThreshold(inactivityThreshold), m_OnInterval(std::move(onInterval)) {
    if (!(m_InactivityThreshold > 0.0)) {
        throw std::invalid_argument("inactivity threshold must be positive");
    }
}

// ─────────────────────────────────────
double SessionBuilder::DefaultThreshold(double pollIntervalSeconds) {
    return pollIntervalSeconds * INACTIVITY_FACTOR;
}

// ─────────────────────────────────────
void SessionBuilder::Push(const Sample &sample) {
    const double now = sample.timestamp;

    if (m_Open.has_value()) {
        const double gap = now - *m_LastSampleTime;
        const bool same_window = sample.app == m_Open->app && sample.title == m_Open->title;

        if (gap < 0.0) {
            spdlog::warn("Clock went backwards by {:.1f}s, closing current interval", -gap);
            CloseOpenInterval("clock");
        } else if (sample.IsIdle()) {
            CloseOpenInterval("idle");
        } else if (gap > m_InactivityThreshold) {
            spdlog::debug("Gap of {:.1f}s exceeds inactivity threshold {:.1f}s", gap,
                          m_InactivityThreshold);
            CloseOpenInterval("gap");
        } else if (!same_window) {
            CloseOpenInterval("changed");
        } else {
            m_Open->end = now;
        }
    }

    m_LastSampleTime = now;

    if (!m_Open.has_value() && !sample.IsIdle()) {
        m_Open = ActivityInterval{now, now, sample.app, sample.title};
        spdlog::debug("Interval opened: app='{}', title='{}'", sample.app, sample.title);
    }
}

// ─────────────────────────────────────
void SessionBuilder::Flush() {
    CloseOpenInterval("flush");
}

// ─────────────────────────────────────
void SessionBuilder::CloseOpenInterval(const char *reasonForLog) {
    if (!m_Open.has_value()) {
        return;
    }

    // Take ownership first so a throwing callback cannot emit the same interval twice.
    ActivityInterval interval = std::move(*m_Open);
    m_Open.reset();
    interval.end = *m_LastSampleTime;

    if (interval.Duration() <= 0.0) {
        spdlog::debug("Dropping zero-length interval ({}): app='{}', title='{}'", reasonForLog,
                      interval.app, interval.title);
        return;
    }

    spdlog::info("Interval closed ({}): app='{}', title='{}', duration={:.0f}s", reasonForLog,
                 interval.app, interval.title, interval.Duration());
    ++m_Emitted;
    m_OnInterval(interval);
}

// ─────────────────────────────────────
bool SessionBuilder::HasOpenInterval() const {
    return m_Open.has_value();
}

// ─────────────────────────────────────
std::optional<ActivityInterval> SessionBuilder::GetOpenInterval() const {
    return m_Open;
}

// ─────────────────────────────────────
double SessionBuilder::GetInactivityThreshold() const {
    return m_InactivityThreshold;
}

// ─────────────────────────────────────
std::size_t SessionBuilder::GetEmittedCount() const {
    return m_Emitted;
}
