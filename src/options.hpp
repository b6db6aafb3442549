#pragma once

#include <optional>
#include <string>

#include "common.hpp"
#include "report.hpp"

struct TrackOptions {
    double interval = DEFAULT_LOG_INTERVAL;
    std::string logFile = DEFAULT_LOG_FILE;
    std::optional<double> inactivityThreshold; // default: interval * INACTIVITY_FACTOR
    LogLevel logLevel = LOG_INFO;
    std::string debugLog;
    bool help = false;

    double EffectiveThreshold() const;
};

struct AnalyzeOptions {
    std::string date = "today";
    ReportOutput output = REPORT_BOTH;
    std::string logFile = DEFAULT_LOG_FILE;
    std::string categoryFile = DEFAULT_CATEGORY_FILE;
    double minDuration = MIN_DURATION_THRESHOLD;
    bool strict = false;
    bool byApp = false; // key categories by app name instead of TitleActivityKey
    LogLevel logLevel = LOG_INFO;
    std::string debugLog;
    bool help = false;
};

// Both parsers accept "--name value" and "--name=value". On failure they return false and
// describe the problem in error.
bool ParseTrackOptions(int argc, char **argv, TrackOptions &opts, std::string &error);
bool ParseAnalyzeOptions(int argc, char **argv, AnalyzeOptions &opts, std::string &error);

std::string TrackUsage(const std::string &program);
std::string AnalyzeUsage(const std::string &program);
