#pragma once

#include <limits>
#include <string>

#define DEFAULT_LOG_INTERVAL 10 // seconds
#define DEFAULT_LOG_FILE "activity_log.csv"
#define DEFAULT_CATEGORY_FILE "app_categories.json"
// Inactivity threshold is this factor times the poll interval unless given explicitly
#define INACTIVITY_FACTOR 1.5
// Intervals shorter than this are ignored by the analysis command
#define MIN_DURATION_THRESHOLD 5 // seconds

#define TIMETRACKER_EXIT_OK 0
#define TIMETRACKER_EXIT_FAILURE 1 // I/O failure or unresolved category
#define TIMETRACKER_EXIT_USAGE 2   // bad option or date range

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_OFF };

struct FocusedWindow {
    std::string app_id;
    std::string title;
    bool valid = false;
};

struct Sample {
    double timestamp = 0.0;
    std::string app;
    std::string title;

    bool IsIdle() const {
        return app.empty();
    }
};

struct ActivityInterval {
    double start = 0.0;
    double end = 0.0;
    std::string app;
    std::string title;

    double Duration() const {
        return end - start;
    }
};

inline bool operator==(const ActivityInterval &a, const ActivityInterval &b) {
    return a.start == b.start && a.end == b.end && a.app == b.app && a.title == b.title;
}

// Half-open [start, end) in epoch seconds.
struct DateRange {
    double start = -std::numeric_limits<double>::infinity();
    double end = std::numeric_limits<double>::infinity();

    static DateRange All() {
        return {};
    }

    bool IsBounded() const {
        return start != -std::numeric_limits<double>::infinity() ||
               end != std::numeric_limits<double>::infinity();
    }

    bool Overlaps(const ActivityInterval &interval) const {
        return interval.start < end && interval.end > start;
    }
};
