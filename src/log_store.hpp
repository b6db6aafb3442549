#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "common.hpp"

struct LogReadResult {
    std::vector<ActivityInterval> intervals;
    std::size_t skipped = 0; // malformed records
};

// Append-only persistence of ActivityIntervals.
class LogStore {
  public:
    virtual ~LogStore() = default;

    // Creates the backing file if needed and verifies it can be appended to.
    // Throws PersistenceError.
    virtual void PrepareForAppend() = 0;

    // One atomic, durable record per call. Throws PersistenceError.
    virtual void Append(const ActivityInterval &interval) = 0;

    // Intervals overlapping range, ordered by start time. Malformed records are skipped and
    // counted. Throws PersistenceError when the log exists but cannot be read.
    virtual LogReadResult ReadAll(const DateRange &range = DateRange::All()) = 0;

    virtual std::string Describe() const = 0;
};

// SQLite for *.sqlite, *.sqlite3 and *.db paths, CSV otherwise.
std::unique_ptr<LogStore> OpenLogStore(const std::filesystem::path &path);

// Drops intervals outside range and orders the rest by start time (stable).
void FilterAndSort(LogReadResult &result, const DateRange &range);
