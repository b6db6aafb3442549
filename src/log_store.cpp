#include "log_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "csv_log_store.hpp"
#include "sqlite_log_store.hpp"

// ─────────────────────────────────────
std::unique_ptr<LogStore> OpenLogStore(const std::filesystem::path &path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".sqlite" || ext == ".sqlite3" || ext == ".db") {
        spdlog::debug("Using SQLite activity log: {}", path.string());
        return std::make_unique<SQLiteLogStore>(path);
    }
    spdlog::debug("Using CSV activity log: {}", path.string());
    return std::make_unique<CsvLogStore>(path);
}

// ─────────────────────────────────────
void FilterAndSort(LogReadResult &result, const DateRange &range) {
    auto &rows = result.intervals;
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&range](const ActivityInterval &i) { return !range.Overlaps(i); }),
               rows.end());
    std::stable_sort(rows.begin(), rows.end(),
                     [](const ActivityInterval &a, const ActivityInterval &b) {
                         return a.start < b.start;
                     });
}
