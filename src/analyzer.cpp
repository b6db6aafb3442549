#include "analyzer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>

#include "aggregator.hpp"
#include "errors.hpp"
#include "local_time.hpp"
#include "log_store.hpp"
#include "report.hpp"
#include "sampler.hpp"

namespace {

// ─────────────────────────────────────
std::string NoDataMessage(const LogReadResult &log, const DateRange &range,
                          const std::string &source) {
    if (log.intervals.empty()) {
        return source + " contains no activity";
    }
    double first = std::numeric_limits<double>::infinity();
    double last = -std::numeric_limits<double>::infinity();
    for (const auto &interval : log.intervals) {
        first = std::min(first, interval.start);
        last = std::max(last, interval.end);
    }
    return fmt::format("no activity recorded for {}; {} covers {} to {}", DescribeRange(range),
                       source, FormatLocalDateTime(first), FormatLocalDateTime(last));
}

} // namespace

// ─────────────────────────────────────
std::string ConsoleCategoryPrompt(const std::string &app, const std::vector<std::string> &known) {
    if (!known.empty()) {
        std::string list;
        for (const auto &category : known) {
            list += list.empty() ? category : ", " + category;
        }
        fmt::print("Known categories: {}\n", list);
    }
    fmt::print("Category for '{}': ", app);
    std::fflush(stdout);

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        throw std::runtime_error("standard input closed");
    }
    return answer;
}

// ─────────────────────────────────────
Analyzer::Analyzer(const AnalyzeOptions &options, CategoryPrompt prompt)
    : m_Options(options), m_Prompt(std::move(prompt)) {}

// ─────────────────────────────────────
int Analyzer::Run(double now, std::string &report) {
    try {
        return Analyze(now, report);
    } catch (const RangeError &e) {
        spdlog::error("{}", e.what());
        return TIMETRACKER_EXIT_USAGE;
    } catch (const UnresolvedCategoryError &e) {
        spdlog::error("Cannot categorize '{}': {}", e.App(), e.what());
        return TIMETRACKER_EXIT_FAILURE;
    } catch (const PersistenceError &e) {
        spdlog::error("{}", e.what());
        return TIMETRACKER_EXIT_FAILURE;
    }
}

// ─────────────────────────────────────
int Analyzer::Analyze(double now, std::string &report) {
    const DateRange range = ParseDateRange(m_Options.date, now);

    auto store = OpenLogStore(m_Options.logFile);
    const LogReadResult log = store->ReadAll();

    LogReadResult selected = log;
    FilterAndSort(selected, range);
    if (selected.intervals.empty()) {
        throw RangeError(NoDataMessage(log, range, store->Describe()));
    }

    JsonCategoryStore categories(m_Options.categoryFile);
    CategoryResolver resolver(categories, m_Prompt, m_Options.strict);
    const ActivityKey key =
        m_Options.byApp ? ActivityKey(AppNameKey) : ActivityKey(TitleActivityKey);
    Aggregator aggregator(m_Options.minDuration, key);
    const AggregationResult result = aggregator.Summarize(selected.intervals, resolver, range);

    if (result.Empty()) {
        if (result.unknownIntervals > 0) {
            throw RangeError(fmt::format("no categorized activity for {}: {} interval(s) are "
                                         "shorter than {}s and {} are " UNKNOWN_CATEGORY,
                                         DescribeRange(range), result.skippedShortIntervals,
                                         m_Options.minDuration, result.unknownIntervals));
        }
        throw RangeError(fmt::format("all {} interval(s) for {} are shorter than {}s",
                                     result.skippedShortIntervals, DescribeRange(range),
                                     m_Options.minDuration));
    }

    std::string out = Reporter(m_Options.output).Render(result, range);
    auto it = std::back_inserter(out);
    if (log.skipped > 0) {
        fmt::format_to(it, "\nSkipped {} malformed record(s) in {}\n", log.skipped,
                       store->Describe());
    }
    if (result.skippedShortIntervals > 0) {
        fmt::format_to(it, "\nIgnored {} interval(s) shorter than {}s\n",
                       result.skippedShortIntervals, m_Options.minDuration);
    }
    if (result.unknownIntervals > 0) {
        fmt::format_to(it, "\nLeft out {} interval(s) categorized as " UNKNOWN_CATEGORY "\n",
                       result.unknownIntervals);
    }
    if (!resolver.IsDurable()) {
        spdlog::warn("{} category change(s) could not be saved to {}",
                     resolver.GetUnsavedChanges(), categories.Describe());
    }

    report = std::move(out);
    return TIMETRACKER_EXIT_OK;
}

// ─────────────────────────────────────
int RunAnalyzeCommand(const AnalyzeOptions &options) {
    Analyzer analyzer(options, ConsoleCategoryPrompt);
    std::string report;
    const int rc = analyzer.Run(SystemClockSeconds(), report);
    if (rc == TIMETRACKER_EXIT_OK) {
        fmt::print("{}", report);
    }
    return rc;
}
