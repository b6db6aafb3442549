#include "aggregator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "category_resolver.hpp"
#include "local_time.hpp"

// ─────────────────────────────────────
std::vector<std::pair<std::string, double>> AggregationResult::TopApps(std::size_t n) const {
    std::vector<std::pair<std::string, double>> out(
        topApps.begin(), topApps.begin() + static_cast<std::ptrdiff_t>(std::min(n, topApps.size())));
    return out;
}

// ─────────────────────────────────────
std::vector<std::pair<int, double>> AggregationResult::PeakHours(std::size_t n) const {
    std::vector<std::pair<int, double>> hours;
    for (int h = 0; h < 24; ++h) {
        if (hourlyDistribution[h] > 0.0) {
            hours.emplace_back(h, hourlyDistribution[h]);
        }
    }
    std::stable_sort(hours.begin(), hours.end(),
                     [](const auto &a, const auto &b) { return a.second > b.second; });
    if (hours.size() > n) {
        hours.resize(n);
    }
    return hours;
}

// ─────────────────────────────────────
std::vector<CategoryShare> AggregationResult::CategoryShares() const {
    std::vector<CategoryShare> shares;
    for (const auto &[category, seconds] : totalsByCategory) {
        CategoryShare share;
        share.category = category;
        share.seconds = seconds;
        share.percentage = totalDuration > 0.0 ? seconds / totalDuration * 100.0 : 0.0;
        auto it = intervalsByCategory.find(category);
        share.intervals = it != intervalsByCategory.end() ? it->second : 0;
        shares.push_back(std::move(share));
    }
    // map order is by name, so a stable sort leaves ties alphabetical
    std::stable_sort(shares.begin(), shares.end(),
                     [](const CategoryShare &a, const CategoryShare &b) {
                         return a.seconds > b.seconds;
                     });
    return shares;
}

// ─────────────────────────────────────
Aggregator::Aggregator(double minimumDuration, ActivityKey key)
    : m_MinimumDuration(std::max(0.0, minimumDuration)), m_Key(std::move(key)) {
    if (!m_Key) {
        m_Key = AppNameKey;
    }
}

// ─────────────────────────────────────
void Aggregator::AddHourly(AggregationResult &result, double start, double end) {
    double t = start;
    while (t < end) {
        const double next = std::min(NextLocalHourStart(t), end);
        result.hourlyDistribution[LocalHour(t)] += next - t;
        t = next;
    }
}

// ─────────────────────────────────────
void Aggregator::AddDaily(AggregationResult &result, double start, double end) {
    double t = start;
    while (t < end) {
        const double next = std::min(NextLocalDayStart(t), end);
        result.dailyTotals[FormatLocalDate(t)] += next - t;
        t = next;
    }
}

// ─────────────────────────────────────
AggregationResult Aggregator::Summarize(const std::vector<ActivityInterval> &intervals,
                                        CategoryResolver &resolver,
                                        const DateRange &range) const {
    AggregationResult result;

    for (const auto &interval : intervals) {
        if (!range.Overlaps(interval)) {
            continue;
        }
        const double start = std::max(interval.start, range.start);
        const double end = std::min(interval.end, range.end);
        const double duration = end - start;
        if (duration <= 0.0) {
            continue;
        }
        if (duration < m_MinimumDuration) {
            ++result.skippedShortIntervals;
            continue;
        }

        const std::string category = resolver.Resolve(m_Key(interval));
        if (category == UNKNOWN_CATEGORY) {
            ++result.unknownIntervals;
            continue;
        }

        result.totalsByCategory[category] += duration;
        result.intervalsByCategory[category] += 1;
        result.totalsByApp[interval.app] += duration;
        result.totalDuration += duration;
        ++result.consideredIntervals;

        AddHourly(result, start, end);
        AddDaily(result, start, end);
    }

    result.topApps.assign(result.totalsByApp.begin(), result.totalsByApp.end());
    std::stable_sort(result.topApps.begin(), result.topApps.end(),
                     [](const auto &a, const auto &b) { return a.second > b.second; });

    spdlog::debug("Aggregated {} interval(s) into {} categories, {} skipped as too short, {} "
                  "left out as " UNKNOWN_CATEGORY,
                  result.consideredIntervals, result.totalsByCategory.size(),
                  result.skippedShortIntervals, result.unknownIntervals);
    return result;
}
