#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "activity_key.hpp"
#include "common.hpp"

class CategoryResolver;

struct CategoryShare {
    std::string category;
    double seconds = 0.0;
    double percentage = 0.0;
    std::size_t intervals = 0;
};

struct AggregationResult {
    std::map<std::string, double> totalsByCategory;
    std::map<std::string, double> totalsByApp;
    std::map<std::string, std::size_t> intervalsByCategory;
    std::array<double, 24> hourlyDistribution{};
    std::map<std::string, double> dailyTotals; // "YYYY-MM-DD" local date
    std::vector<std::pair<std::string, double>> topApps;
    double totalDuration = 0.0;
    std::size_t consideredIntervals = 0;
    std::size_t skippedShortIntervals = 0;
    std::size_t unknownIntervals = 0; // categorized as UNKNOWN_CATEGORY

    std::vector<std::pair<std::string, double>> TopApps(std::size_t n) const;

    // Busiest hours first, ties by hour; empty hours are left out.
    std::vector<std::pair<int, double>> PeakHours(std::size_t n) const;

    std::vector<CategoryShare> CategoryShares() const;

    bool Empty() const {
        return consideredIntervals == 0;
    }
};

class Aggregator {
  public:
    explicit Aggregator(double minimumDuration = 0.0, ActivityKey key = AppNameKey);

    // Clips every interval to range, drops the ones shorter than the minimum duration and
    // buckets the rest by category, app, local hour and local day. Categories are looked up
    // by the activity key through the resolver, which may prompt; intervals categorized as
    // UNKNOWN_CATEGORY are left out.
    AggregationResult Summarize(const std::vector<ActivityInterval> &intervals,
                                CategoryResolver &resolver,
                                const DateRange &range = DateRange::All()) const;

    double GetMinimumDuration() const {
        return m_MinimumDuration;
    }

  private:
    static void AddHourly(AggregationResult &result, double start, double end);
    static void AddDaily(AggregationResult &result, double start, double end);

  private:
    double m_MinimumDuration;
    ActivityKey m_Key;
};
