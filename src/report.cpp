#include "report.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>

#include "local_time.hpp"

namespace {

// ─────────────────────────────────────
std::size_t NameWidth(const std::vector<CategoryShare> &shares, std::size_t minimum) {
    std::size_t width = minimum;
    for (const auto &share : shares) {
        width = std::max(width, share.category.size());
    }
    return width;
}

// ─────────────────────────────────────
std::string Bar(double fraction, int width) {
    const int n = static_cast<int>(std::lround(std::clamp(fraction, 0.0, 1.0) * width));
    return std::string(static_cast<std::size_t>(n), '#');
}

} // namespace

// ─────────────────────────────────────
std::optional<ReportOutput> ParseReportOutput(const std::string &name) {
    if (name == "bar") {
        return REPORT_BAR;
    }
    if (name == "pie") {
        return REPORT_PIE;
    }
    if (name == "both") {
        return REPORT_BOTH;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
Reporter::Reporter(ReportOutput output) : m_Output(output) {}

// ─────────────────────────────────────
std::string Reporter::Render(const AggregationResult &result, const DateRange &range) const {
    std::string out = fmt::format("Activity summary for {}\n\n", DescribeRange(range));
    out += RenderCategoryTable(result);
    out += "\n";
    out += RenderTopApps(result);
    out += "\n";
    out += RenderPeakHours(result);
    if (m_Output == REPORT_BAR || m_Output == REPORT_BOTH) {
        out += "\n";
        out += RenderBarChart(result);
    }
    if (m_Output == REPORT_PIE || m_Output == REPORT_BOTH) {
        out += "\n";
        out += RenderShareChart(result);
    }
    return out;
}

// ─────────────────────────────────────
std::string Reporter::RenderCategoryTable(const AggregationResult &result) const {
    const auto shares = result.CategoryShares();
    const std::size_t width = NameWidth(shares, 8);

    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "{:<{}}  {:>9}  {:>9}  {:>6}\n", "Category", width, "Minutes",
                   "Intervals", "Share");
    for (const auto &share : shares) {
        fmt::format_to(it, "{:<{}}  {:>9.1f}  {:>9}  {:>5.1f}%\n", share.category, width,
                       share.seconds / 60.0, share.intervals, share.percentage);
    }
    fmt::format_to(it, "{:<{}}  {:>9.1f}  {:>9}  {:>5.1f}%\n", "Total", width,
                   result.totalDuration / 60.0, result.consideredIntervals,
                   result.totalDuration > 0.0 ? 100.0 : 0.0);
    return out;
}

// ─────────────────────────────────────
std::string Reporter::RenderTopApps(const AggregationResult &result) const {
    const auto apps = result.TopApps(REPORT_TOP_APPS);
    std::size_t width = 0;
    for (const auto &[app, seconds] : apps) {
        width = std::max(width, app.size());
    }

    std::string out = fmt::format("Top {} applications\n", REPORT_TOP_APPS);
    auto it = std::back_inserter(out);
    std::size_t rank = 1;
    for (const auto &[app, seconds] : apps) {
        fmt::format_to(it, "{:>3}. {:<{}}  {:>8.1f} min\n", rank++, app, width, seconds / 60.0);
    }
    return out;
}

// ─────────────────────────────────────
std::string Reporter::RenderPeakHours(const AggregationResult &result) const {
    std::string out = fmt::format("Peak hours\n");
    auto it = std::back_inserter(out);
    for (const auto &[hour, seconds] : result.PeakHours(REPORT_PEAK_HOURS)) {
        fmt::format_to(it, "  {:02}:00 - {:02}:59  {:>8.1f} min\n", hour, hour, seconds / 60.0);
    }
    return out;
}

// ─────────────────────────────────────
std::string Reporter::RenderBarChart(const AggregationResult &result) const {
    const auto shares = result.CategoryShares();
    const std::size_t width = NameWidth(shares, 0);
    const double longest = shares.empty() ? 0.0 : shares.front().seconds;

    std::string out = "Minutes per category\n";
    auto it = std::back_inserter(out);
    for (const auto &share : shares) {
        const double fraction = longest > 0.0 ? share.seconds / longest : 0.0;
        fmt::format_to(it, "  {:<{}} |{:<{}}| {:.1f}\n", share.category, width,
                       Bar(fraction, REPORT_BAR_WIDTH), REPORT_BAR_WIDTH, share.seconds / 60.0);
    }
    return out;
}

// ─────────────────────────────────────
std::string Reporter::RenderShareChart(const AggregationResult &result) const {
    std::vector<CategoryShare> main;
    std::vector<CategoryShare> minor;
    for (auto &share : result.CategoryShares()) {
        if (share.percentage < OTHER_SHARE_THRESHOLD) {
            minor.push_back(std::move(share));
        } else {
            main.push_back(std::move(share));
        }
    }

    if (!minor.empty()) {
        CategoryShare other;
        other.category = "Other";
        for (const auto &share : minor) {
            other.seconds += share.seconds;
            other.percentage += share.percentage;
            other.intervals += share.intervals;
        }
        main.push_back(std::move(other));
    }

    const std::size_t width = NameWidth(main, 0);
    std::string out = "Share of time\n";
    auto it = std::back_inserter(out);
    for (const auto &share : main) {
        fmt::format_to(it, "  {:<{}} {:>5.1f}% {}\n", share.category, width, share.percentage,
                       Bar(share.percentage / 100.0, REPORT_BAR_WIDTH));
    }
    if (!minor.empty()) {
        fmt::format_to(it, "  Other:");
        for (const auto &share : minor) {
            fmt::format_to(it, " {} ({:.1f}%)", share.category, share.percentage);
        }
        fmt::format_to(it, "\n");
    }
    return out;
}
