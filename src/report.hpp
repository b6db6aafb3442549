#pragma once

#include <optional>
#include <string>

#include "aggregator.hpp"
#include "common.hpp"

// Shares below this percentage are folded into "Other" in the share chart
#define OTHER_SHARE_THRESHOLD 3.0
#define REPORT_TOP_APPS 5
#define REPORT_PEAK_HOURS 3
#define REPORT_BAR_WIDTH 40

enum ReportOutput { REPORT_BAR, REPORT_PIE, REPORT_BOTH };

std::optional<ReportOutput> ParseReportOutput(const std::string &name);

// Text rendering of an aggregation for the terminal.
class Reporter {
  public:
    explicit Reporter(ReportOutput output = REPORT_BOTH);

    std::string Render(const AggregationResult &result, const DateRange &range) const;

    std::string RenderCategoryTable(const AggregationResult &result) const;
    std::string RenderTopApps(const AggregationResult &result) const;
    std::string RenderPeakHours(const AggregationResult &result) const;
    std::string RenderBarChart(const AggregationResult &result) const;
    std::string RenderShareChart(const AggregationResult &result) const;

  private:
    ReportOutput m_Output;
};
