#pragma once

#include <string>

#include "category_resolver.hpp"
#include "options.hpp"

// Analysis mode: log store -> aggregator (with category resolver) -> reporter.
class Analyzer {
  public:
    Analyzer(const AnalyzeOptions &options, CategoryPrompt prompt);

    // Fills report only when the whole analysis succeeded. Returns the process exit code.
    int Run(double now, std::string &report);

  private:
    int Analyze(double now, std::string &report);

  private:
    AnalyzeOptions m_Options;
    CategoryPrompt m_Prompt;
};

// Interactive prompt on stdin/stdout. Throws when stdin is closed.
std::string ConsoleCategoryPrompt(const std::string &app, const std::vector<std::string> &known);

// Entry point of timetracker-analyze.
int RunAnalyzeCommand(const AnalyzeOptions &options);
