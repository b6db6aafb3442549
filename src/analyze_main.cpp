#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

#include "analyzer.hpp"
#include "common.hpp"
#include "logging.hpp"
#include "options.hpp"

// ─────────────────────────────────────
int main(int argc, char **argv) {
    const std::string program = argc > 0 ? argv[0] : "timetracker-analyze";

    AnalyzeOptions options;
    std::string error;
    if (!ParseAnalyzeOptions(argc, argv, options, error)) {
        std::cerr << program << ": " << error << "\n\n" << AnalyzeUsage(program);
        return TIMETRACKER_EXIT_USAGE;
    }
    if (options.help) {
        std::cout << AnalyzeUsage(program);
        return TIMETRACKER_EXIT_OK;
    }

    SetupLogging(options.logLevel, options.debugLog);
    try {
        return RunAnalyzeCommand(options);
    } catch (const std::exception &e) {
        spdlog::error("Fatal: {}", e.what());
        return TIMETRACKER_EXIT_FAILURE;
    }
}
