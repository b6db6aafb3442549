#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

#include "common.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "tracker.hpp"

// ─────────────────────────────────────
int main(int argc, char **argv) {
    const std::string program = argc > 0 ? argv[0] : "timetracker-track";

    TrackOptions options;
    std::string error;
    if (!ParseTrackOptions(argc, argv, options, error)) {
        std::cerr << program << ": " << error << "\n\n" << TrackUsage(program);
        return TIMETRACKER_EXIT_USAGE;
    }
    if (options.help) {
        std::cout << TrackUsage(program);
        return TIMETRACKER_EXIT_OK;
    }

    SetupLogging(options.logLevel, options.debugLog);
    try {
        return RunTrackCommand(options);
    } catch (const std::exception &e) {
        spdlog::error("Fatal: {}", e.what());
        return TIMETRACKER_EXIT_FAILURE;
    }
}
