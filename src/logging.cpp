#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

// ─────────────────────────────────────
void SetupLogging(LogLevel log_level, const std::string &debug_log_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!debug_log_path.empty()) {
        try {
            sinks.push_back(
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(debug_log_path, false));
        } catch (const spdlog::spdlog_ex &e) {
            spdlog::warn("Cannot open log file {}: {}", debug_log_path, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("timetracker", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_WARN) {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
    spdlog::flush_on(spdlog::level::warn);
}

// ─────────────────────────────────────
std::optional<LogLevel> ParseLogLevel(const std::string &name) {
    if (name == "debug") {
        return LOG_DEBUG;
    }
    if (name == "info") {
        return LOG_INFO;
    }
    if (name == "warn" || name == "warning") {
        return LOG_WARN;
    }
    if (name == "off") {
        return LOG_OFF;
    }
    return std::nullopt;
}
