#pragma once

#include <optional>
#include <string>

#include "common.hpp"

// Installs the default spdlog logger: colour stderr sink plus an optional file sink.
void SetupLogging(LogLevel log_level, const std::string &debug_log_path = "");

std::optional<LogLevel> ParseLogLevel(const std::string &name);
