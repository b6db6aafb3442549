#include "options.hpp"

#include <cmath>
#include <cstdlib>
#include <vector>

#include "activity_key.hpp"
#include "logging.hpp"
#include "session_builder.hpp"

namespace {

// ─────────────────────────────────────
std::optional<double> ParsePositiveSeconds(const std::string &text, bool allowZero) {
    if (text.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    if (value < 0.0 || (!allowZero && value == 0.0)) {
        return std::nullopt;
    }
    return value;
}

// Walks argv, splitting "--name=value" and fetching the value of options that take one.
class ArgCursor {
  public:
    ArgCursor(int argc, char **argv) {
        for (int i = 1; i < argc; ++i) {
            m_Args.emplace_back(argv[i]);
        }
    }

    bool Next() {
        if (m_Pos >= m_Args.size()) {
            return false;
        }
        const std::string &arg = m_Args[m_Pos++];
        m_Inline.reset();
        m_Name = arg;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                m_Name = arg.substr(0, eq);
                m_Inline = arg.substr(eq + 1);
            }
        }
        return true;
    }

    const std::string &Name() const {
        return m_Name;
    }

    bool Value(std::string &value, std::string &error) {
        if (m_Inline.has_value()) {
            value = *m_Inline;
            return true;
        }
        if (m_Pos >= m_Args.size()) {
            error = "option " + m_Name + " requires a value";
            return false;
        }
        value = m_Args[m_Pos++];
        return true;
    }

    bool HasInlineValue() const {
        return m_Inline.has_value();
    }

  private:
    std::vector<std::string> m_Args;
    std::size_t m_Pos = 0;
    std::string m_Name;
    std::optional<std::string> m_Inline;
};

// ─────────────────────────────────────
bool ParseCommonOption(ArgCursor &args, LogLevel &level, std::string &debugLog, bool &handled,
                       std::string &error) {
    handled = true;
    std::string value;
    if (args.Name() == "--log-level") {
        if (!args.Value(value, error)) {
            return false;
        }
        auto parsed = ParseLogLevel(value);
        if (!parsed.has_value()) {
            error = "invalid log level '" + value + "', expected debug, info, warn or off";
            return false;
        }
        level = *parsed;
        return true;
    }
    if (args.Name() == "--debug-log") {
        if (!args.Value(value, error)) {
            return false;
        }
        debugLog = value;
        return true;
    }
    handled = false;
    return true;
}

// ─────────────────────────────────────
bool NoInlineValue(const ArgCursor &args, std::string &error) {
    if (args.HasInlineValue()) {
        error = "option " + args.Name() + " does not take a value";
        return false;
    }
    return true;
}

} // namespace

// ─────────────────────────────────────
double TrackOptions::EffectiveThreshold() const {
    return inactivityThreshold.value_or(SessionBuilder::DefaultThreshold(interval));
}

// ─────────────────────────────────────
bool ParseTrackOptions(int argc, char **argv, TrackOptions &opts, std::string &error) {
    ArgCursor args(argc, argv);
    std::string value;

    while (args.Next()) {
        const std::string &name = args.Name();
        bool handled = false;
        if (!ParseCommonOption(args, opts.logLevel, opts.debugLog, handled, error)) {
            return false;
        }
        if (handled) {
            continue;
        }

        if (name == "--help" || name == "-h") {
            if (!NoInlineValue(args, error)) {
                return false;
            }
            opts.help = true;
        } else if (name == "--interval" || name == "-i") {
            if (!args.Value(value, error)) {
                return false;
            }
            auto seconds = ParsePositiveSeconds(value, false);
            if (!seconds.has_value()) {
                error = "invalid interval '" + value + "', expected a positive number of seconds";
                return false;
            }
            opts.interval = *seconds;
        } else if (name == "--log-file" || name == "-l") {
            if (!args.Value(value, error)) {
                return false;
            }
            if (value.empty()) {
                error = "log file path must not be empty";
                return false;
            }
            opts.logFile = value;
        } else if (name == "--inactivity-threshold") {
            if (!args.Value(value, error)) {
                return false;
            }
            auto seconds = ParsePositiveSeconds(value, false);
            if (!seconds.has_value()) {
                error = "invalid inactivity threshold '" + value +
                        "', expected a positive number of seconds";
                return false;
            }
            opts.inactivityThreshold = *seconds;
        } else {
            error = "unknown option '" + name + "'";
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
bool ParseAnalyzeOptions(int argc, char **argv, AnalyzeOptions &opts, std::string &error) {
    ArgCursor args(argc, argv);
    std::string value;

    while (args.Next()) {
        const std::string &name = args.Name();
        bool handled = false;
        if (!ParseCommonOption(args, opts.logLevel, opts.debugLog, handled, error)) {
            return false;
        }
        if (handled) {
            continue;
        }

        if (name == "--help" || name == "-h") {
            if (!NoInlineValue(args, error)) {
                return false;
            }
            opts.help = true;
        } else if (name == "--strict") {
            if (!NoInlineValue(args, error)) {
                return false;
            }
            opts.strict = true;
        } else if (name == "--by-app") {
            if (!NoInlineValue(args, error)) {
                return false;
            }
            opts.byApp = true;
        } else if (name == "--date" || name == "-d") {
            if (!args.Value(value, error)) {
                return false;
            }
            opts.date = value;
        } else if (name == "--output" || name == "-o") {
            if (!args.Value(value, error)) {
                return false;
            }
            auto output = ParseReportOutput(value);
            if (!output.has_value()) {
                error = "invalid output '" + value + "', expected bar, pie or both";
                return false;
            }
            opts.output = *output;
        } else if (name == "--log-file" || name == "-l") {
            if (!args.Value(value, error)) {
                return false;
            }
            if (value.empty()) {
                error = "log file path must not be empty";
                return false;
            }
            opts.logFile = value;
        } else if (name == "--category-file" || name == "-c") {
            if (!args.Value(value, error)) {
                return false;
            }
            if (value.empty()) {
                error = "category file path must not be empty";
                return false;
            }
            opts.categoryFile = value;
        } else if (name == "--min-duration") {
            if (!args.Value(value, error)) {
                return false;
            }
            auto seconds = ParsePositiveSeconds(value, true);
            if (!seconds.has_value()) {
                error = "invalid minimum duration '" + value +
                        "', expected a non-negative number of seconds";
                return false;
            }
            opts.minDuration = *seconds;
        } else {
            error = "unknown option '" + name + "'";
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
std::string TrackUsage(const std::string &program) {
    return "Usage: " + program +
           " [options]\n"
           "Records which window has focus into an activity log.\n\n"
           "Options:\n"
           "  -i, --interval <seconds>          Poll interval (default " +
           std::to_string(DEFAULT_LOG_INTERVAL) +
           ")\n"
           "  -l, --log-file <path>             Activity log, CSV or .sqlite/.db (default " +
           DEFAULT_LOG_FILE +
           ")\n"
           "      --inactivity-threshold <sec>  Gap that ends a session (default 1.5 x "
           "interval)\n"
           "      --log-level <level>           debug, info, warn or off (default info)\n"
           "      --debug-log <path>            Also write diagnostics to this file\n"
           "  -h, --help                        Show this help\n";
}

// ─────────────────────────────────────
std::string AnalyzeUsage(const std::string &program) {
    return "Usage: " + program +
           " [options]\n"
           "Summarizes an activity log by category, application and hour.\n"
           "Activities answered with the category '" UNKNOWN_CATEGORY "' are left out.\n\n"
           "Options:\n"
           "  -d, --date <range>            today, yesterday, all, YYYY-MM-DD or\n"
           "                                YYYY-MM-DD..YYYY-MM-DD (default today)\n"
           "  -o, --output <kind>           bar, pie or both (default both)\n"
           "  -l, --log-file <path>         Activity log (default " DEFAULT_LOG_FILE ")\n"
           "  -c, --category-file <path>    Activity to category mapping (default " DEFAULT_CATEGORY_FILE
           ")\n"
           "      --min-duration <seconds>  Ignore shorter intervals (default " +
           std::to_string(MIN_DURATION_THRESHOLD) +
           ")\n"
           "      --strict                  Fail if the category file cannot be written\n"
           "      --by-app                  Categorize by application only, not by site or\n"
           "                                file taken from the window title\n"
           "      --log-level <level>       debug, info, warn or off (default info)\n"
           "      --debug-log <path>        Also write diagnostics to this file\n"
           "  -h, --help                    Show this help\n";
}
