#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "options.hpp"

namespace {

// Owns argv storage for the parsers.
class Argv {
  public:
    Argv(std::initializer_list<std::string> args) : m_Args(args) {
        m_Args.insert(m_Args.begin(), "prog");
        for (auto &arg : m_Args) {
            m_Ptrs.push_back(arg.data());
        }
        m_Ptrs.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(m_Args.size());
    }
    char **argv() {
        return m_Ptrs.data();
    }

  private:
    std::vector<std::string> m_Args;
    std::vector<char *> m_Ptrs;
};

} // namespace

TEST(TrackOptions, Defaults) {
    Argv args({});
    TrackOptions opts;
    std::string error;
    ASSERT_TRUE(ParseTrackOptions(args.argc(), args.argv(), opts, error)) << error;
    EXPECT_DOUBLE_EQ(opts.interval, DEFAULT_LOG_INTERVAL);
    EXPECT_EQ(opts.logFile, DEFAULT_LOG_FILE);
    EXPECT_FALSE(opts.inactivityThreshold.has_value());
    EXPECT_DOUBLE_EQ(opts.EffectiveThreshold(), DEFAULT_LOG_INTERVAL * INACTIVITY_FACTOR);
    EXPECT_EQ(opts.logLevel, LOG_INFO);
    EXPECT_FALSE(opts.help);
}

TEST(TrackOptions, ParsesAllForms) {
    Argv args({"-i", "2.5", "--log-file=/tmp/x.sqlite", "--inactivity-threshold", "30",
               "--log-level", "debug", "--debug-log=/tmp/tt.log"});
    TrackOptions opts;
    std::string error;
    ASSERT_TRUE(ParseTrackOptions(args.argc(), args.argv(), opts, error)) << error;
    EXPECT_DOUBLE_EQ(opts.interval, 2.5);
    EXPECT_EQ(opts.logFile, "/tmp/x.sqlite");
    EXPECT_DOUBLE_EQ(opts.EffectiveThreshold(), 30.0);
    EXPECT_EQ(opts.logLevel, LOG_DEBUG);
    EXPECT_EQ(opts.debugLog, "/tmp/tt.log");
}

TEST(TrackOptions, ThresholdFollowsInterval) {
    Argv args({"--interval=4"});
    TrackOptions opts;
    std::string error;
    ASSERT_TRUE(ParseTrackOptions(args.argc(), args.argv(), opts, error)) << error;
    EXPECT_DOUBLE_EQ(opts.EffectiveThreshold(), 6.0);
}

TEST(TrackOptions, RejectsBadInput) {
    const std::vector<std::vector<std::string>> cases = {
        {"--interval", "0"},    {"--interval", "-3"},     {"--interval", "ten"},
        {"--interval"},         {"--bogus"},              {"--log-level", "loud"},
        {"--log-file="},        {"--help=yes"},           {"--inactivity-threshold", "0"},
    };
    for (const auto &c : cases) {
        std::vector<std::string> storage = c;
        storage.insert(storage.begin(), "prog");
        std::vector<char *> ptrs;
        for (auto &s : storage) {
            ptrs.push_back(s.data());
        }
        TrackOptions opts;
        std::string error;
        EXPECT_FALSE(ParseTrackOptions(static_cast<int>(ptrs.size()), ptrs.data(), opts, error))
            << c.front();
        EXPECT_FALSE(error.empty());
    }
}

TEST(AnalyzeOptions, Defaults) {
    Argv args({});
    AnalyzeOptions opts;
    std::string error;
    ASSERT_TRUE(ParseAnalyzeOptions(args.argc(), args.argv(), opts, error)) << error;
    EXPECT_EQ(opts.date, "today");
    EXPECT_EQ(opts.output, REPORT_BOTH);
    EXPECT_EQ(opts.logFile, DEFAULT_LOG_FILE);
    EXPECT_EQ(opts.categoryFile, DEFAULT_CATEGORY_FILE);
    EXPECT_DOUBLE_EQ(opts.minDuration, MIN_DURATION_THRESHOLD);
    EXPECT_FALSE(opts.strict);
    EXPECT_FALSE(opts.byApp);
}

TEST(AnalyzeOptions, ParsesAllForms) {
    Argv args({"-d", "2024-03-01..2024-03-07", "-o", "pie", "-l", "log.csv", "--category-file",
               "cats.json", "--min-duration=0", "--strict", "--by-app", "--log-level=off", "-h"});
    AnalyzeOptions opts;
    std::string error;
    ASSERT_TRUE(ParseAnalyzeOptions(args.argc(), args.argv(), opts, error)) << error;
    EXPECT_EQ(opts.date, "2024-03-01..2024-03-07");
    EXPECT_EQ(opts.output, REPORT_PIE);
    EXPECT_EQ(opts.logFile, "log.csv");
    EXPECT_EQ(opts.categoryFile, "cats.json");
    EXPECT_DOUBLE_EQ(opts.minDuration, 0.0);
    EXPECT_TRUE(opts.strict);
    EXPECT_TRUE(opts.byApp);
    EXPECT_EQ(opts.logLevel, LOG_OFF);
    EXPECT_TRUE(opts.help);
}

TEST(AnalyzeOptions, RejectsBadInput) {
    Argv bad_output({"--output", "donut"});
    AnalyzeOptions opts;
    std::string error;
    EXPECT_FALSE(ParseAnalyzeOptions(bad_output.argc(), bad_output.argv(), opts, error));
    EXPECT_NE(error.find("donut"), std::string::npos);

    Argv bad_duration({"--min-duration", "-1"});
    EXPECT_FALSE(ParseAnalyzeOptions(bad_duration.argc(), bad_duration.argv(), opts, error));

    Argv missing({"-c"});
    EXPECT_FALSE(ParseAnalyzeOptions(missing.argc(), missing.argv(), opts, error));

    Argv flag_value({"--strict=1"});
    EXPECT_FALSE(ParseAnalyzeOptions(flag_value.argc(), flag_value.argv(), opts, error));
}

TEST(Usage, MentionsEveryOption) {
    const std::string track = TrackUsage("timetracker-track");
    for (const char *opt : {"--interval", "--log-file", "--inactivity-threshold", "--log-level",
                            "--debug-log", "--help"}) {
        EXPECT_NE(track.find(opt), std::string::npos) << opt;
    }
    const std::string analyze = AnalyzeUsage("timetracker-analyze");
    for (const char *opt : {"--date", "--output", "--log-file", "--category-file",
                            "--min-duration", "--strict", "--by-app", "--log-level", "--debug-log"}) {
        EXPECT_NE(analyze.find(opt), std::string::npos) << opt;
    }
}
