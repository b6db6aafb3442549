#include "local_time.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#include "errors.hpp"

namespace {

// ─────────────────────────────────────
std::tm ToLocalTm(double epoch) {
    const std::time_t tt = static_cast<std::time_t>(std::floor(epoch));
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm;
}

// ─────────────────────────────────────
std::string Trim(const std::string &s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

// ─────────────────────────────────────
std::optional<double> ParseEpochNumber(const std::string &s) {
    if (s.empty()) {
        return std::nullopt;
    }
    const char first = s.front();
    if (!std::isdigit(static_cast<unsigned char>(first)) && first != '-' && first != '+' &&
        first != '.') {
        return std::nullopt;
    }
    char *end = nullptr;
    const double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ─────────────────────────────────────
std::optional<double> ParseIso8601(const std::string &s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &sep, &hour,
                    &minute, &second, &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != ' ') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60 || hour < 0 || minute < 0 || second < 0) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    double fraction = 0.0;
    if (pos < s.size() && s[pos] == '.') {
        std::size_t start = pos;
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            ++pos;
        }
        if (pos == start + 1) {
            return std::nullopt;
        }
        fraction = std::strtod(s.substr(start, pos - start).c_str(), nullptr);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    const std::string zone = s.substr(pos);
    if (zone.empty()) {
        tm.tm_isdst = -1;
        const std::time_t tt = std::mktime(&tm);
        if (tt == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return static_cast<double>(tt) + fraction;
    }

    int offset_seconds = 0;
    if (zone == "Z" || zone == "z") {
        offset_seconds = 0;
    } else if (zone[0] == '+' || zone[0] == '-') {
        int oh = 0, om = 0;
        int n = 0;
        const char *digits = zone.c_str() + 1;
        bool parsed = std::sscanf(digits, "%2d:%2d%n", &oh, &om, &n) == 2 &&
                      static_cast<std::size_t>(n) + 1 == zone.size();
        if (!parsed) {
            n = 0;
            parsed = std::sscanf(digits, "%2d%2d%n", &oh, &om, &n) == 2 &&
                     static_cast<std::size_t>(n) + 1 == zone.size();
        }
        if (!parsed || oh < 0 || om < 0 || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_seconds = (oh * 3600 + om * 60) * (zone[0] == '-' ? -1 : 1);
    } else {
        return std::nullopt;
    }

    const std::time_t utc = timegm(&tm);
    return static_cast<double>(utc) - offset_seconds + fraction;
}

} // namespace

// ─────────────────────────────────────
std::optional<double> LocalDateStart(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_isdst = -1;
    const std::time_t tt = std::mktime(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    // mktime normalises out-of-range days; reject them instead.
    if (tm.tm_year != year - 1900 || tm.tm_mon != month - 1 || tm.tm_mday != day) {
        return std::nullopt;
    }
    return static_cast<double>(tt);
}

// ─────────────────────────────────────
double LocalDayStart(double epoch) {
    const std::tm tm = ToLocalTm(epoch);
    auto start = LocalDateStart(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return start.value_or(std::floor(epoch) -
                          (tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec));
}

// ─────────────────────────────────────
double NextLocalDayStart(double epoch) {
    std::tm tm = ToLocalTm(epoch);
    tm.tm_mday += 1;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    const std::time_t tt = std::mktime(&tm);
    const double next = static_cast<double>(tt);
    if (tt == static_cast<std::time_t>(-1) || next <= epoch) {
        return LocalDayStart(epoch) + 86400.0;
    }
    return next;
}

// ─────────────────────────────────────
double NextLocalHourStart(double epoch) {
    // Step from the start of the current local hour; always strictly after epoch.
    const std::tm tm = ToLocalTm(epoch);
    return std::floor(epoch) - (tm.tm_min * 60 + tm.tm_sec) + 3600.0;
}

// ─────────────────────────────────────
int LocalHour(double epoch) {
    return ToLocalTm(epoch).tm_hour;
}

// ─────────────────────────────────────
std::string FormatLocalDate(double epoch) {
    const std::tm tm = ToLocalTm(epoch);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

// ─────────────────────────────────────
std::string FormatLocalDateTime(double epoch) {
    const std::tm tm = ToLocalTm(epoch);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// ─────────────────────────────────────
std::optional<double> ParseTimestamp(const std::string &text) {
    const std::string s = Trim(text);
    if (auto epoch = ParseEpochNumber(s); epoch.has_value()) {
        return epoch;
    }
    return ParseIso8601(s);
}

// ─────────────────────────────────────
static double ParseDayOrThrow(const std::string &text) {
    int year = 0, month = 0, day = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3 ||
        static_cast<std::size_t>(consumed) != text.size()) {
        throw RangeError("invalid date '" + text +
                         "', expected YYYY-MM-DD, 'today', 'yesterday' or a range A..B");
    }
    auto start = LocalDateStart(year, month, day);
    if (!start.has_value()) {
        throw RangeError("date '" + text + "' does not exist");
    }
    return *start;
}

// ─────────────────────────────────────
DateRange ParseDateRange(const std::string &text, double now) {
    std::string s = Trim(text);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s.empty() || s == "today") {
        const double start = LocalDayStart(now);
        return {start, NextLocalDayStart(start)};
    }
    if (s == "yesterday") {
        const double today = LocalDayStart(now);
        const double start = LocalDayStart(today - 1.0);
        return {start, today};
    }
    if (s == "all") {
        return DateRange::All();
    }

    if (auto pos = s.find(".."); pos != std::string::npos) {
        const double first = ParseDayOrThrow(Trim(s.substr(0, pos)));
        const double last = ParseDayOrThrow(Trim(s.substr(pos + 2)));
        if (last < first) {
            throw RangeError("range '" + text + "' ends before it starts");
        }
        return {first, NextLocalDayStart(last)};
    }

    const double start = ParseDayOrThrow(s);
    return {start, NextLocalDayStart(start)};
}

// ─────────────────────────────────────
std::string DescribeRange(const DateRange &range) {
    if (!std::isfinite(range.start) || !std::isfinite(range.end)) {
        return "all time";
    }
    const std::string first = FormatLocalDate(range.start);
    const std::string last = FormatLocalDate(range.end - 1.0);
    if (first == last) {
        return first;
    }
    return first + ".." + last;
}
