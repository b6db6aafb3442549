#pragma once

#include <optional>
#include <string>

#include "common.hpp"

// Wall-clock helpers on epoch seconds. Everything here follows the process time zone (TZ).

double LocalDayStart(double epoch);
double NextLocalDayStart(double epoch);
double NextLocalHourStart(double epoch);
int LocalHour(double epoch);

// Epoch seconds of local midnight for a calendar date; nullopt for dates like 2024-02-30.
std::optional<double> LocalDateStart(int year, int month, int day);

std::string FormatLocalDate(double epoch);
std::string FormatLocalDateTime(double epoch);

// Accepts epoch seconds ("1700000000", "1700000000.5") or ISO-8601
// ("2024-03-01T09:30:00", optional fraction, optional "Z" or "+HH:MM"). Local time when no
// offset is given.
std::optional<double> ParseTimestamp(const std::string &text);

// "today", "yesterday", "all", "YYYY-MM-DD" or "YYYY-MM-DD..YYYY-MM-DD" (both days
// included). Throws RangeError.
DateRange ParseDateRange(const std::string &text, double now);

std::string DescribeRange(const DateRange &range);
