#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace aegis {

using Clock = std::chrono::system_clock;

std::tm to_utc_tm(Clock::time_point tp);

std::string format_utc(Clock::time_point tp, const char* fmt);

// "YYYY-MM-DD HH:MM:SS", the event log's timestamp column.
std::string log_timestamp(Clock::time_point tp);

// "YYYY-MM-DD"
std::string utc_date(Clock::time_point tp);

// ISO-8601 with microseconds, sortable as plain text.
std::string iso_timestamp(Clock::time_point tp);

std::optional<Clock::time_point> parse_log_timestamp(const std::string& s);

// Monday = 0 ... Sunday = 6
int weekday_index(const std::tm& tm);

}  // namespace aegis
