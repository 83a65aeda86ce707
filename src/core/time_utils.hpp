#pragma once

#include <string>

// Duration between two local ISO timestamps (YYYY-MM-DDTHH:MM:SS, any
// ".mmm" fraction ignored). An empty end_time means now.
// "2h35m", "14m22s", "8s"; "-" if start is empty, "?" on parse failure.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// "2026-01-15T20:13:00" -> "8:13pm". "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);

// Clock-style elapsed time: "0:00:05", "3:04:05", "1 day, 0:00:10", "2 days, 3:04:05".
// Negative input is clamped to zero.
std::string format_elapsed(long long seconds);
