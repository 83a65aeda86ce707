#pragma once

#include <string>
#include <chrono>
#include <ctime>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Format a time point as local ISO 8601 with milliseconds (YYYY-MM-DDTHH:MM:SS.mmm).
std::string to_iso_ms(TimePoint tp);

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Parse a local ISO 8601 timestamp with optional ".mmm" fraction.
// Returns false when the string is not a timestamp.
bool parse_iso_ms(const std::string& iso, TimePoint& out);

// Seconds since the Unix epoch as a double (sub-second precision).
double now_epoch();
double to_epoch(TimePoint tp);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// ASCII upper-casing for case-insensitive name matching.
std::string to_upper(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
