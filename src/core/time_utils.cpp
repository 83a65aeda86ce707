#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <cctype>

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    std::time_t start_t = parse_iso_time(start_time);
    if (start_t == 0) return "?";

    std::time_t end_t = std::time(nullptr);
    if (!end_time.empty()) {
        end_t = parse_iso_time(end_time);
        if (end_t == 0) return "?";
    }

    long long seconds = static_cast<long long>(std::difftime(end_t, start_t));
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) return fmt::format("{}h{}m", hours, mins);
    if (mins > 0) return fmt::format("{}m{}s", mins, secs);
    return fmt::format("{}s", secs);
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    std::time_t t = parse_iso_time(iso_time);
    if (t == 0) return "?";

    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    // "08:13PM" -> "8:13pm"
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string format_elapsed(long long seconds) {
    if (seconds < 0) seconds = 0;
    long long days = seconds / 86400;
    long long rem = seconds % 86400;
    std::string clock = fmt::format("{}:{:02}:{:02}", rem / 3600, (rem % 3600) / 60, rem % 60);
    if (days == 0) return clock;
    return fmt::format("{} day{}, {}", days, days == 1 ? "" : "s", clock);
}
