#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cctype>
#include <algorithm>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string to_iso_ms(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        // pre-epoch values round toward zero; keep the fraction positive
        ms += std::chrono::milliseconds(1000);
        t -= 1;
    }
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms.count()));
    return std::string(out);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

bool parse_iso_ms(const std::string& iso, TimePoint& out) {
    struct tm tm_buf = {};
    int millis = 0;
    int n = sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d.%d",
                   &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                   &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &millis);
    if (n < 6) return false;
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    tm_buf.tm_isdst = -1;
    std::time_t t = mktime(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return false;
    out = Clock::from_time_t(t) + std::chrono::milliseconds(n == 7 ? millis : 0);
    return true;
}

double to_epoch(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

double now_epoch() {
    return to_epoch(Clock::now());
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}
