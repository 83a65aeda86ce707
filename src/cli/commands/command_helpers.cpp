#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fmt/format.h>

std::vector<std::string> split_args(const std::string& args, bool keep_quotes) {
    std::vector<std::string> words;
    std::string current;
    bool in_quotes = false;
    bool have_word = false;

    for (char c : args) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_word = true;
            if (keep_quotes) current += c;
        } else if (!in_quotes && (c == ' ' || c == '\t')) {
            if (have_word) {
                words.push_back(current);
                current.clear();
                have_word = false;
            }
        } else {
            current += c;
            have_word = true;
        }
    }
    if (have_word) words.push_back(current);
    return words;
}

nlohmann::json parse_cli_value(const std::string& text) {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }

    std::string upper = to_upper(text);
    if (upper == "TRUE" || upper == "ON") return true;
    if (upper == "FALSE" || upper == "OFF") return false;
    if (upper == "NULL" || upper == "NONE") return nullptr;

    if (!text.empty()) {
        char* end = nullptr;
        long long i = std::strtoll(text.c_str(), &end, 10);
        if (end == text.c_str() + text.size()) return i;
        double d = std::strtod(text.c_str(), &end);
        if (end == text.c_str() + text.size()) return d;
    }
    return text;
}

Result<nlohmann::json> parse_kwargs(const std::vector<std::string>& words) {
    nlohmann::json kwargs = nlohmann::json::object();
    for (const auto& w : words) {
        auto eq = w.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result<nlohmann::json>::Err("Expected key=value, got '" + w + "'");
        }
        kwargs[w.substr(0, eq)] = parse_cli_value(w.substr(eq + 1));
    }
    return Result<nlohmann::json>::Ok(kwargs);
}

std::optional<TimePoint> parse_when(const std::string& text, TimePoint now) {
    if (text.empty()) return std::nullopt;
    if (text == "now") return now;

    if (text[0] == '+') {
        char* end = nullptr;
        double secs = std::strtod(text.c_str() + 1, &end);
        if (end != text.c_str() + text.size() || secs < 0) return std::nullopt;
        return now + std::chrono::duration_cast<Clock::duration>(
                         std::chrono::duration<double>(secs));
    }

    if (text.find('T') != std::string::npos) {
        TimePoint tp;
        if (parse_iso_ms(text, tp)) return tp;
        return std::nullopt;
    }

    int h = 0, m = 0, s = 0;
    char tail = 0;
    int n = std::sscanf(text.c_str(), "%d:%d:%d%c", &h, &m, &s, &tail);
    if (n < 2 || n > 3 || h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 59) {
        return std::nullopt;
    }

    std::time_t t = Clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    tm_buf.tm_hour = h;
    tm_buf.tm_min = m;
    tm_buf.tm_sec = n == 3 ? s : 0;
    tm_buf.tm_isdst = -1;
    TimePoint when = Clock::from_time_t(std::mktime(&tm_buf));
    if (when < now) {
        tm_buf.tm_mday += 1;
        tm_buf.tm_isdst = -1;
        when = Clock::from_time_t(std::mktime(&tm_buf));
    }
    return when;
}

void print_report(const ValidationReport& report) {
    for (const auto& e : report.errors) std::cout << theme::fail(e);
    for (const auto& w : report.warnings) std::cout << theme::warn(w);
}
