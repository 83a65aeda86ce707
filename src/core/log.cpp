#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

fs::path& log_dir_ref() {
    static fs::path dir = platform::temp_dir();
    return dir;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?    ";
}

} // namespace

void set_log_dir(const fs::path& dir) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_dir_ref() = dir;
}

fs::path log_dir() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_dir_ref();
}

std::string lab_log_path() {
    return (log_dir() / "mrilabs.log").string();
}

std::string job_log_path(const std::string& job_id) {
    return (log_dir() / "jobs" / (job_id + ".log")).string();
}

void lab_log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02}:{:02}:{:02}.{:03}] {} {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), level_name(level), msg);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::error_code ec;
    fs::create_directories(log_dir_ref(), ec);
    std::ofstream out((log_dir_ref() / "mrilabs.log").string(), std::ios::app);
    if (!out) return;
    out << line;
}

void append_job_log(const std::string& job_id, const std::string& msg) {
    std::string path = job_log_path(job_id);
    std::lock_guard<std::mutex> lock(log_mutex());
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}
