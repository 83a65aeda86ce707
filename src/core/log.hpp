#pragma once

#include <string>
#include <filesystem>

enum class LogLevel { Debug, Info, Warn, Error };

// Redirect the debug log and per-job logs into `dir` (created on demand).
// Until called, logs go to the system temp directory.
void set_log_dir(const std::filesystem::path& dir);
std::filesystem::path log_dir();

// <log_dir>/mrilabs.log
std::string lab_log_path();

// Persistent job log path: <log_dir>/jobs/{job_id}.log
std::string job_log_path(const std::string& job_id);

// Append a "[HH:MM:SS.mmm] LEVEL message" line to the debug log.
void lab_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { lab_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { lab_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { lab_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { lab_log(LogLevel::Error, msg); }

// Append a timestamped line to a job's persistent log file.
void append_job_log(const std::string& job_id, const std::string& msg);
