#pragma once
#include <string>
#include <chrono>
#include <stdexcept>

// Raised when a lock file stays held by someone else past the bounded wait.
// Retryable: the caller may try the whole operation again.
class LockTimeout : public std::runtime_error {
public:
    LockTimeout(const std::string& lock_path, std::chrono::milliseconds waited);

    const std::string& lock_path() const { return lock_path_; }

private:
    std::string lock_path_;
};

// RAII exclusive lock on a sibling lock file.
// Uses flock() on Unix, LockFileEx() on Windows, polled until `timeout` elapses.
// Each instance opens its own descriptor, so two FileLocks on the same path
// exclude each other across threads as well as across processes.
// Lock is automatically released when the process exits (even on crash).
class FileLock {
public:
    // Blocks until the lock is held; throws LockTimeout past `timeout`.
    FileLock(const std::string& lock_path, std::chrono::milliseconds timeout);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
