#include "file_lock.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <system_error>
#include <cerrno>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

LockTimeout::LockTimeout(const std::string& lock_path, std::chrono::milliseconds waited)
    : std::runtime_error(fmt::format("Timed out after {}ms waiting for lock {}",
                                     waited.count(), lock_path)),
      lock_path_(lock_path) {}

static bool try_lock(int fd) {
#ifdef _WIN32
    HANDLE h = (HANDLE)_get_osfhandle(fd);
    OVERLAPPED ov = {};
    return LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                      0, 1, 0, &ov) != 0;
#else
    while (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EINTR) return false;
    }
    return true;
#endif
}

static void close_fd(int fd) {
#ifdef _WIN32
    _close(fd);
#else
    close(fd);
#endif
}

FileLock::FileLock(const std::string& lock_path, std::chrono::milliseconds timeout) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

#ifdef _WIN32
    int fd = _open(lock_path.c_str(), _O_CREAT | _O_RDWR, 0644);
#else
    int fd = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
#endif
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "Cannot open lock file " + lock_path);
    }

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;
    while (!try_lock(fd)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            close_fd(fd);
            throw LockTimeout(lock_path,
                std::chrono::duration_cast<std::chrono::milliseconds>(now - start));
        }
        platform::sleep_ms(LOCK_RETRY_MS);
    }
    fd_ = fd;
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
    close_fd(fd_);
    // flock is released automatically when fd is closed
}
