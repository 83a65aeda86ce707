#include <gtest/gtest.h>
#include <platform/file_lock.hpp>
#include <thread>
#include <atomic>
#include "test_helpers.hpp"

using namespace std::chrono_literals;

TEST(FileLock, CreatesLockFileAndParents) {
    TempDir dir;
    auto path = (dir / "nested/dir/jobs.lock").string();
    {
        FileLock lock(path, 100ms);
        EXPECT_TRUE(lock.held());
    }
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(FileLock, SecondHolderTimesOut) {
    TempDir dir;
    auto path = (dir / "state.lock").string();
    FileLock first(path, 100ms);

    try {
        FileLock second(path, 80ms);
        FAIL() << "second lock should not be granted";
    } catch (const LockTimeout& e) {
        EXPECT_EQ(e.lock_path(), path);
        EXPECT_NE(std::string(e.what()).find("state.lock"), std::string::npos);
    }
}

TEST(FileLock, ReleasedOnScopeExit) {
    TempDir dir;
    auto path = (dir / "state.lock").string();
    { FileLock first(path, 100ms); }
    FileLock again(path, 100ms);
    EXPECT_TRUE(again.held());
}

TEST(FileLock, WaiterGetsLockOnceReleased) {
    TempDir dir;
    auto path = (dir / "state.lock").string();
    std::atomic<bool> acquired{false};

    auto holder = std::make_unique<FileLock>(path, 100ms);
    std::thread waiter([&]() {
        FileLock lock(path, 2000ms);
        acquired = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(acquired.load());
    holder.reset();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}
