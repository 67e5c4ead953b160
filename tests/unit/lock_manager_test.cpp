#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "cache/lock_manager.h"
#include "cache/path_resolver.h"
#include "../test_support.h"

using namespace hubcache;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

TEST(LockManagerTest, AcquireCreatesLockFileAndReleaseRemovesIt) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 10ms);

    auto token = manager.acquire("user/repo", "model.bin");
    ASSERT_TRUE(token.has_value());
    EXPECT_TRUE(token->valid());
    EXPECT_TRUE(manager.isLocked("user/repo", "model.bin"));
    EXPECT_TRUE(fs::exists(PathResolver::lockPath(tmp.path, "user/repo", "model.bin")));

    auto err = manager.release(*token);
    EXPECT_TRUE(err.ok()) << err.describe();
    EXPECT_FALSE(manager.isLocked("user/repo", "model.bin"));
    EXPECT_FALSE(fs::exists(PathResolver::lockPath(tmp.path, "user/repo", "model.bin")));
    EXPECT_EQ(manager.heldCount(), 0u);
}

TEST(LockManagerTest, ReleaseTwiceIsInvalidLock) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 10ms);
    auto token = manager.acquire("user/repo", "a.bin");
    ASSERT_TRUE(token.has_value());
    ASSERT_TRUE(manager.release(*token).ok());

    auto err = manager.release(*token);
    EXPECT_EQ(err.code, HubErrorCode::kInvalidLock);
}

TEST(LockManagerTest, ForeignTokenIsInvalidLock) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 10ms);
    LockToken bogus;
    bogus.id = 42;
    bogus.repo_id = "user/repo";
    bogus.filename = "a.bin";
    EXPECT_EQ(manager.release(bogus).code, HubErrorCode::kInvalidLock);
}

TEST(LockManagerTest, DistinctKeysDoNotBlock) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 10ms);
    auto a = manager.acquire("user/repo", "a.bin");
    auto b = manager.acquire("user/repo", "b.bin");
    auto c = manager.acquire("other/repo", "a.bin");
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(manager.heldCount(), 3u);
    EXPECT_TRUE(manager.release(*a).ok());
    EXPECT_TRUE(manager.release(*b).ok());
    EXPECT_TRUE(manager.release(*c).ok());
}

TEST(LockManagerTest, SameKeyIsMutuallyExclusiveAcrossThreads) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 5ms);

    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 5; ++j) {
                auto token = manager.acquire("user/repo", "shared.bin");
                if (!token) {
                    failures++;
                    return;
                }
                const int now = ++inside;
                int prev = max_inside.load();
                while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(1ms);
                --inside;
                if (!manager.release(*token).ok()) failures++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(manager.heldCount(), 0u);
}

TEST(LockManagerTest, WaitsForLockFileHeldByAnotherManager) {
    test::TempDir tmp("locks");
    LockManager first(tmp.path, 5ms);
    LockManager second(tmp.path, 5ms);

    auto held = first.acquire("user/repo", "x.bin");
    ASSERT_TRUE(held.has_value());

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        auto token = second.acquire("user/repo", "x.bin");
        if (token) {
            acquired = true;
            EXPECT_TRUE(second.release(*token).ok());
        }
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());
    ASSERT_TRUE(first.release(*held).ok());
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST(LockManagerTest, RecreatesLockDirectoryAfterCacheClear) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 5ms);
    auto token = manager.acquire("user/repo", "a.bin");
    ASSERT_TRUE(token.has_value());
    ASSERT_TRUE(manager.release(*token).ok());

    fs::remove_all(PathResolver::locksDir(tmp.path));
    auto again = manager.acquire("user/repo", "a.bin");
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(manager.release(*again).ok());
}

TEST(ScopedLockTest, ReleasesOnDestruction) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 5ms);
    {
        auto token = manager.acquire("user/repo", "a.bin");
        ASSERT_TRUE(token.has_value());
        ScopedLock guard(manager, *token);
        EXPECT_TRUE(guard.held());
        EXPECT_TRUE(manager.isLocked("user/repo", "a.bin"));
    }
    EXPECT_FALSE(manager.isLocked("user/repo", "a.bin"));
}

TEST(ScopedLockTest, ExplicitReleaseThenSecondReleaseFails) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 5ms);
    auto token = manager.acquire("user/repo", "a.bin");
    ASSERT_TRUE(token.has_value());
    ScopedLock guard(manager, *token);
    EXPECT_TRUE(guard.release().ok());
    EXPECT_FALSE(guard.held());
    EXPECT_EQ(guard.release().code, HubErrorCode::kInvalidLock);
}

TEST(ScopedLockTest, MoveTransfersOwnership) {
    test::TempDir tmp("locks");
    LockManager manager(tmp.path, 5ms);
    auto token = manager.acquire("user/repo", "a.bin");
    ASSERT_TRUE(token.has_value());
    ScopedLock first(manager, *token);
    ScopedLock second(std::move(first));
    EXPECT_FALSE(first.held());
    EXPECT_TRUE(second.held());
    EXPECT_TRUE(second.release().ok());
    EXPECT_EQ(manager.heldCount(), 0u);
}
