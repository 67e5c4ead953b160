// LockManager - per-(repo, filename) mutual exclusion backed by exclusive lock files.
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "hub/hub_error.h"

namespace hubcache {

constexpr std::chrono::milliseconds kDefaultLockBackoff{100};

// Opaque handle for one held lock. Only the LockManager that issued it can release it.
struct LockToken {
    uint64_t id{0};
    std::string repo_id;
    std::string filename;

    bool valid() const { return id != 0; }
};

// Waiters inside this process block on a condition variable until the holder
// releases. Against other processes the lock file is created with O_EXCL and
// polled with a fixed backoff. Acquisition is blocking and not queue-fair.
// A holder that dies without releasing leaves a stale lock file behind.
class LockManager {
public:
    explicit LockManager(std::filesystem::path cache_root,
                         std::chrono::milliseconds backoff = kDefaultLockBackoff);
    ~LockManager();

    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // Blocks until the lock is held. Fails only on filesystem errors other than "exists".
    std::optional<LockToken> acquire(const std::string& repo_id,
                                     const std::string& filename,
                                     HubError* error = nullptr);

    // InvalidLock if the token is unknown or already released.
    HubError release(const LockToken& token);

    bool isLocked(const std::string& repo_id, const std::string& filename) const;
    size_t heldCount() const;

    const std::filesystem::path& root() const { return root_; }
    std::chrono::milliseconds backoff() const { return backoff_; }

private:
    struct HeldLock {
        std::string key;
        std::filesystem::path path;
        int fd{-1};
    };

    static std::string keyFor(const std::string& repo_id, const std::string& filename);
    void unreserve(const std::string& key);
    static void closeAndRemove(const HeldLock& held);

    std::filesystem::path root_;
    std::chrono::milliseconds backoff_;

    mutable std::mutex mutex_;
    std::condition_variable released_cv_;
    std::unordered_set<std::string> busy_keys_;  // reserved or held by this instance
    std::unordered_map<uint64_t, HeldLock> held_;
    uint64_t next_id_{1};
};

// RAII holder; releases on destruction unless already released.
class ScopedLock {
public:
    ScopedLock() = default;
    ScopedLock(LockManager& manager, LockToken token);
    ~ScopedLock();

    ScopedLock(const ScopedLock&) = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;
    ScopedLock(ScopedLock&& other) noexcept;
    ScopedLock& operator=(ScopedLock&& other) noexcept;

    bool held() const { return manager_ != nullptr && token_.valid(); }
    const LockToken& token() const { return token_; }

    HubError release();

private:
    LockManager* manager_{nullptr};
    LockToken token_;
};

}  // namespace hubcache
