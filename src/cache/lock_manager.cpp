#include "cache/lock_manager.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <unistd.h>

#include "cache/path_resolver.h"

namespace fs = std::filesystem;

namespace hubcache {

LockManager::LockManager(fs::path cache_root, std::chrono::milliseconds backoff)
    : root_(std::move(cache_root)), backoff_(backoff) {}

LockManager::~LockManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, held] : held_) {
        spdlog::warn("LockManager: releasing lock {} still held at shutdown (token={})", held.path.string(), id);
        closeAndRemove(held);
    }
    held_.clear();
    busy_keys_.clear();
}

std::string LockManager::keyFor(const std::string& repo_id, const std::string& filename) {
    // '\n' cannot appear in a repo id, so the pair maps to a unique key
    return repo_id + '\n' + filename;
}

void LockManager::unreserve(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_keys_.erase(key);
    }
    released_cv_.notify_all();
}

void LockManager::closeAndRemove(const HeldLock& held) {
    if (held.fd >= 0) {
        ::close(held.fd);
    }
    std::error_code ec;
    fs::remove(held.path, ec);
    if (ec) {
        spdlog::warn("LockManager: failed to remove lock file {}: {}", held.path.string(), ec.message());
    }
}

std::optional<LockToken> LockManager::acquire(const std::string& repo_id,
                                              const std::string& filename,
                                              HubError* error) {
    const std::string key = keyFor(repo_id, filename);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        released_cv_.wait(lock, [&]() { return busy_keys_.count(key) == 0; });
        busy_keys_.insert(key);
    }

    auto fail = [&](std::string message) -> std::optional<LockToken> {
        unreserve(key);
        spdlog::warn("LockManager: {}", message);
        if (error) *error = HubError::make(HubErrorCode::kIoError, std::move(message));
        return std::nullopt;
    };

    const fs::path path = PathResolver::lockPath(root_, repo_id, filename);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return fail("cannot create lock directory " + path.parent_path().string() + ": " + ec.message());
    }

    int fd = -1;
    bool reported_wait = false;
    while (true) {
        fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd >= 0) break;
        const int err = errno;
        if (err == EEXIST) {
            if (!reported_wait) {
                spdlog::debug("LockManager: {} held by another process, waiting", path.string());
                reported_wait = true;
            }
            std::this_thread::sleep_for(backoff_);
            continue;
        }
        if (err == ENOENT) {
            // lock directory removed underneath us (cache cleared); recreate it
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                return fail("cannot recreate lock directory " + path.parent_path().string() + ": " + ec.message());
            }
            continue;
        }
        return fail("cannot create lock file " + path.string() + ": " + std::strerror(err));
    }

    const std::string owner = std::to_string(::getpid()) + "\n";
    if (::write(fd, owner.data(), owner.size()) < 0) {
        spdlog::debug("LockManager: could not record owner pid in {}", path.string());
    }

    LockToken token;
    token.repo_id = repo_id;
    token.filename = filename;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token.id = next_id_++;
        held_[token.id] = HeldLock{key, path, fd};
    }
    return token;
}

HubError LockManager::release(const LockToken& token) {
    HeldLock held;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(token.id);
        if (it == held_.end() || it->second.key != keyFor(token.repo_id, token.filename)) {
            return HubError::make(HubErrorCode::kInvalidLock,
                                  "unknown or released lock for " + token.repo_id + "/" + token.filename);
        }
        held = std::move(it->second);
        held_.erase(it);
    }
    closeAndRemove(held);
    unreserve(held.key);
    return {};
}

bool LockManager::isLocked(const std::string& repo_id, const std::string& filename) const {
    const std::string key = keyFor(repo_id, filename);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : held_) {
        if (entry.second.key == key) return true;
    }
    return false;
}

size_t LockManager::heldCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

ScopedLock::ScopedLock(LockManager& manager, LockToken token)
    : manager_(&manager), token_(std::move(token)) {}

ScopedLock::~ScopedLock() {
    if (!held()) return;
    auto err = release();
    if (!err.ok()) {
        spdlog::warn("ScopedLock: release failed: {}", err.describe());
    }
}

ScopedLock::ScopedLock(ScopedLock&& other) noexcept
    : manager_(other.manager_), token_(std::move(other.token_)) {
    other.manager_ = nullptr;
    other.token_ = LockToken{};
}

ScopedLock& ScopedLock::operator=(ScopedLock&& other) noexcept {
    if (this != &other) {
        if (held()) {
            auto err = release();
            if (!err.ok()) {
                spdlog::warn("ScopedLock: release failed: {}", err.describe());
            }
        }
        manager_ = other.manager_;
        token_ = std::move(other.token_);
        other.manager_ = nullptr;
        other.token_ = LockToken{};
    }
    return *this;
}

HubError ScopedLock::release() {
    if (!held()) {
        return HubError::make(HubErrorCode::kInvalidLock, "scoped lock not held");
    }
    auto err = manager_->release(token_);
    manager_ = nullptr;
    token_ = LockToken{};
    return err;
}

}  // namespace hubcache
