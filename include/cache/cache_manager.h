// CacheManager - maintenance over the on-disk cache layout (lookup, clear, eviction, integrity).
#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cache/path_resolver.h"
#include "hub/hub_error.h"

namespace hubcache {

enum class EvictionOrder {
    AgeThenSize,
    SizeThenAge,
};

struct EvictOptions {
    std::optional<std::chrono::seconds> max_age;  // by last access time
    std::optional<uint64_t> target_size;          // bytes; oldest-modified removed first
    EvictionOrder order{EvictionOrder::AgeThenSize};
};

struct EvictionReport {
    std::vector<std::filesystem::path> removed;
    uint64_t freed_bytes{0};
    size_t failed{0};
};

enum class IntegrityStatus {
    Valid,
    Corrupted,
    MissingChecksum,
};

const char* toString(IntegrityStatus status);

struct IntegrityDetail {
    std::filesystem::path path;
    IntegrityStatus status{IntegrityStatus::Valid};
    std::string expected;
    std::string actual;
};

struct IntegrityReport {
    size_t total{0};
    size_t valid{0};
    size_t corrupted{0};
    size_t missing_checksum{0};
    std::vector<IntegrityDetail> details;
};

struct RepoStats {
    std::string folder;  // e.g. models--user--repo
    uint64_t size{0};
    size_t file_count{0};
};

struct CacheStats {
    uint64_t total_size{0};
    size_t file_count{0};
    std::vector<RepoStats> repos;
};

// Operates on {root}/hub only. Sidecars are not entries and go with their file;
// *.incomplete files belong to in-flight downloads and are skipped.
// Not coordinated with LockManager.
class CacheManager {
public:
    explicit CacheManager(std::filesystem::path root);

    bool exists(const std::string& repo_id,
                RepoType kind,
                const std::string& filename,
                const std::string& revision = kDefaultRevision) const;

    std::optional<std::filesystem::path> resolvedPath(const std::string& repo_id,
                                                      RepoType kind,
                                                      const std::string& filename,
                                                      const std::string& revision = kDefaultRevision,
                                                      HubError* error = nullptr) const;

    // With a repo: removes that repo's directory. Without: removes the whole root.
    HubError clear(const std::optional<std::string>& repo_id = std::nullopt, RepoType kind = RepoType::Model);

    EvictionReport evict(const EvictOptions& options);
    IntegrityReport validateIntegrity() const;
    CacheStats stats() const;

    const std::filesystem::path& root() const { return root_; }

private:
    struct Entry {
        std::filesystem::path path;
        uint64_t size{0};
        std::time_t atime{0};
        std::time_t mtime{0};
    };

    std::vector<Entry> scan() const;
    bool removeEntry(const Entry& entry, EvictionReport& report);
    void evictByAge(std::vector<Entry>& entries, std::chrono::seconds max_age, EvictionReport& report);
    void evictBySize(std::vector<Entry>& entries, uint64_t target_size, EvictionReport& report);

    std::filesystem::path root_;
};

}  // namespace hubcache
