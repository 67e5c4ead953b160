#include "cache/cache_manager.h"

#include <algorithm>
#include <fstream>
#include <map>
#include <spdlog/spdlog.h>
#include <sstream>
#include <sys/stat.h>

#include "utils/glob.h"
#include "utils/sha256.h"

namespace fs = std::filesystem;

namespace hubcache {

namespace {

bool isSidecarOrPartial(const fs::path& path) {
    const auto name = path.filename().string();
    return endsWith(name, ".sha256") || endsWith(name, ".incomplete");
}

std::optional<std::string> readChecksum(const fs::path& sidecar) {
    std::ifstream ifs(sidecar, std::ios::binary);
    if (!ifs.is_open()) return std::nullopt;
    std::stringstream ss;
    ss << ifs.rdbuf();
    return toLowerAscii(trimAscii(ss.str()));
}

}  // namespace

const char* toString(IntegrityStatus status) {
    switch (status) {
        case IntegrityStatus::Valid:
            return "valid";
        case IntegrityStatus::Corrupted:
            return "corrupted";
        case IntegrityStatus::MissingChecksum:
            return "missing_checksum";
    }
    return "valid";
}

CacheManager::CacheManager(fs::path root) : root_(std::move(root)) {}

bool CacheManager::exists(const std::string& repo_id,
                          RepoType kind,
                          const std::string& filename,
                          const std::string& revision) const {
    std::error_code ec;
    return fs::is_regular_file(PathResolver::filePath(root_, repo_id, kind, filename, revision), ec);
}

std::optional<fs::path> CacheManager::resolvedPath(const std::string& repo_id,
                                                   RepoType kind,
                                                   const std::string& filename,
                                                   const std::string& revision,
                                                   HubError* error) const {
    auto path = PathResolver::filePath(root_, repo_id, kind, filename, revision);
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return path;
    }
    if (error) {
        *error = HubError::make(HubErrorCode::kNotCached, repo_id + "/" + filename + "@" + revision + " is not cached");
    }
    return std::nullopt;
}

HubError CacheManager::clear(const std::optional<std::string>& repo_id, RepoType kind) {
    const fs::path target = repo_id ? PathResolver::repoDir(root_, *repo_id, kind) : root_;
    std::error_code ec;
    const auto removed = fs::remove_all(target, ec);
    if (ec) {
        spdlog::warn("CacheManager: failed to clear {}: {}", target.string(), ec.message());
        return HubError::make(HubErrorCode::kIoError, "failed to clear " + target.string() + ": " + ec.message());
    }
    spdlog::info("CacheManager: cleared {} ({} entries)", target.string(), static_cast<uint64_t>(removed));
    return {};
}

std::vector<CacheManager::Entry> CacheManager::scan() const {
    std::vector<Entry> entries;
    const auto hub = PathResolver::hubDir(root_);
    std::error_code ec;
    if (!fs::is_directory(hub, ec)) {
        return entries;
    }

    fs::recursive_directory_iterator it(hub, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) continue;
        if (isSidecarOrPartial(it->path())) continue;

        struct stat st {};
        if (::stat(it->path().c_str(), &st) != 0) continue;  // vanished mid-scan
        Entry e;
        e.path = it->path();
        e.size = static_cast<uint64_t>(st.st_size);
        e.atime = st.st_atime;
        e.mtime = st.st_mtime;
        entries.push_back(std::move(e));
    }
    if (ec) {
        spdlog::warn("CacheManager: scan of {} stopped early: {}", hub.string(), ec.message());
    }
    return entries;
}

bool CacheManager::removeEntry(const Entry& entry, EvictionReport& report) {
    std::error_code ec;
    if (!fs::remove(entry.path, ec) || ec) {
        spdlog::warn("CacheManager: failed to remove {}: {}", entry.path.string(),
                     ec ? ec.message() : std::string("not found"));
        ++report.failed;
        return false;
    }
    fs::remove(PathResolver::checksumPath(entry.path), ec);
    report.removed.push_back(entry.path);
    report.freed_bytes += entry.size;
    return true;
}

void CacheManager::evictByAge(std::vector<Entry>& entries, std::chrono::seconds max_age, EvictionReport& report) {
    const std::time_t now = std::time(nullptr);
    std::vector<Entry> kept;
    kept.reserve(entries.size());
    for (auto& e : entries) {
        if (now - e.atime > static_cast<std::time_t>(max_age.count())) {
            if (removeEntry(e, report)) continue;
        }
        kept.push_back(std::move(e));
    }
    entries.swap(kept);
}

void CacheManager::evictBySize(std::vector<Entry>& entries, uint64_t target_size, EvictionReport& report) {
    uint64_t total = 0;
    for (const auto& e : entries) total += e.size;
    if (total <= target_size) return;

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.mtime != b.mtime) return a.mtime < b.mtime;
        return a.path < b.path;
    });

    std::vector<Entry> kept;
    for (auto& e : entries) {
        if (total > target_size && removeEntry(e, report)) {
            total -= e.size;
            continue;
        }
        kept.push_back(std::move(e));
    }
    entries.swap(kept);
}

EvictionReport CacheManager::evict(const EvictOptions& options) {
    EvictionReport report;
    auto entries = scan();

    if (options.order == EvictionOrder::AgeThenSize) {
        if (options.max_age) evictByAge(entries, *options.max_age, report);
        if (options.target_size) evictBySize(entries, *options.target_size, report);
    } else {
        if (options.target_size) evictBySize(entries, *options.target_size, report);
        if (options.max_age) evictByAge(entries, *options.max_age, report);
    }

    spdlog::info("CacheManager: evicted {} files, freed {} bytes", report.removed.size(), report.freed_bytes);
    return report;
}

IntegrityReport CacheManager::validateIntegrity() const {
    IntegrityReport report;
    for (const auto& e : scan()) {
        ++report.total;
        IntegrityDetail detail;
        detail.path = e.path;

        auto expected = readChecksum(PathResolver::checksumPath(e.path));
        if (!expected) {
            detail.status = IntegrityStatus::MissingChecksum;
            ++report.missing_checksum;
            report.details.push_back(std::move(detail));
            continue;
        }

        detail.expected = *expected;
        detail.actual = sha256_file(e.path);
        if (!detail.actual.empty() && detail.actual == detail.expected) {
            detail.status = IntegrityStatus::Valid;
            ++report.valid;
        } else {
            detail.status = IntegrityStatus::Corrupted;
            ++report.corrupted;
            spdlog::warn("CacheManager: checksum mismatch for {}", e.path.string());
        }
        report.details.push_back(std::move(detail));
    }
    return report;
}

CacheStats CacheManager::stats() const {
    CacheStats out;
    const auto hub = PathResolver::hubDir(root_);
    std::map<std::string, RepoStats> by_repo;
    for (const auto& e : scan()) {
        out.total_size += e.size;
        ++out.file_count;
        const auto rel = e.path.lexically_relative(hub);
        const std::string folder = rel.empty() ? std::string() : rel.begin()->string();
        auto& repo = by_repo[folder];
        repo.folder = folder;
        repo.size += e.size;
        ++repo.file_count;
    }
    for (auto& kv : by_repo) {
        out.repos.push_back(std::move(kv.second));
    }
    return out;
}

}  // namespace hubcache
