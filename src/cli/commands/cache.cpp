// stats / clear / evict / verify

#include <iomanip>
#include <iostream>

#include "cache/cache_manager.h"
#include "cli/commands.h"

namespace hubcache {
namespace cli {
namespace commands {

int stats(const HubConfig& config) {
    CacheManager cache(config.cache_dir);
    auto s = cache.stats();

    std::cout << "cache: " << config.cache_dir.string() << "\n";
    std::cout << std::left << std::setw(56) << "REPOSITORY" << std::setw(8) << "FILES" << "SIZE" << "\n";
    for (const auto& repo : s.repos) {
        std::cout << std::left << std::setw(56) << repo.folder << std::setw(8) << repo.file_count
                  << formatBytes(repo.size) << "\n";
    }
    std::cout << "total: " << s.file_count << " files, " << formatBytes(s.total_size) << std::endl;
    return 0;
}

int clear(const HubConfig& config, const ClearOptions& options) {
    CacheManager cache(config.cache_dir);
    auto err = cache.clear(options.repo_id, options.kind);
    if (!err.ok()) {
        return reportError("clear", err);
    }
    std::cout << "cleared " << (options.repo_id ? *options.repo_id : config.cache_dir.string()) << std::endl;
    return 0;
}

int evict(const HubConfig& config, const EvictCliOptions& options) {
    CacheManager cache(config.cache_dir);
    EvictOptions opts;
    if (options.max_age_seconds) opts.max_age = std::chrono::seconds(*options.max_age_seconds);
    opts.target_size = options.max_size_bytes;
    // with no limit given, keep the cache under the configured size
    if (!opts.max_age && !opts.target_size) opts.target_size = config.max_cache_bytes;
    opts.order = options.order;

    auto report = cache.evict(opts);
    for (const auto& path : report.removed) {
        std::cout << "removed " << path.string() << "\n";
    }
    std::cout << "freed " << formatBytes(report.freed_bytes) << " (" << report.removed.size() << " files)"
              << std::endl;
    if (report.failed > 0) {
        std::cerr << "Error: " << report.failed << " files could not be removed" << std::endl;
        return 1;
    }
    return 0;
}

int verify(const HubConfig& config) {
    CacheManager cache(config.cache_dir);
    auto report = cache.validateIntegrity();
    for (const auto& d : report.details) {
        if (d.status == IntegrityStatus::Valid) continue;
        std::cout << toString(d.status) << " " << d.path.string() << "\n";
    }
    std::cout << "total=" << report.total << " valid=" << report.valid << " corrupted=" << report.corrupted
              << " missing_checksum=" << report.missing_checksum << std::endl;
    return report.corrupted > 0 ? 1 : 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace hubcache
