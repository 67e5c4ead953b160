#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace hubcache {

struct HubConfig {
    std::filesystem::path cache_dir;  // cache root; {cache_dir}/hub holds the repositories
    std::string endpoint{"https://huggingface.co"};
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds lock_backoff{100};
    size_t upload_concurrency{4};
    bool write_checksums{true};
    uint64_t max_cache_bytes{10ULL * 1024 * 1024 * 1024};  // default target for `evict`
};

// Defaults, then the JSON file (HUBCACHE_CONFIG or ~/.hubcache/config.json), then environment.
HubConfig loadHubConfig();
std::pair<HubConfig, std::string> loadHubConfigWithLog();

std::filesystem::path defaultHubcacheHome();

}  // namespace hubcache
