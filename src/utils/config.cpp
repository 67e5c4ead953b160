#include "utils/config.h"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <spdlog/spdlog.h>

#include "utils/file_lock.h"
#include "utils/glob.h"

namespace hubcache {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Get environment variable with fallback to deprecated name
/// Logs a warning if the deprecated name is used
std::optional<std::string> getEnvWithFallback(const char* new_name, const char* old_name) {
    if (auto v = getEnvValue(new_name)) {
        return v;
    }
    if (auto v = getEnvValue(old_name)) {
        spdlog::warn("Environment variable '{}' is deprecated, use '{}' instead", old_name, new_name);
        return v;
    }
    return std::nullopt;
}

std::optional<bool> parseBool(const std::string& value) {
    const auto v = toLowerAscii(trimAscii(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::optional<long long> parseInteger(const char* name, const std::string& value) {
    try {
        size_t pos = 0;
        long long v = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::exception&) {
        spdlog::warn("Config: ignoring invalid {}='{}'", name, value);
        return std::nullopt;
    }
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    FileLock lock(path, FileLock::Mode::Shared);
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded()) {
        spdlog::warn("Config: {} is not valid JSON, ignoring", path.string());
        return false;
    }
    return out.is_object();
}

}  // namespace

std::filesystem::path defaultHubcacheHome() {
    const std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path(".hubcache");
    return home / ".hubcache";
}

std::pair<HubConfig, std::string> loadHubConfigWithLog() {
    HubConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    const std::filesystem::path home = getEnvValue("HOME").value_or("");
    cfg.cache_dir = home.empty() ? std::filesystem::path(".cache/hubcache") : home / ".cache/hubcache";

    auto apply_json = [&](const nlohmann::json& j) {
        if (j.contains("cache_dir") && j["cache_dir"].is_string()) {
            cfg.cache_dir = j["cache_dir"].get<std::string>();
        }
        if (j.contains("endpoint") && j["endpoint"].is_string()) {
            cfg.endpoint = j["endpoint"].get<std::string>();
        }
        if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) {
            cfg.timeout = std::chrono::milliseconds(j["timeout_ms"].get<long long>());
        }
        if (j.contains("lock_backoff_ms") && j["lock_backoff_ms"].is_number_integer()) {
            cfg.lock_backoff = std::chrono::milliseconds(j["lock_backoff_ms"].get<long long>());
        }
        if (j.contains("upload_concurrency") && j["upload_concurrency"].is_number_integer()) {
            auto v = j["upload_concurrency"].get<long long>();
            if (v > 0 && v < 64) cfg.upload_concurrency = static_cast<size_t>(v);
        }
        if (j.contains("write_checksums") && j["write_checksums"].is_boolean()) {
            cfg.write_checksums = j["write_checksums"].get<bool>();
        }
        if (j.contains("max_cache_bytes") && j["max_cache_bytes"].is_number_unsigned()) {
            cfg.max_cache_bytes = j["max_cache_bytes"].get<uint64_t>();
        }
    };

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("HUBCACHE_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultHubcacheHome() / "config.json";
    }
    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJsonWithLock(cfg_path, j)) {
            apply_json(j);
            log << "file=" << cfg_path << " ";
            used_file = true;
        }
    }

    // env overrides; HF_* names are accepted as deprecated fallbacks
    if (auto v = getEnvWithFallback("HUBCACHE_CACHE_DIR", "HF_HOME")) {
        cfg.cache_dir = *v;
        log << "env:CACHE_DIR=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvWithFallback("HUBCACHE_ENDPOINT", "HF_ENDPOINT")) {
        cfg.endpoint = *v;
        log << "env:ENDPOINT=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("HUBCACHE_TIMEOUT_MS")) {
        if (auto ms = parseInteger("HUBCACHE_TIMEOUT_MS", *v); ms && *ms > 0) {
            cfg.timeout = std::chrono::milliseconds(*ms);
            log << "env:TIMEOUT_MS=" << *ms << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("HUBCACHE_LOCK_BACKOFF_MS")) {
        if (auto ms = parseInteger("HUBCACHE_LOCK_BACKOFF_MS", *v); ms && *ms >= 0) {
            cfg.lock_backoff = std::chrono::milliseconds(*ms);
            log << "env:LOCK_BACKOFF_MS=" << *ms << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("HUBCACHE_UPLOAD_CONCURRENCY")) {
        if (auto n = parseInteger("HUBCACHE_UPLOAD_CONCURRENCY", *v); n && *n > 0 && *n < 64) {
            cfg.upload_concurrency = static_cast<size_t>(*n);
            log << "env:UPLOAD_CONCURRENCY=" << *n << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("HUBCACHE_WRITE_CHECKSUMS")) {
        if (auto b = parseBool(*v)) {
            cfg.write_checksums = *b;
            log << "env:WRITE_CHECKSUMS=" << (*b ? "true" : "false") << " ";
            used_env = true;
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

HubConfig loadHubConfig() {
    auto info = loadHubConfigWithLog();
    return info.first;
}

}  // namespace hubcache
