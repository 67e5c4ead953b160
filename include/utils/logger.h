// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace hubcache::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// HUBCACHE_LOG_DIR, or ~/.hubcache/logs.
std::string get_log_dir();

// Today's log file path (hubcache.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// HUBCACHE_LOG_RETENTION_DAYS (1..364), default 7.
int get_retention_days();

// Remove hubcache.jsonl.* files dated before today - retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Install the default logger. additional_sinks replaces the file sink (used by tests).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// stderr (human-readable) + daily JSON-lines file, level from HUBCACHE_LOG_LEVEL
// (default `fallback_level`). stdout is left to command output.
void init_from_env(const std::string& fallback_level = "warn");

}  // namespace hubcache::logger
