#include "utils/logger.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "utils/glob.h"

namespace fs = std::filesystem;

namespace hubcache::logger {

namespace {

constexpr const char* kLogFileBase = "hubcache.jsonl";
constexpr const char* kDataDir = ".hubcache";
constexpr const char* kLogSubdir = "logs";
constexpr int kDefaultRetentionDays = 7;

constexpr const char* kLogDirEnv = "HUBCACHE_LOG_DIR";
constexpr const char* kLogLevelEnv = "HUBCACHE_LOG_LEVEL";
constexpr const char* kRetentionEnv = "HUBCACHE_LOG_RETENTION_DAYS";

std::string format_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_local{};
    localtime_r(&t, &tm_local);
    std::ostringstream oss;
    oss << std::put_time(&tm_local, "%Y-%m-%d");
    return oss.str();
}

std::string get_home_dir() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    return "/tmp";
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    const std::string lower = toLowerAscii(trimAscii(level_text));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(kLogDirEnv)) {
        if (*env) return env;
    }
    return (fs::path(get_home_dir()) / kDataDir / kLogSubdir).string();
}

std::string get_log_file_path() {
    const std::string filename = std::string(kLogFileBase) + "." + format_date(std::chrono::system_clock::now());
    return (fs::path(get_log_dir()) / filename).string();
}

int get_retention_days() {
    if (const char* env = std::getenv(kRetentionEnv)) {
        try {
            int days = std::stoi(env);
            if (days > 0 && days < 365) {
                return days;
            }
        } catch (const std::exception&) {
            // logger is not up yet; fall through to the default
        }
    }
    return kDefaultRetentionDays;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) {
        return;
    }

    const auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);
    const std::string cutoff_str = format_date(cutoff);
    const std::string prefix = std::string(kLogFileBase) + ".";

    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string filename = it->path().filename().string();
        if (filename.rfind(prefix, 0) != 0) continue;
        // YYYY-MM-DD compares correctly as a string
        if (filename.substr(prefix.length()) < cutoff_str) {
            std::error_code rm_ec;
            fs::remove(it->path(), rm_ec);
        }
    }
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (!file_path.empty() && sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("hubcache", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env(const std::string& fallback_level) {
    std::string level = fallback_level;
    if (const char* env = std::getenv(kLogLevelEnv)) {
        level = env;
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    sinks.push_back(console);

    const std::string log_dir = get_log_dir();
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    std::string log_path;
    if (!ec) {
        cleanup_old_logs(log_dir, get_retention_days());
        log_path = get_log_file_path();
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
            file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex&) {
            log_path.clear();
        }
    }

    // per-sink patterns stay as set above
    init(level, "", "", sinks);

    if (log_path.empty()) {
        spdlog::warn("Logger: file logging disabled, cannot write to {}", log_dir);
    } else {
        spdlog::debug("Logger: writing {}", log_path);
    }
}

}  // namespace hubcache::logger
