#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cache/cache_manager.h"
#include "cache/path_resolver.h"

namespace hubcache {

/// Subcommand types for the hubcache CLI
enum class Subcommand {
    None,         // no subcommand: print help
    Download,     // download <repo> <file>
    Snapshot,     // snapshot <repo>
    Resume,       // resume <url> <path>
    Cat,          // cat <repo> <file> | cat <url>
    Stats,        // stats
    Clear,        // clear [repo]
    Evict,        // evict [--max-age] [--max-size]
    Verify,       // verify
    Fingerprint,  // fingerprint <path>...
    Upload,       // upload <repo> <path>...
};

/// Repository coordinates shared by download/snapshot/cat/clear/upload
struct RepoOptions {
    std::string repo_id;
    RepoType kind{RepoType::Model};
    std::string revision{kDefaultRevision};
};

struct DownloadOptions {
    RepoOptions repo;
    std::string filename;
    bool force{false};
    bool resumable{false};
    std::string sha256;
};

struct SnapshotOptions {
    RepoOptions repo;
    std::vector<std::string> allow_patterns;
    std::vector<std::string> ignore_patterns;
    bool force{false};
};

struct ResumeOptions {
    std::string url;
    std::string path;
};

struct CatOptions {
    std::string url;  // set when given directly
    RepoOptions repo;
    std::string filename;
};

struct ClearOptions {
    std::optional<std::string> repo_id;
    RepoType kind{RepoType::Model};
};

struct EvictCliOptions {
    std::optional<int64_t> max_age_seconds;
    std::optional<uint64_t> max_size_bytes;
    EvictionOrder order{EvictionOrder::AgeThenSize};
};

struct FingerprintOptions {
    std::vector<std::string> paths;
};

struct UploadOptions {
    RepoOptions repo;
    std::vector<std::string> paths;
    size_t concurrency{0};  // 0: from config
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    DownloadOptions download_options;
    SnapshotOptions snapshot_options;
    ResumeOptions resume_options;
    CatOptions cat_options;
    ClearOptions clear_options;
    EvictCliOptions evict_options;
    FingerprintOptions fingerprint_options;
    UploadOptions upload_options;
};

/// Parse command line arguments
CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getVersionMessage();
std::string subcommandToString(Subcommand cmd);

/// "90" -> 90, "30m" -> 1800, "2h", "7d"
std::optional<int64_t> parseDurationSeconds(const std::string& text);
/// "1024" -> 1024, "10K", "512M", "2G" (binary units)
std::optional<uint64_t> parseByteSize(const std::string& text);

}  // namespace hubcache
