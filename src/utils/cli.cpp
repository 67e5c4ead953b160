#include "utils/cli.h"

#include <cstring>
#include <sstream>

#include "utils/glob.h"
#include "utils/version.h"

namespace hubcache {

namespace {

const char* kEnvironmentHelp =
    "ENVIRONMENT VARIABLES:\n"
    "    HUBCACHE_CACHE_DIR            Cache root (default: ~/.cache/hubcache, fallback HF_HOME)\n"
    "    HUBCACHE_ENDPOINT             Hub endpoint (default: https://huggingface.co, fallback HF_ENDPOINT)\n"
    "    HUBCACHE_CONFIG               Config file path (default: ~/.hubcache/config.json)\n"
    "    HUBCACHE_TIMEOUT_MS           HTTP timeout in milliseconds\n"
    "    HUBCACHE_LOCK_BACKOFF_MS      Lock retry backoff in milliseconds (default: 100)\n"
    "    HUBCACHE_UPLOAD_CONCURRENCY   Parallel LFS uploads (1-63, default: 4)\n"
    "    HUBCACHE_WRITE_CHECKSUMS      Write .sha256 sidecars (default: true)\n"
    "    HUBCACHE_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n"
    "    HUBCACHE_LOG_DIR              Log directory (default: ~/.hubcache/logs)\n"
    "    HF_TOKEN                      Bearer token for private or gated repositories\n";

const char* kRepoFlagsHelp =
    "    --type <model|dataset|space>  Repository type (default: model)\n"
    "    --revision <REV>              Branch, tag or commit (default: main)\n";

struct CommandHelp {
    Subcommand cmd;
    const char* usage;
    const char* summary;
    const char* options;
};

const CommandHelp kCommands[] = {
    {Subcommand::Download, "hubcache download <REPO> <FILE> [OPTIONS]", "Download one file into the cache",
     "    --force                       Download even if cached\n"
     "    --resume                      Resume a previous partial download\n"
     "    --sha256 <HEX>                Expected SHA-256 of the file\n"},
    {Subcommand::Snapshot, "hubcache snapshot <REPO> [OPTIONS]", "Download every file of a revision",
     "    --include <GLOB>              Only files matching (repeatable, comma separated)\n"
     "    --exclude <GLOB>              Skip files matching (repeatable, comma separated)\n"
     "    --force                       Download even if cached\n"},
    {Subcommand::Resume, "hubcache resume <URL> <PATH>", "Resume a partial download in place", ""},
    {Subcommand::Cat, "hubcache cat <REPO> <FILE> | hubcache cat <URL>", "Stream a remote file to stdout", ""},
    {Subcommand::Stats, "hubcache stats", "Show cache usage per repository", ""},
    {Subcommand::Clear, "hubcache clear [REPO] [--type <TYPE>]", "Delete one repository or the whole cache", ""},
    {Subcommand::Evict, "hubcache evict [OPTIONS]", "Evict cache entries by age and/or size",
     "    --max-age <DURATION>          Remove files not accessed within DURATION (e.g. 7d, 12h)\n"
     "    --max-size <SIZE>             Shrink the cache to SIZE (e.g. 10G), oldest first\n"
     "    --size-first                  Apply the size limit before the age limit\n"},
    {Subcommand::Verify, "hubcache verify", "Check cached files against their .sha256 sidecars", ""},
    {Subcommand::Fingerprint, "hubcache fingerprint <PATH>...", "Print the LFS object id and size of files", ""},
    {Subcommand::Upload, "hubcache upload <REPO> <PATH>... [OPTIONS]", "Upload files through the LFS batch API",
     "    --concurrency <N>             Parallel uploads (1-63)\n"},
};

const CommandHelp* findHelp(Subcommand cmd) {
    for (const auto& h : kCommands) {
        if (h.cmd == cmd) return &h;
    }
    return nullptr;
}

bool usesRepoFlags(Subcommand cmd) {
    return cmd == Subcommand::Download || cmd == Subcommand::Snapshot || cmd == Subcommand::Cat ||
           cmd == Subcommand::Upload;
}

std::string getCommandHelpMessage(Subcommand cmd) {
    const CommandHelp* h = findHelp(cmd);
    if (!h) return getHelpMessage();
    std::ostringstream oss;
    oss << "hubcache " << subcommandToString(cmd) << " - " << h->summary << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    " << h->usage << "\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    if (usesRepoFlags(cmd)) oss << kRepoFlagsHelp;
    oss << h->options;
    oss << "    -h, --help                    Print help\n";
    return oss.str();
}

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

CliResult& fail(CliResult& result, const std::string& message) {
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Error: " << message << "\n";
    if (const CommandHelp* h = findHelp(result.subcommand)) {
        oss << "\nUsage: " << h->usage << "\n";
    }
    result.output = oss.str();
    return result;
}

bool isUrl(const std::string& value) {
    return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

// Consumes --type/--revision; false with `error` set on a bad value.
bool parseRepoFlag(int argc, char* argv[], int& i, RepoOptions& repo, bool& consumed, std::string& error) {
    consumed = false;
    if (std::strcmp(argv[i], "--type") == 0 || std::strcmp(argv[i], "--revision") == 0) {
        if (i + 1 >= argc) {
            error = std::string(argv[i]) + " requires a value";
            return false;
        }
        consumed = true;
        const bool is_type = std::strcmp(argv[i], "--type") == 0;
        const std::string value = argv[++i];
        if (is_type) {
            auto kind = parseRepoType(value);
            if (!kind) {
                error = "unknown repository type: " + value;
                return false;
            }
            repo.kind = *kind;
        } else {
            repo.revision = value;
        }
    }
    return true;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "hubcache " << HUBCACHE_VERSION << " - artifact cache and LFS transfer client\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    hubcache <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    for (const auto& h : kCommands) {
        std::string name = subcommandToString(h.cmd);
        name.resize(13, ' ');
        oss << "    " << name << h.summary << "\n";
    }
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << kEnvironmentHelp;
    oss << "\n";
    oss << "Run 'hubcache <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "hubcache " << HUBCACHE_VERSION << "\n";
    return oss.str();
}

std::optional<int64_t> parseDurationSeconds(const std::string& text) {
    const std::string value = trimAscii(text);
    if (value.empty()) return std::nullopt;
    int64_t unit = 1;
    std::string digits = value;
    switch (value.back()) {
        case 's':
            digits.pop_back();
            break;
        case 'm':
            unit = 60;
            digits.pop_back();
            break;
        case 'h':
            unit = 3600;
            digits.pop_back();
            break;
        case 'd':
            unit = 86400;
            digits.pop_back();
            break;
        default:
            break;
    }
    try {
        size_t pos = 0;
        const long long n = std::stoll(digits, &pos);
        if (pos != digits.size() || n < 0) return std::nullopt;
        return static_cast<int64_t>(n) * unit;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parseByteSize(const std::string& text) {
    std::string value = toLowerAscii(trimAscii(text));
    if (!value.empty() && value.back() == 'b') value.pop_back();
    if (value.empty()) return std::nullopt;
    uint64_t unit = 1;
    switch (value.back()) {
        case 'k':
            unit = 1024ULL;
            value.pop_back();
            break;
        case 'm':
            unit = 1024ULL * 1024;
            value.pop_back();
            break;
        case 'g':
            unit = 1024ULL * 1024 * 1024;
            value.pop_back();
            break;
        case 't':
            unit = 1024ULL * 1024 * 1024 * 1024;
            value.pop_back();
            break;
        default:
            break;
    }
    try {
        size_t pos = 0;
        const unsigned long long n = std::stoull(value, &pos);
        if (pos != value.size() || value.front() == '-') return std::nullopt;
        return static_cast<uint64_t>(n) * unit;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - show help
    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    const std::string command = argv[1];

    if (command == "-h" || command == "--help") {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }
    if (command == "-V" || command == "--version") {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    for (const auto& h : kCommands) {
        if (command == subcommandToString(h.cmd)) {
            result.subcommand = h.cmd;
            break;
        }
    }
    if (result.subcommand == Subcommand::None) {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << (command[0] == '-' ? "Unknown option: " : "Unknown command: ") << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    if (hasHelpFlag(argc, argv, 2)) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getCommandHelpMessage(result.subcommand);
        return result;
    }

    RepoOptions repo;
    std::vector<std::string> positional;
    std::string error;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        bool consumed = false;
        if (usesRepoFlags(result.subcommand) || result.subcommand == Subcommand::Clear) {
            if (!parseRepoFlag(argc, argv, i, repo, consumed, error)) return fail(result, error);
            if (consumed) continue;
        }
        auto needValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        switch (result.subcommand) {
            case Subcommand::Download:
                if (arg == "--force") {
                    result.download_options.force = true;
                    continue;
                }
                if (arg == "--resume") {
                    result.download_options.resumable = true;
                    continue;
                }
                if (arg == "--sha256") {
                    if (!needValue(value)) return fail(result, error);
                    result.download_options.sha256 = value;
                    continue;
                }
                break;
            case Subcommand::Snapshot:
                if (arg == "--force") {
                    result.snapshot_options.force = true;
                    continue;
                }
                if (arg == "--include" || arg == "--exclude") {
                    if (!needValue(value)) return fail(result, error);
                    auto& target = arg == "--include" ? result.snapshot_options.allow_patterns
                                                      : result.snapshot_options.ignore_patterns;
                    for (auto& p : splitCsv(value)) target.push_back(std::move(p));
                    continue;
                }
                break;
            case Subcommand::Evict:
                if (arg == "--max-age") {
                    if (!needValue(value)) return fail(result, error);
                    auto secs = parseDurationSeconds(value);
                    if (!secs) return fail(result, "invalid duration: " + value);
                    result.evict_options.max_age_seconds = *secs;
                    continue;
                }
                if (arg == "--max-size") {
                    if (!needValue(value)) return fail(result, error);
                    auto bytes = parseByteSize(value);
                    if (!bytes) return fail(result, "invalid size: " + value);
                    result.evict_options.max_size_bytes = *bytes;
                    continue;
                }
                if (arg == "--size-first") {
                    result.evict_options.order = EvictionOrder::SizeThenAge;
                    continue;
                }
                break;
            case Subcommand::Upload:
                if (arg == "--concurrency") {
                    if (!needValue(value)) return fail(result, error);
                    try {
                        const int n = std::stoi(value);
                        if (n < 1 || n > 63) throw std::out_of_range("concurrency");
                        result.upload_options.concurrency = static_cast<size_t>(n);
                    } catch (const std::exception&) {
                        return fail(result, "--concurrency must be between 1 and 63");
                    }
                    continue;
                }
                break;
            default:
                break;
        }

        if (!arg.empty() && arg[0] == '-') {
            return fail(result, "unknown option: " + arg);
        }
        positional.push_back(arg);
    }

    switch (result.subcommand) {
        case Subcommand::Download:
            if (positional.size() != 2) return fail(result, "repository and file name required");
            repo.repo_id = positional[0];
            result.download_options.repo = repo;
            result.download_options.filename = positional[1];
            break;
        case Subcommand::Snapshot:
            if (positional.size() != 1) return fail(result, "repository required");
            repo.repo_id = positional[0];
            result.snapshot_options.repo = repo;
            break;
        case Subcommand::Resume:
            if (positional.size() != 2) return fail(result, "URL and local path required");
            result.resume_options.url = positional[0];
            result.resume_options.path = positional[1];
            break;
        case Subcommand::Cat:
            if (positional.size() == 1 && isUrl(positional[0])) {
                result.cat_options.url = positional[0];
            } else if (positional.size() == 2) {
                repo.repo_id = positional[0];
                result.cat_options.repo = repo;
                result.cat_options.filename = positional[1];
            } else {
                return fail(result, "repository and file name, or a URL, required");
            }
            break;
        case Subcommand::Clear:
            if (positional.size() > 1) return fail(result, "at most one repository");
            if (!positional.empty()) result.clear_options.repo_id = positional[0];
            result.clear_options.kind = repo.kind;
            break;
        case Subcommand::Fingerprint:
            if (positional.empty()) return fail(result, "at least one path required");
            result.fingerprint_options.paths = positional;
            break;
        case Subcommand::Upload:
            if (positional.size() < 2) return fail(result, "repository and at least one path required");
            repo.repo_id = positional[0];
            result.upload_options.repo = repo;
            result.upload_options.paths.assign(positional.begin() + 1, positional.end());
            break;
        case Subcommand::Stats:
        case Subcommand::Verify:
        case Subcommand::Evict:
            if (!positional.empty()) return fail(result, "unexpected argument: " + positional[0]);
            break;
        case Subcommand::None:
            break;
    }
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Download: return "download";
        case Subcommand::Snapshot: return "snapshot";
        case Subcommand::Resume: return "resume";
        case Subcommand::Cat: return "cat";
        case Subcommand::Stats: return "stats";
        case Subcommand::Clear: return "clear";
        case Subcommand::Evict: return "evict";
        case Subcommand::Verify: return "verify";
        case Subcommand::Fingerprint: return "fingerprint";
        case Subcommand::Upload: return "upload";
    }
    return "unknown";
}

}  // namespace hubcache
