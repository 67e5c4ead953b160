#include <iomanip>
#include <iostream>
#include <sstream>

#include "cli/commands.h"
#include "utils/version.h"

namespace hubcache {
namespace cli {
namespace commands {

std::string userAgent() {
    return std::string("hubcache/") + HUBCACHE_VERSION;
}

DownloaderOptions downloaderOptions(const HubConfig& config) {
    DownloaderOptions opts;
    opts.cache_dir = config.cache_dir;
    opts.endpoint = config.endpoint;
    opts.timeout = config.timeout;
    opts.write_checksums = config.write_checksums;
    opts.user_agent = userAgent();
    return opts;
}

int exitCodeFor(const HubError& error) {
    if (error.ok()) return 0;
    if (error.code == HubErrorCode::kConnectionFailed || error.code == HubErrorCode::kTimeout) {
        return 2;
    }
    return 1;
}

int reportError(const std::string& what, const HubError& error) {
    std::cerr << "Error: " << what << ": " << error.describe() << std::endl;
    return exitCodeFor(error);
}

std::string formatBytes(uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
    }
    return oss.str();
}

}  // namespace commands
}  // namespace cli
}  // namespace hubcache
