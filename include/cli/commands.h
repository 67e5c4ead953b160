// CLI command function declarations
#pragma once

#include <string>

#include "download/downloader.h"
#include "hub/hub_error.h"
#include "utils/cli.h"
#include "utils/config.h"

namespace hubcache {
namespace cli {
namespace commands {

// Every command returns an exit code: 0=success, 1=error, 2=connection error.

int download(const HubConfig& config, const DownloadOptions& options);
int snapshot(const HubConfig& config, const SnapshotOptions& options);
int resume(const HubConfig& config, const ResumeOptions& options);
int cat(const HubConfig& config, const CatOptions& options);

int stats(const HubConfig& config);
int clear(const HubConfig& config, const ClearOptions& options);
int evict(const HubConfig& config, const EvictCliOptions& options);
int verify(const HubConfig& config);

int fingerprint(const FingerprintOptions& options);
int upload(const HubConfig& config, const UploadOptions& options);

// shared helpers
DownloaderOptions downloaderOptions(const HubConfig& config);
std::string userAgent();
int exitCodeFor(const HubError& error);
// Prints "Error: <what>: <error>" to stderr and returns exitCodeFor(error).
int reportError(const std::string& what, const HubError& error);
std::string formatBytes(uint64_t bytes);

}  // namespace commands
}  // namespace cli
}  // namespace hubcache
