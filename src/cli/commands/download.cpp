// download / snapshot / resume / cat

#include <iostream>

#include "cache/lock_manager.h"
#include "cli/commands.h"
#include "hub/json_client.h"
#include "hub/token_provider.h"

namespace hubcache {
namespace cli {
namespace commands {

int download(const HubConfig& config, const DownloadOptions& options) {
    LockManager locks(config.cache_dir, config.lock_backoff);
    EnvTokenProvider tokens;
    Downloader downloader(downloaderOptions(config), locks, &tokens);

    FileRequest req;
    req.repo_id = options.repo.repo_id;
    req.kind = options.repo.kind;
    req.revision = options.repo.revision;
    req.filename = options.filename;
    req.force = options.force;
    req.resumable = options.resumable;
    req.expected_sha256 = options.sha256;

    auto result = downloader.downloadFile(req);
    if (!result.success) {
        return reportError("download " + options.repo.repo_id + "/" + options.filename, result.error);
    }
    if (!result.from_cache) {
        std::cerr << "downloaded " << formatBytes(result.bytes_written) << std::endl;
    }
    std::cout << result.path.string() << std::endl;
    return 0;
}

int snapshot(const HubConfig& config, const SnapshotOptions& options) {
    LockManager locks(config.cache_dir, config.lock_backoff);
    EnvTokenProvider tokens;
    Downloader downloader(downloaderOptions(config), locks, &tokens);
    HttplibJsonRequester requester(config.endpoint, config.timeout, &tokens, userAgent());

    SnapshotRequest req;
    req.repo_id = options.repo.repo_id;
    req.kind = options.repo.kind;
    req.revision = options.repo.revision;
    req.allow_patterns = options.allow_patterns;
    req.ignore_patterns = options.ignore_patterns;
    req.force = options.force;

    auto result = downloader.snapshotDownload(req, requester);
    if (!result.success) {
        return reportError("snapshot " + options.repo.repo_id, result.error);
    }
    std::cerr << result.files.size() << " files (" << result.downloaded << " downloaded, " << result.cached
              << " cached)" << std::endl;
    std::cout << result.snapshot_dir.string() << std::endl;
    return 0;
}

int resume(const HubConfig& config, const ResumeOptions& options) {
    LockManager locks(config.cache_dir, config.lock_backoff);
    EnvTokenProvider tokens;
    Downloader downloader(downloaderOptions(config), locks, &tokens);

    auto result = downloader.resumeDownload(options.url, options.path);
    if (!result.success) {
        return reportError("resume " + options.url, result.error);
    }
    std::cout << toString(result.status) << " " << options.path << " (" << formatBytes(result.final_size) << ")"
              << std::endl;
    return 0;
}

int cat(const HubConfig& config, const CatOptions& options) {
    LockManager locks(config.cache_dir, config.lock_backoff);
    EnvTokenProvider tokens;
    Downloader downloader(downloaderOptions(config), locks, &tokens);

    const std::string url = !options.url.empty()
                                ? options.url
                                : PathResolver::resolveUrl(config.endpoint, options.repo.repo_id, options.repo.kind,
                                                           options.repo.revision, options.filename);
    auto stream = downloader.downloadStream(url);
    std::string chunk;
    while (stream->next(chunk)) {
        std::cout.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!std::cout) {
            stream->cancel();
            return 1;
        }
    }
    std::cout.flush();

    auto err = stream->error();
    if (!err.ok()) {
        return reportError("cat " + url, err);
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace hubcache
