// fingerprint / upload

#include <filesystem>
#include <iostream>

#include "cli/commands.h"
#include "hub/token_provider.h"
#include "transfer/content_fingerprint.h"
#include "transfer/http_transport.h"
#include "transfer/lfs_transfer.h"

namespace hubcache {
namespace cli {
namespace commands {

int fingerprint(const FingerprintOptions& options) {
    int rc = 0;
    for (const auto& path : options.paths) {
        HubError err;
        auto fp = fingerprintFromPath(path, &err);
        if (!fp) {
            rc = reportError("fingerprint " + path, err);
            continue;
        }
        std::cout << fingerprintHex(*fp) << "  " << fp->size << "  " << path << "\n";
    }
    std::cout.flush();
    return rc;
}

int upload(const HubConfig& config, const UploadOptions& options) {
    std::vector<UploadItem> items;
    items.reserve(options.paths.size());
    for (const auto& path : options.paths) {
        HubError err;
        auto item = uploadItemFromPath(std::filesystem::path(path).filename().string(), path, &err);
        if (!item) {
            return reportError("read " + path, err);
        }
        items.push_back(std::move(*item));
    }

    EnvTokenProvider tokens;
    HttplibTransport transport(config.timeout);
    LfsTransfer transfer(config.endpoint, transport, &tokens);

    const size_t concurrency = options.concurrency > 0 ? options.concurrency : config.upload_concurrency;
    auto result = transfer.uploadBatch(options.repo.repo_id, options.repo.kind, items, concurrency);

    for (const auto& item : items) {
        std::cout << toString(item.state) << "  " << fingerprintHex(item.fingerprint) << "  " << item.path_in_repo
                  << "\n";
    }
    std::cout.flush();
    if (!result.success) {
        return reportError("upload to " + options.repo.repo_id, result.error);
    }
    std::cerr << result.uploaded << " uploaded, " << result.skipped << " already present, " << result.verified
              << " verified" << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace hubcache
