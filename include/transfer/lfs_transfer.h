// LfsTransfer - two-phase large-file upload: batch negotiation, then per-object transfer and verify.
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cache/path_resolver.h"
#include "hub/hub_error.h"
#include "transfer/content_fingerprint.h"

namespace hubcache {

class HttpTransport;
class TokenProvider;

constexpr size_t kDefaultUploadConcurrency = 4;
constexpr const char* kLfsMediaType = "application/vnd.git-lfs+json";

enum class TransferState {
    Pending,
    Negotiated,
    Skipped,  // remote already holds the object
    Uploading,
    Uploaded,
    VerifyPending,
    Verified,
    Failed,
};

const char* toString(TransferState state);

struct UploadItem {
    std::string path_in_repo;
    std::filesystem::path local_path;  // streamed from disk when set
    std::string content;               // used when local_path is empty
    ContentFingerprint fingerprint;
    TransferState state{TransferState::Pending};
    bool uploaded{false};
    HubError error;
};

std::optional<UploadItem> uploadItemFromPath(const std::string& path_in_repo,
                                             const std::filesystem::path& local_path,
                                             HubError* error = nullptr);
UploadItem uploadItemFromBytes(const std::string& path_in_repo, std::string content);

struct TransferAction {
    std::string href;
    std::map<std::string, std::string> header;
};

struct TransferObject {
    std::string oid;
    uint64_t size{0};
    std::optional<TransferAction> upload;  // absent: already on the remote
    std::optional<TransferAction> verify;
    HubError error;                        // per-object error reported by the server
};

struct BatchResponse {
    std::string transfer{"basic"};
    std::vector<TransferObject> objects;
};

struct UploadBatchResult {
    bool success{false};
    size_t uploaded{0};
    size_t skipped{0};
    size_t verified{0};
    HubError error;  // first failure
};

class LfsTransfer {
public:
    LfsTransfer(std::string endpoint, HttpTransport& transport, const TokenProvider* tokens = nullptr);

    // One POST to the batch endpoint.
    HubError negotiate(const std::string& repo_id,
                       RepoType kind,
                       const std::vector<ContentFingerprint>& objects,
                       BatchResponse& response);

    // Single PUT, or a multipart sequence when the action carries a chunk size.
    HubError uploadOne(UploadItem& item, const TransferAction& upload);
    HubError verifyOne(UploadItem& item, const TransferAction& verify);

    // Negotiates once, then transfers with at most `concurrency` objects in flight.
    // The first failure stops remaining work; items keep their per-item state.
    UploadBatchResult uploadBatch(const std::string& repo_id,
                                  RepoType kind,
                                  std::vector<UploadItem>& items,
                                  size_t concurrency = kDefaultUploadConcurrency);

private:
    HubError uploadSinglePart(UploadItem& item, const TransferAction& upload);
    HubError uploadMultipart(UploadItem& item, const TransferAction& upload, uint64_t chunk_size);

    std::string endpoint_;
    HttpTransport& transport_;
    const TokenProvider* tokens_;
};

// chunk size from "chunk_size" or "x-amz-meta-chunk-size"; nullopt for single-part actions.
std::optional<uint64_t> multipartChunkSize(const TransferAction& action);
// Part URLs ordered by part number: numeric keys or "x-amz-meta-part-N-url".
std::vector<std::string> multipartPartUrls(const TransferAction& action);

}  // namespace hubcache
