// Downloader - cached, locked, streaming and resumable downloads from the hub.
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <httplib.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cache/path_resolver.h"
#include "download/download_stream.h"
#include "hub/hub_error.h"

namespace hubcache {

class ArchiveExtractor;
class JsonRequester;
class LockManager;
class TokenProvider;

constexpr const char* kDefaultEndpoint = "https://huggingface.co";

struct DownloaderOptions {
    std::filesystem::path cache_dir;
    std::string endpoint{kDefaultEndpoint};
    std::chrono::milliseconds timeout{std::chrono::milliseconds(30000)};
    std::chrono::milliseconds stream_chunk_timeout{kDefaultStreamChunkTimeout};
    size_t stream_queue_chunks{kDefaultStreamQueueChunks};
    bool write_checksums{true};
    std::string user_agent{"hubcache"};
};

struct DownloadRequest {
    std::string url;
    std::filesystem::path destination;
    httplib::Headers headers;
    bool resumable{false};
    bool force{false};
    // Lock key; the destination path is used when empty.
    std::string lock_repo;
    std::string lock_filename;
    std::string expected_sha256;
};

struct DownloadResult {
    bool success{false};
    std::filesystem::path path;
    std::filesystem::path extracted_path;  // set when an archive was extracted
    bool from_cache{false};
    uint64_t bytes_written{0};
    std::string sha256;  // empty for cache hits
    HubError error;
};

struct FileRequest {
    std::string repo_id;
    std::string filename;
    RepoType kind{RepoType::Model};
    std::string revision{kDefaultRevision};
    bool force{false};
    bool resumable{false};
    std::optional<std::string> token;  // overrides the TokenProvider
    bool extract{false};
    std::string expected_sha256;
};

struct SnapshotRequest {
    std::string repo_id;
    RepoType kind{RepoType::Model};
    std::string revision{kDefaultRevision};
    std::vector<std::string> allow_patterns;
    std::vector<std::string> ignore_patterns;
    bool force{false};
};

struct SnapshotResult {
    bool success{false};
    std::filesystem::path snapshot_dir;
    std::vector<std::string> files;  // after filtering
    size_t downloaded{0};
    size_t cached{0};
    HubError error;
};

enum class ResumeStatus {
    Fresh,      // nothing local, full body written
    Resumed,    // 206, body appended
    Complete,   // 416, local file left untouched
    Restarted,  // 200 to a ranged request, body written from byte 0
};

const char* toString(ResumeStatus status);

struct ResumeResult {
    bool success{false};
    ResumeStatus status{ResumeStatus::Fresh};
    uint64_t bytes_written{0};
    uint64_t final_size{0};
    HubError error;
};

class Downloader {
public:
    Downloader(DownloaderOptions options, LockManager& locks, const TokenProvider* tokens = nullptr);

    DownloadResult download(const DownloadRequest& request);
    DownloadResult downloadFile(const FileRequest& request);
    SnapshotResult snapshotDownload(const SnapshotRequest& request, JsonRequester& requester);

    // Not cached and not locked; the caller owns the stream.
    std::unique_ptr<DownloadStream> downloadStream(const std::string& url, httplib::Headers headers = {});

    // Resumes into path in place (no .incomplete file).
    ResumeResult resumeDownload(const std::string& url,
                                const std::filesystem::path& path,
                                httplib::Headers headers = {});

    void setArchiveExtractor(ArchiveExtractor* extractor) { extractor_ = extractor; }
    const DownloaderOptions& options() const { return options_; }

private:
    struct FetchOutcome {
        HubError error;
        int status{0};
        bool appended{false};
        uint64_t bytes_written{0};
        std::string sha256;  // streamed digest, empty when appended
    };

    FetchOutcome fetch(const std::string& url,
                       const httplib::Headers& headers,
                       const std::filesystem::path& path,
                       uint64_t offset);
    ResumeResult resumeInto(const std::string& url,
                            const httplib::Headers& headers,
                            const std::filesystem::path& path);
    httplib::Headers withDefaults(httplib::Headers headers, const std::optional<std::string>& token) const;
    HubError writeChecksum(const std::filesystem::path& file, const std::string& sha256) const;

    DownloaderOptions options_;
    LockManager& locks_;
    const TokenProvider* tokens_;
    ArchiveExtractor* extractor_{nullptr};
};

}  // namespace hubcache
