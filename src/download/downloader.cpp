#include "download/downloader.h"

#include <fstream>
#include <spdlog/spdlog.h>

#include "cache/lock_manager.h"
#include "hub/archive_extractor.h"
#include "hub/json_client.h"
#include "hub/repo_listing.h"
#include "hub/token_provider.h"
#include "utils/glob.h"
#include "utils/http_url.h"
#include "utils/sha256.h"

namespace fs = std::filesystem;

namespace hubcache {

namespace {

uint64_t fileSizeOrZero(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return 0;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

bool hasHeader(const httplib::Headers& headers, const std::string& name) {
    const auto wanted = toLowerAscii(name);
    for (const auto& kv : headers) {
        if (toLowerAscii(kv.first) == wanted) return true;
    }
    return false;
}

// Requests that do not name a repo/file pair lock on the destination path.
std::pair<std::string, std::string> lockKeyFor(const std::string& repo,
                                               const std::string& filename,
                                               const fs::path& destination) {
    if (!repo.empty() && !filename.empty()) {
        return {repo, filename};
    }
    std::error_code ec;
    auto absolute = fs::absolute(destination, ec);
    return {"local", (ec ? destination : absolute).lexically_normal().string()};
}

HubError ensureParentDir(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) return {};
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return HubError::make(HubErrorCode::kIoError, "failed to create " + parent.string() + ": " + ec.message());
    }
    return {};
}

}  // namespace

const char* toString(ResumeStatus status) {
    switch (status) {
        case ResumeStatus::Fresh:
            return "fresh";
        case ResumeStatus::Resumed:
            return "resumed";
        case ResumeStatus::Complete:
            return "complete";
        case ResumeStatus::Restarted:
            return "restarted";
    }
    return "fresh";
}

Downloader::Downloader(DownloaderOptions options, LockManager& locks, const TokenProvider* tokens)
    : options_(std::move(options)), locks_(locks), tokens_(tokens) {
    options_.endpoint = trimTrailingSlash(options_.endpoint);
}

httplib::Headers Downloader::withDefaults(httplib::Headers headers, const std::optional<std::string>& token) const {
    if (!hasHeader(headers, "User-Agent")) {
        headers.emplace("User-Agent", options_.user_agent);
    }
    if (!hasHeader(headers, "Authorization")) {
        std::optional<std::string> bearer = token;
        if (!bearer && tokens_) bearer = tokens_->token();
        if (bearer && !bearer->empty()) {
            headers.emplace("Authorization", "Bearer " + *bearer);
        }
    }
    return headers;
}

Downloader::FetchOutcome Downloader::fetch(const std::string& url,
                                           const httplib::Headers& headers,
                                           const fs::path& path,
                                           uint64_t offset) {
    FetchOutcome out;
    HttpUrl parsed = parseUrl(url);
    auto client = makeClient(parsed, options_.timeout);
    if (!client) {
        out.error = HubError::make(HubErrorCode::kConnectionFailed, "failed to create HTTP client for " + url);
        spdlog::warn("Downloader: failed to create HTTP client for url='{}'", url);
        return out;
    }

    httplib::Headers request_headers = headers;
    if (offset > 0) {
        request_headers.emplace("Range", "bytes=" + std::to_string(offset) + "-");
    }

    std::ofstream ofs;
    Sha256Hasher hasher;
    bool write_failed = false;

    auto result = client->Get(
        parsed.path,
        request_headers,
        [&](const httplib::Response& res) {
            out.status = res.status;
            if (res.status == 206 && offset > 0) {
                out.appended = true;
                ofs.open(path, std::ios::binary | std::ios::app);
            } else if (res.status >= 200 && res.status < 300) {
                // also covers a 200 to a ranged request: the body starts at byte 0
                ofs.open(path, std::ios::binary | std::ios::trunc);
            } else {
                return false;
            }
            if (!ofs.is_open()) {
                write_failed = true;
                return false;
            }
            return true;
        },
        [&](const char* data, size_t data_length) {
            ofs.write(data, static_cast<std::streamsize>(data_length));
            if (!ofs) {
                write_failed = true;
                return false;
            }
            if (!out.appended) hasher.update(data, data_length);
            out.bytes_written += data_length;
            return true;
        });

    if (ofs.is_open()) {
        ofs.flush();
        if (!ofs) write_failed = true;
        ofs.close();
    }

    if (write_failed) {
        out.error = HubError::make(HubErrorCode::kIoError, "failed to write " + path.string());
        return out;
    }
    if (out.status != 0 && (out.status < 200 || out.status >= 300)) {
        out.error = HubError::fromStatus(out.status);
        spdlog::debug("Downloader: GET {} -> {}", url, out.status);
        return out;
    }
    if (!result) {
        out.error = HubError::make(HubErrorCode::kConnectionFailed,
                                   "GET " + url + " failed: " + httplib::to_string(result.error()));
        spdlog::warn("Downloader: {}", out.error.message);
        return out;
    }
    if (!out.appended) {
        out.sha256 = hasher.finishHex();
    }
    return out;
}

ResumeResult Downloader::resumeInto(const std::string& url,
                                    const httplib::Headers& headers,
                                    const fs::path& path) {
    ResumeResult result;
    const uint64_t existing = fileSizeOrZero(path);
    auto fetched = fetch(url, headers, path, existing);

    if (existing > 0 && fetched.status == 416) {
        result.success = true;
        result.status = ResumeStatus::Complete;
        result.final_size = existing;
        return result;
    }
    if (!fetched.error.ok()) {
        result.error = fetched.error;
        return result;
    }

    if (existing == 0) {
        result.status = ResumeStatus::Fresh;
    } else if (fetched.appended) {
        result.status = ResumeStatus::Resumed;
    } else {
        spdlog::warn("Downloader: server ignored Range for {}, rewrote {} from byte 0", url, path.string());
        result.status = ResumeStatus::Restarted;
    }
    result.success = true;
    result.bytes_written = fetched.bytes_written;
    result.final_size = fileSizeOrZero(path);
    return result;
}

HubError Downloader::writeChecksum(const fs::path& file, const std::string& sha256) const {
    const auto sidecar = PathResolver::checksumPath(file);
    std::ofstream ofs(sidecar, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        return HubError::make(HubErrorCode::kIoError, "failed to open " + sidecar.string());
    }
    ofs << sha256;
    ofs.flush();
    if (!ofs) {
        return HubError::make(HubErrorCode::kIoError, "failed to write " + sidecar.string());
    }
    return {};
}

DownloadResult Downloader::download(const DownloadRequest& request) {
    DownloadResult result;
    result.path = request.destination;
    if (request.destination.empty()) {
        result.error = HubError::make(HubErrorCode::kIoError, "destination is empty");
        return result;
    }

    std::error_code ec;
    if (!request.force && fs::exists(request.destination, ec)) {
        result.success = true;
        result.from_cache = true;
        return result;
    }

    if (auto err = ensureParentDir(request.destination); !err.ok()) {
        result.error = err;
        return result;
    }

    const auto key = lockKeyFor(request.lock_repo, request.lock_filename, request.destination);
    HubError lock_error;
    auto token = locks_.acquire(key.first, key.second, &lock_error);
    if (!token) {
        result.error = lock_error;
        return result;
    }
    ScopedLock guard(locks_, *token);

    // another task may have finished the same file while we waited
    if (!request.force && fs::exists(request.destination, ec)) {
        result.success = true;
        result.from_cache = true;
        return result;
    }

    const auto headers = withDefaults(request.headers, std::nullopt);
    const auto partial = PathResolver::incompletePath(request.destination);
    std::string digest;

    if (request.resumable) {
        auto resumed = resumeInto(request.url, headers, partial);
        if (!resumed.success) {
            result.error = resumed.error;
            return result;
        }
        result.bytes_written = resumed.bytes_written;
    } else {
        fs::remove(partial, ec);
        auto fetched = fetch(request.url, headers, partial, 0);
        if (!fetched.error.ok()) {
            fs::remove(partial, ec);
            result.error = fetched.error;
            return result;
        }
        result.bytes_written = fetched.bytes_written;
        digest = fetched.sha256;
    }

    if (digest.empty() && (options_.write_checksums || !request.expected_sha256.empty())) {
        digest = sha256_file(partial);
        if (digest.empty()) {
            result.error = HubError::make(HubErrorCode::kIoError, "failed to hash " + partial.string());
            return result;
        }
    }

    if (!request.expected_sha256.empty() && toLowerAscii(trimAscii(request.expected_sha256)) != digest) {
        spdlog::warn("Downloader: checksum mismatch for {} (expected={}, actual={})",
                     request.destination.string(), request.expected_sha256, digest);
        fs::remove(partial, ec);
        result.error = HubError::make(HubErrorCode::kChecksumMismatch, "sha256 mismatch for " + request.url);
        return result;
    }

    fs::rename(partial, request.destination, ec);
    if (ec) {
        result.error = HubError::make(HubErrorCode::kIoError,
                                      "failed to move " + partial.string() + " into place: " + ec.message());
        return result;
    }

    if (options_.write_checksums) {
        auto err = writeChecksum(request.destination, digest);
        if (!err.ok()) {
            spdlog::warn("Downloader: {}", err.describe());
        }
    }

    auto released = guard.release();
    if (!released.ok()) {
        spdlog::warn("Downloader: lock release failed for {}: {}", request.destination.string(), released.describe());
    }

    result.success = true;
    result.sha256 = digest;
    spdlog::info("Downloader: downloaded {} ({} bytes)", request.destination.string(), result.bytes_written);
    return result;
}

DownloadResult Downloader::downloadFile(const FileRequest& request) {
    if (request.repo_id.empty() || request.filename.empty()) {
        DownloadResult result;
        result.error = HubError::make(HubErrorCode::kNotFound, "repo_id and filename are required");
        return result;
    }

    const std::string revision = request.revision.empty() ? std::string(kDefaultRevision) : request.revision;

    DownloadRequest dl;
    dl.url = PathResolver::resolveUrl(options_.endpoint, request.repo_id, request.kind, revision, request.filename);
    dl.destination = PathResolver::filePath(options_.cache_dir, request.repo_id, request.kind, request.filename, revision);
    dl.headers = withDefaults({}, request.token);
    dl.resumable = request.resumable;
    dl.force = request.force;
    dl.lock_repo = request.repo_id;
    dl.lock_filename = request.filename;
    dl.expected_sha256 = request.expected_sha256;

    auto result = download(dl);
    if (!result.success || !request.extract) {
        return result;
    }
    if (!extractor_) {
        spdlog::warn("Downloader: extract requested for {} but no extractor is installed", request.filename);
        return result;
    }

    const auto target = defaultExtractPath(result.path);
    auto err = extractor_->extract(result.path, target);
    if (!err.ok()) {
        result.success = false;
        result.error = err;
        return result;
    }
    result.extracted_path = target;
    return result;
}

SnapshotResult Downloader::snapshotDownload(const SnapshotRequest& request, JsonRequester& requester) {
    SnapshotResult out;
    const std::string revision = request.revision.empty() ? std::string(kDefaultRevision) : request.revision;
    out.snapshot_dir = PathResolver::snapshotDir(options_.cache_dir, request.repo_id, request.kind, revision);

    auto listing = requester.request(HttpMethod::Get,
                                     PathResolver::revisionInfoPath(request.repo_id, request.kind, revision));
    if (!listing.success) {
        out.error = listing.error;
        spdlog::warn("Downloader: listing {} failed: {}", request.repo_id, out.error.describe());
        return out;
    }

    std::vector<std::string> all_files;
    auto parse_error = parseRepoListing(listing.body, all_files);
    if (!parse_error.ok()) {
        out.error = parse_error;
        return out;
    }

    for (const auto& file : all_files) {
        if (passesPatternFilter(file, request.allow_patterns, request.ignore_patterns)) {
            out.files.push_back(file);
        }
    }
    spdlog::info("Downloader: snapshot {}@{} files={} (listed={})",
                 request.repo_id, revision, out.files.size(), all_files.size());

    for (const auto& file : out.files) {
        FileRequest fr;
        fr.repo_id = request.repo_id;
        fr.filename = file;
        fr.kind = request.kind;
        fr.revision = revision;
        fr.force = request.force;
        auto r = downloadFile(fr);
        if (!r.success) {
            out.error = r.error;
            spdlog::warn("Downloader: snapshot aborted at {}: {}", file, r.error.describe());
            return out;
        }
        if (r.from_cache) {
            ++out.cached;
        } else {
            ++out.downloaded;
        }
    }

    std::error_code ec;
    fs::create_directories(out.snapshot_dir, ec);
    if (ec) {
        out.error = HubError::make(HubErrorCode::kIoError, "failed to create " + out.snapshot_dir.string());
        return out;
    }
    out.success = true;
    return out;
}

std::unique_ptr<DownloadStream> Downloader::downloadStream(const std::string& url, httplib::Headers headers) {
    HttpUrl parsed = parseUrl(url);
    auto client = makeClient(parsed, options_.timeout);
    if (!client) {
        return std::make_unique<DownloadStream>(
            HubError::make(HubErrorCode::kConnectionFailed, "failed to create HTTP client for " + url));
    }
    return std::make_unique<DownloadStream>(std::move(client),
                                            parsed.path,
                                            withDefaults(std::move(headers), std::nullopt),
                                            options_.stream_chunk_timeout,
                                            options_.stream_queue_chunks);
}

ResumeResult Downloader::resumeDownload(const std::string& url, const fs::path& path, httplib::Headers headers) {
    ResumeResult result;
    if (path.empty()) {
        result.error = HubError::make(HubErrorCode::kIoError, "path is empty");
        return result;
    }
    if (auto err = ensureParentDir(path); !err.ok()) {
        result.error = err;
        return result;
    }

    const auto key = lockKeyFor({}, {}, path);
    HubError lock_error;
    auto token = locks_.acquire(key.first, key.second, &lock_error);
    if (!token) {
        result.error = lock_error;
        return result;
    }
    ScopedLock guard(locks_, *token);

    result = resumeInto(url, withDefaults(std::move(headers), std::nullopt), path);

    auto released = guard.release();
    if (!released.ok()) {
        spdlog::warn("Downloader: lock release failed for {}: {}", path.string(), released.describe());
    }
    if (result.success) {
        spdlog::info("Downloader: resume {} -> {} ({} bytes)", path.string(), toString(result.status), result.final_size);
    }
    return result;
}

}  // namespace hubcache
