#include "transfer/lfs_transfer.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <nlohmann/json.hpp>
#include <regex>
#include <spdlog/spdlog.h>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "hub/token_provider.h"
#include "transfer/http_transport.h"
#include "utils/glob.h"
#include "utils/http_url.h"

namespace hubcache {

namespace {

bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<TransferAction> parseAction(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    TransferAction action;
    action.href = j.value("href", std::string{});
    if (j.contains("header") && j["header"].is_object()) {
        for (auto it = j["header"].begin(); it != j["header"].end(); ++it) {
            if (it.value().is_string()) {
                action.header[it.key()] = it.value().get<std::string>();
            } else if (it.value().is_number_integer()) {
                action.header[it.key()] = std::to_string(it.value().get<int64_t>());
            }
        }
    }
    return action;
}

HubError parseBatchResponse(const nlohmann::json& j, BatchResponse& out) {
    if (!j.is_object() || !j.contains("objects") || !j["objects"].is_array()) {
        return HubError::make(HubErrorCode::kInvalidResponse, "batch response has no objects array");
    }
    out.transfer = j.value("transfer", std::string("basic"));
    out.objects.clear();
    for (const auto& o : j["objects"]) {
        if (!o.is_object()) continue;
        TransferObject obj;
        obj.oid = o.value("oid", std::string{});
        obj.size = o.value("size", static_cast<uint64_t>(0));
        if (o.contains("actions") && o["actions"].is_object()) {
            const auto& actions = o["actions"];
            if (actions.contains("upload")) obj.upload = parseAction(actions["upload"]);
            if (actions.contains("verify")) obj.verify = parseAction(actions["verify"]);
        }
        if (o.contains("error") && o["error"].is_object()) {
            obj.error = HubError::make(HubErrorCode::kTransferFailed,
                                       o["error"].value("message", std::string("object rejected")),
                                       o["error"].value("code", 0));
        }
        out.objects.push_back(std::move(obj));
    }
    return {};
}

HttpRequest bodyRequest(const UploadItem& item, uint64_t offset, uint64_t length) {
    HttpRequest req;
    if (!item.local_path.empty()) {
        req.file_body = FileSlice{item.local_path, offset, length};
    } else {
        req.body = item.content.substr(static_cast<size_t>(offset), static_cast<size_t>(length));
    }
    return req;
}

HubError transferFailure(const HttpResponse& res, const std::string& what) {
    if (!res.received()) return res.error;
    auto err = HubError::make(HubErrorCode::kTransferFailed,
                              what + " failed with status " + std::to_string(res.status), res.status);
    err.body = res.body;
    return err;
}

}  // namespace

const char* toString(TransferState state) {
    switch (state) {
        case TransferState::Pending:
            return "pending";
        case TransferState::Negotiated:
            return "negotiated";
        case TransferState::Skipped:
            return "skipped";
        case TransferState::Uploading:
            return "uploading";
        case TransferState::Uploaded:
            return "uploaded";
        case TransferState::VerifyPending:
            return "verify_pending";
        case TransferState::Verified:
            return "verified";
        case TransferState::Failed:
            return "failed";
    }
    return "pending";
}

std::optional<UploadItem> uploadItemFromPath(const std::string& path_in_repo,
                                             const std::filesystem::path& local_path,
                                             HubError* error) {
    auto fp = fingerprintFromPath(local_path, error);
    if (!fp) return std::nullopt;
    UploadItem item;
    item.path_in_repo = path_in_repo;
    item.local_path = local_path;
    item.fingerprint = std::move(*fp);
    return item;
}

UploadItem uploadItemFromBytes(const std::string& path_in_repo, std::string content) {
    UploadItem item;
    item.path_in_repo = path_in_repo;
    item.fingerprint = fingerprintFromBytes(content);
    item.content = std::move(content);
    return item;
}

std::optional<uint64_t> multipartChunkSize(const TransferAction& action) {
    for (const auto& kv : action.header) {
        const auto key = toLowerAscii(kv.first);
        if (key != "chunk_size" && key != "x-amz-meta-chunk-size") continue;
        try {
            const auto value = std::stoull(kv.second);
            if (value > 0) return static_cast<uint64_t>(value);
        } catch (const std::exception&) {
            spdlog::warn("LfsTransfer: invalid chunk size '{}'", kv.second);
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::vector<std::string> multipartPartUrls(const TransferAction& action) {
    static const std::regex part_re(R"(^x-amz-meta-part-(\d+)-url$)");
    std::vector<std::pair<uint64_t, std::string>> parts;
    for (const auto& kv : action.header) {
        const auto key = toLowerAscii(kv.first);
        std::smatch m;
        if (isDigits(key)) {
            parts.emplace_back(std::stoull(key), kv.second);
        } else if (std::regex_match(key, m, part_re)) {
            parts.emplace_back(std::stoull(m[1].str()), kv.second);
        }
    }
    std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<std::string> urls;
    urls.reserve(parts.size());
    for (auto& p : parts) urls.push_back(std::move(p.second));
    return urls;
}

LfsTransfer::LfsTransfer(std::string endpoint, HttpTransport& transport, const TokenProvider* tokens)
    : endpoint_(trimTrailingSlash(std::move(endpoint))), transport_(transport), tokens_(tokens) {}

HubError LfsTransfer::negotiate(const std::string& repo_id,
                                RepoType kind,
                                const std::vector<ContentFingerprint>& objects,
                                BatchResponse& response) {
    nlohmann::json body;
    body["operation"] = "upload";
    body["transfers"] = {"basic", "multipart"};
    body["hash_algo"] = "sha256";
    body["objects"] = nlohmann::json::array();
    for (const auto& fp : objects) {
        body["objects"].push_back({{"oid", fingerprintHex(fp)}, {"size", fp.size}});
    }

    HttpRequest req;
    req.method = "POST";
    req.url = PathResolver::lfsBatchUrl(endpoint_, repo_id, kind);
    req.headers.emplace("Accept", kLfsMediaType);
    if (tokens_) {
        if (auto token = tokens_->token()) {
            req.headers.emplace("Authorization", "Bearer " + *token);
        }
    }
    req.content_type = kLfsMediaType;
    req.body = body.dump();

    auto res = transport_.send(req);
    if (!res.received()) {
        return res.error;
    }
    if (!res.is_success()) {
        spdlog::warn("LfsTransfer: batch negotiation for {} failed status={}", repo_id, res.status);
        return HubError::fromStatus(res.status, res.body);
    }

    auto parsed = nlohmann::json::parse(res.body, nullptr, false);
    if (parsed.is_discarded()) {
        return HubError::make(HubErrorCode::kInvalidResponse, "batch response is not valid JSON", res.status);
    }
    try {
        return parseBatchResponse(parsed, response);
    } catch (const nlohmann::json::exception& e) {
        return HubError::make(HubErrorCode::kInvalidResponse, std::string("malformed batch response: ") + e.what());
    }
}

HubError LfsTransfer::uploadSinglePart(UploadItem& item, const TransferAction& upload) {
    HttpRequest req = bodyRequest(item, 0, item.fingerprint.size);
    req.method = "PUT";
    req.url = upload.href;
    for (const auto& kv : upload.header) {
        req.headers.emplace(kv.first, kv.second);
    }
    auto res = transport_.send(req);
    if (!res.is_success()) {
        return transferFailure(res, "upload of " + item.path_in_repo);
    }
    return {};
}

HubError LfsTransfer::uploadMultipart(UploadItem& item, const TransferAction& upload, uint64_t chunk_size) {
    const auto urls = multipartPartUrls(upload);
    const uint64_t size = item.fingerprint.size;
    const uint64_t expected_parts = (size + chunk_size - 1) / chunk_size;
    if (urls.size() != expected_parts) {
        return HubError::make(HubErrorCode::kTransferFailed,
                              "multipart upload of " + item.path_in_repo + " expects " +
                                  std::to_string(expected_parts) + " parts, server gave " +
                                  std::to_string(urls.size()));
    }

    nlohmann::json parts = nlohmann::json::array();
    for (size_t i = 0; i < urls.size(); ++i) {
        const uint64_t offset = static_cast<uint64_t>(i) * chunk_size;
        const uint64_t length = std::min(chunk_size, size - offset);
        HttpRequest req = bodyRequest(item, offset, length);
        req.method = "PUT";
        req.url = urls[i];
        auto res = transport_.send(req);
        if (!res.is_success()) {
            return transferFailure(res, "part " + std::to_string(i + 1) + " of " + item.path_in_repo);
        }
        parts.push_back({{"partNumber", i + 1}, {"etag", res.header("ETag")}});
    }

    HttpRequest complete;
    complete.method = "POST";
    complete.url = upload.href;
    complete.content_type = "application/json";
    complete.body = nlohmann::json{{"oid", fingerprintHex(item.fingerprint)}, {"parts", parts}}.dump();
    auto res = transport_.send(complete);
    if (!res.is_success()) {
        return transferFailure(res, "multipart completion of " + item.path_in_repo);
    }
    return {};
}

HubError LfsTransfer::uploadOne(UploadItem& item, const TransferAction& upload) {
    item.state = TransferState::Uploading;
    HubError err;
    if (auto chunk = multipartChunkSize(upload)) {
        err = uploadMultipart(item, upload, *chunk);
    } else {
        err = uploadSinglePart(item, upload);
    }
    if (!err.ok()) {
        item.state = TransferState::Failed;
        item.error = err;
        spdlog::warn("LfsTransfer: {}", err.describe());
        return err;
    }
    item.state = TransferState::Uploaded;
    item.uploaded = true;
    return {};
}

HubError LfsTransfer::verifyOne(UploadItem& item, const TransferAction& verify) {
    item.state = TransferState::VerifyPending;
    HttpRequest req;
    req.method = "POST";
    req.url = verify.href;
    for (const auto& kv : verify.header) {
        req.headers.emplace(kv.first, kv.second);
    }
    req.content_type = "application/json";
    req.body = nlohmann::json{{"oid", fingerprintHex(item.fingerprint)}, {"size", item.fingerprint.size}}.dump();

    auto res = transport_.send(req);
    if (!res.is_success()) {
        HubError err = res.received()
                           ? HubError::make(HubErrorCode::kVerifyFailed,
                                            "verify of " + item.path_in_repo + " failed", res.status)
                           : res.error;
        err.body = res.body;
        item.state = TransferState::Failed;
        item.error = err;
        return err;
    }
    item.state = TransferState::Verified;
    return {};
}

UploadBatchResult LfsTransfer::uploadBatch(const std::string& repo_id,
                                           RepoType kind,
                                           std::vector<UploadItem>& items,
                                           size_t concurrency) {
    UploadBatchResult result;
    if (items.empty()) {
        result.success = true;
        return result;
    }

    std::vector<ContentFingerprint> objects;
    std::unordered_set<std::string> seen;
    for (auto& item : items) {
        item.state = TransferState::Pending;
        item.error = {};
        if (seen.insert(fingerprintHex(item.fingerprint)).second) {
            objects.push_back(item.fingerprint);
        }
    }

    BatchResponse batch;
    auto err = negotiate(repo_id, kind, objects, batch);
    if (!err.ok()) {
        for (auto& item : items) {
            item.state = TransferState::Failed;
            item.error = err;
        }
        result.error = err;
        return result;
    }

    std::unordered_map<std::string, const TransferObject*> by_oid;
    for (const auto& obj : batch.objects) {
        by_oid[obj.oid] = &obj;
    }

    struct UploadTask {
        UploadItem* item;
        const TransferObject* object;
        std::vector<UploadItem*> duplicates;
    };
    std::vector<UploadTask> tasks;
    std::unordered_map<std::string, size_t> task_by_oid;
    for (auto& item : items) {
        const std::string oid = fingerprintHex(item.fingerprint);
        auto it = by_oid.find(oid);
        if (it == by_oid.end()) {
            item.state = TransferState::Failed;
            item.error = HubError::make(HubErrorCode::kInvalidResponse,
                                        "batch response has no entry for " + item.path_in_repo);
            result.error = item.error;
            return result;
        }
        const TransferObject* obj = it->second;
        if (!obj->error.ok()) {
            item.state = TransferState::Failed;
            item.error = obj->error;
            result.error = obj->error;
            return result;
        }
        item.state = TransferState::Negotiated;
        if (!obj->upload) {
            item.state = TransferState::Skipped;
            item.uploaded = true;
            ++result.skipped;
            continue;
        }
        auto existing = task_by_oid.find(oid);
        if (existing != task_by_oid.end()) {
            tasks[existing->second].duplicates.push_back(&item);
            continue;
        }
        task_by_oid.emplace(oid, tasks.size());
        tasks.push_back(UploadTask{&item, obj, {}});
    }
    spdlog::info("LfsTransfer: {} objects negotiated, {} to upload, {} already present",
                 items.size(), tasks.size(), result.skipped);

    std::atomic<bool> ok{true};
    std::atomic<size_t> index{0};
    std::atomic<size_t> uploaded{0};
    std::atomic<size_t> verified{0};
    std::mutex error_mutex;
    HubError first_error;

    const size_t conc = std::min(std::max<size_t>(1, concurrency), std::max<size_t>(1, tasks.size()));
    std::vector<std::thread> workers;
    workers.reserve(conc);
    for (size_t i = 0; i < conc; ++i) {
        workers.emplace_back([&]() {
            while (true) {
                size_t idx = index.fetch_add(1);
                if (idx >= tasks.size() || !ok.load()) break;
                UploadItem& item = *tasks[idx].item;
                const TransferObject& obj = *tasks[idx].object;

                HubError task_err = uploadOne(item, *obj.upload);
                if (task_err.ok()) {
                    uploaded.fetch_add(1);
                    if (obj.verify) {
                        task_err = verifyOne(item, *obj.verify);
                        if (task_err.ok()) verified.fetch_add(1);
                    }
                }
                if (!task_err.ok()) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (first_error.ok()) first_error = task_err;
                    ok.store(false);
                    break;
                }
            }
        });
    }
    for (auto& th : workers) {
        if (th.joinable()) th.join();
    }

    // items sharing an object id take the outcome of the one that was sent
    for (auto& task : tasks) {
        for (UploadItem* dup : task.duplicates) {
            dup->state = task.item->state;
            dup->uploaded = task.item->uploaded;
            dup->error = task.item->error;
        }
    }

    result.uploaded = uploaded.load();
    result.verified = verified.load();
    if (!ok.load()) {
        result.error = first_error;
        spdlog::warn("LfsTransfer: batch for {} aborted: {}", repo_id, first_error.describe());
        return result;
    }
    result.success = true;
    return result;
}

}  // namespace hubcache
