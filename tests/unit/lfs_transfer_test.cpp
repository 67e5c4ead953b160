#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "hub/token_provider.h"
#include "transfer/http_transport.h"
#include "transfer/lfs_transfer.h"
#include "../test_support.h"

using namespace hubcache;
using json = nlohmann::json;

namespace {

constexpr const char* kEndpoint = "https://hub.test";
constexpr const char* kBatchUrl = "https://hub.test/user/repo.git/info/lfs/objects/batch";

// Records every request and answers through a test-supplied handler.
class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpResponse send(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (handler) return handler(request);
        HttpResponse res;
        res.status = 200;
        return res;
    }

    std::vector<HttpRequest> requestsTo(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<HttpRequest> out;
        for (const auto& r : requests) {
            if (r.url == url) out.push_back(r);
        }
        return out;
    }

    Handler handler;
    std::vector<HttpRequest> requests;

private:
    std::mutex mutex_;
};

HttpResponse ok(const std::string& body = {}, int status = 200) {
    HttpResponse res;
    res.status = status;
    res.body = body;
    return res;
}

std::string headerOf(const HttpRequest& req, const std::string& name) {
    auto it = req.headers.find(name);
    return it == req.headers.end() ? std::string() : it->second;
}

// Batch response where every object needs a basic upload (plus verify when asked).
json uploadObjects(const std::vector<UploadItem>& items, bool with_verify) {
    json objects = json::array();
    for (const auto& item : items) {
        const auto oid = fingerprintHex(item.fingerprint);
        json actions;
        actions["upload"] = {{"href", "https://storage.test/" + oid}, {"header", {{"X-Upload-Token", "t"}}}};
        if (with_verify) actions["verify"] = {{"href", "https://hub.test/verify/" + oid}};
        objects.push_back({{"oid", oid}, {"size", item.fingerprint.size}, {"actions", actions}});
    }
    return json{{"transfer", "basic"}, {"objects", objects}};
}

}  // namespace

TEST(LfsTransferTest, NegotiatePostsBatchRequest) {
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) { return ok(R"({"objects":[]})"); };
    StaticTokenProvider tokens("secret");
    LfsTransfer lfs(kEndpoint, transport, &tokens);

    auto item = uploadItemFromBytes("a.bin", "hello world");
    BatchResponse batch;
    auto err = lfs.negotiate("user/repo", RepoType::Model, {item.fingerprint}, batch);
    ASSERT_TRUE(err.ok()) << err.describe();

    ASSERT_EQ(transport.requests.size(), 1u);
    const auto& req = transport.requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, kBatchUrl);
    EXPECT_EQ(req.content_type, kLfsMediaType);
    EXPECT_EQ(headerOf(req, "Accept"), kLfsMediaType);
    EXPECT_EQ(headerOf(req, "Authorization"), "Bearer secret");

    auto body = json::parse(req.body);
    EXPECT_EQ(body["operation"], "upload");
    EXPECT_EQ(body["hash_algo"], "sha256");
    EXPECT_EQ(body["transfers"], json::array({"basic", "multipart"}));
    ASSERT_EQ(body["objects"].size(), 1u);
    EXPECT_EQ(body["objects"][0]["oid"], fingerprintHex(item.fingerprint));
    EXPECT_EQ(body["objects"][0]["size"], 11);
}

TEST(LfsTransferTest, NegotiateMapsErrors) {
    FakeTransport transport;
    LfsTransfer lfs(kEndpoint, transport);
    BatchResponse batch;

    transport.handler = [](const HttpRequest&) { return ok("denied", 403); };
    EXPECT_EQ(lfs.negotiate("user/repo", RepoType::Model, {}, batch).code, HubErrorCode::kForbidden);

    transport.handler = [](const HttpRequest&) { return ok("not json"); };
    EXPECT_EQ(lfs.negotiate("user/repo", RepoType::Model, {}, batch).code, HubErrorCode::kInvalidResponse);

    transport.handler = [](const HttpRequest&) { return ok(R"({"transfer":"basic"})"); };
    EXPECT_EQ(lfs.negotiate("user/repo", RepoType::Model, {}, batch).code, HubErrorCode::kInvalidResponse);

    transport.handler = [](const HttpRequest&) {
        HttpResponse res;
        res.error = HubError::make(HubErrorCode::kConnectionFailed, "refused");
        return res;
    };
    EXPECT_EQ(lfs.negotiate("user/repo", RepoType::Model, {}, batch).code, HubErrorCode::kConnectionFailed);
}

TEST(LfsTransferTest, ObjectsAlreadyPresentAreSkipped) {
    std::vector<UploadItem> items{uploadItemFromBytes("a.bin", "aaa"), uploadItemFromBytes("b.bin", "bbb")};
    json objects = json::array();
    for (const auto& item : items) {
        objects.push_back({{"oid", fingerprintHex(item.fingerprint)}, {"size", item.fingerprint.size}});
    }
    FakeTransport transport;
    transport.handler = [&](const HttpRequest&) { return ok(json{{"objects", objects}}.dump()); };
    LfsTransfer lfs(kEndpoint, transport);

    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    ASSERT_TRUE(result.success) << result.error.describe();
    EXPECT_EQ(result.skipped, 2u);
    EXPECT_EQ(result.uploaded, 0u);
    EXPECT_EQ(transport.requests.size(), 1u);
    for (const auto& item : items) {
        EXPECT_EQ(item.state, TransferState::Skipped);
        EXPECT_TRUE(item.uploaded);
    }
}

TEST(LfsTransferTest, UploadsAndVerifiesEachObject) {
    std::vector<UploadItem> items{uploadItemFromBytes("a.bin", "first payload"),
                                  uploadItemFromBytes("b.bin", "second payload")};
    const auto batch = uploadObjects(items, true);
    FakeTransport transport;
    transport.handler = [&](const HttpRequest& req) {
        if (req.url == kBatchUrl) return ok(batch.dump());
        return ok();
    };
    LfsTransfer lfs(kEndpoint, transport);

    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items, 2);
    ASSERT_TRUE(result.success) << result.error.describe();
    EXPECT_EQ(result.uploaded, 2u);
    EXPECT_EQ(result.verified, 2u);
    EXPECT_EQ(transport.requests.size(), 5u);

    const auto oid = fingerprintHex(items[0].fingerprint);
    auto puts = transport.requestsTo("https://storage.test/" + oid);
    ASSERT_EQ(puts.size(), 1u);
    EXPECT_EQ(puts[0].method, "PUT");
    EXPECT_EQ(puts[0].body, "first payload");
    EXPECT_EQ(headerOf(puts[0], "X-Upload-Token"), "t");

    auto verifies = transport.requestsTo("https://hub.test/verify/" + oid);
    ASSERT_EQ(verifies.size(), 1u);
    auto verify_body = json::parse(verifies[0].body);
    EXPECT_EQ(verify_body["oid"], oid);
    EXPECT_EQ(verify_body["size"], 13);

    for (const auto& item : items) {
        EXPECT_EQ(item.state, TransferState::Verified);
        EXPECT_TRUE(item.uploaded);
    }
}

TEST(LfsTransferTest, IdenticalContentIsSentOnce) {
    std::vector<UploadItem> items{uploadItemFromBytes("a.bin", "abc"), uploadItemFromBytes("copy/a.bin", "abc")};
    const auto batch = uploadObjects({items[0]}, true);
    FakeTransport transport;
    transport.handler = [&](const HttpRequest& req) {
        if (req.url == kBatchUrl) return ok(batch.dump());
        return ok();
    };
    LfsTransfer lfs(kEndpoint, transport);

    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items, 4);
    ASSERT_TRUE(result.success) << result.error.describe();
    EXPECT_EQ(result.uploaded, 1u);
    EXPECT_EQ(result.verified, 1u);

    const auto oid = fingerprintHex(items[0].fingerprint);
    EXPECT_EQ(transport.requestsTo("https://storage.test/" + oid).size(), 1u);
    EXPECT_EQ(transport.requestsTo("https://hub.test/verify/" + oid).size(), 1u);
    EXPECT_EQ(json::parse(transport.requestsTo(kBatchUrl)[0].body)["objects"].size(), 1u);
    for (const auto& item : items) {
        EXPECT_EQ(item.state, TransferState::Verified);
        EXPECT_TRUE(item.uploaded);
    }
}

TEST(LfsTransferTest, IdenticalContentSharesFailure) {
    std::vector<UploadItem> items{uploadItemFromBytes("a.bin", "abc"), uploadItemFromBytes("b.bin", "abc")};
    const auto batch = uploadObjects({items[0]}, false);
    FakeTransport transport;
    transport.handler = [&](const HttpRequest& req) {
        if (req.url == kBatchUrl) return ok(batch.dump());
        return ok("quota", 507);
    };
    LfsTransfer lfs(kEndpoint, transport);

    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.code, HubErrorCode::kTransferFailed);
    EXPECT_EQ(transport.requests.size(), 2u);
    for (const auto& item : items) {
        EXPECT_EQ(item.state, TransferState::Failed);
        EXPECT_FALSE(item.uploaded);
        EXPECT_EQ(item.error.status, 507);
    }
}

TEST(LfsTransferTest, UploadFromFileStreamsSlice) {
    test::TempDir tmp("lfs");
    const auto path = tmp.path / "weights.bin";
    test::writeFile(path, std::string(2048, 'w'));
    HubError err;
    auto item = uploadItemFromPath("weights.bin", path, &err);
    ASSERT_TRUE(item.has_value()) << err.describe();
    std::vector<UploadItem> items{*item};

    const auto batch = uploadObjects(items, false);
    FakeTransport transport;
    transport.handler = [&](const HttpRequest& req) {
        if (req.url == kBatchUrl) return ok(batch.dump());
        return ok();
    };
    LfsTransfer lfs(kEndpoint, transport);
    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    ASSERT_TRUE(result.success) << result.error.describe();

    const auto& put = transport.requests.back();
    ASSERT_TRUE(put.file_body.has_value());
    EXPECT_EQ(put.file_body->path, path);
    EXPECT_EQ(put.file_body->offset, 0u);
    EXPECT_EQ(put.file_body->length, 2048u);
    EXPECT_EQ(items[0].state, TransferState::Uploaded);
}

TEST(LfsTransferTest, MultipartUploadSplitsAndCompletes) {
    auto item = uploadItemFromBytes("big.bin", std::string(10, 'x') + std::string(10, 'y') + "zzzzz");
    const auto oid = fingerprintHex(item.fingerprint);
    json upload;
    upload["href"] = "https://hub.test/complete/" + oid;
    upload["header"] = {{"chunk_size", "10"},
                        {"00002", "https://storage.test/part2"},
                        {"00001", "https://storage.test/part1"},
                        {"00003", "https://storage.test/part3"}};
    json object;
    object["oid"] = oid;
    object["size"] = 25;
    object["actions"]["upload"] = upload;
    json batch;
    batch["objects"] = json::array({object});

    FakeTransport transport;
    transport.handler = [&](const HttpRequest& req) {
        if (req.url == kBatchUrl) return ok(batch.dump());
        HttpResponse res = ok();
        if (req.method == "PUT") {
            res.headers.emplace("etag", "\"etag-" + req.url.substr(req.url.size() - 5) + "\"");
        }
        return res;
    };
    LfsTransfer lfs(kEndpoint, transport);
    std::vector<UploadItem> items{item};
    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    ASSERT_TRUE(result.success) << result.error.describe();

    ASSERT_EQ(transport.requests.size(), 5u);
    EXPECT_EQ(transport.requests[1].url, "https://storage.test/part1");
    EXPECT_EQ(transport.requests[1].body, std::string(10, 'x'));
    EXPECT_EQ(transport.requests[2].body, std::string(10, 'y'));
    EXPECT_EQ(transport.requests[3].body, "zzzzz");

    const auto& complete = transport.requests[4];
    EXPECT_EQ(complete.method, "POST");
    EXPECT_EQ(complete.url, "https://hub.test/complete/" + oid);
    auto body = json::parse(complete.body);
    EXPECT_EQ(body["oid"], oid);
    ASSERT_EQ(body["parts"].size(), 3u);
    EXPECT_EQ(body["parts"][0]["partNumber"], 1);
    EXPECT_EQ(body["parts"][0]["etag"], "\"etag-part1\"");
    EXPECT_EQ(body["parts"][2]["etag"], "\"etag-part3\"");
}

TEST(LfsTransferTest, MultipartPartCountMismatchFails) {
    auto item = uploadItemFromBytes("big.bin", std::string(25, 'x'));
    TransferAction action;
    action.href = "https://hub.test/complete";
    action.header = {{"chunk_size", "10"}, {"1", "https://storage.test/p1"}, {"2", "https://storage.test/p2"}};

    FakeTransport transport;
    LfsTransfer lfs(kEndpoint, transport);
    auto err = lfs.uploadOne(item, action);
    EXPECT_EQ(err.code, HubErrorCode::kTransferFailed);
    EXPECT_EQ(item.state, TransferState::Failed);
    EXPECT_TRUE(transport.requests.empty());
}

TEST(LfsTransferTest, PartFailureCarriesStatusAndBody) {
    auto item = uploadItemFromBytes("big.bin", std::string(20, 'x'));
    TransferAction action;
    action.href = "https://hub.test/complete";
    action.header = {{"x-amz-meta-chunk-size", "10"},
                     {"x-amz-meta-part-1-url", "https://storage.test/p1"},
                     {"x-amz-meta-part-2-url", "https://storage.test/p2"}};

    FakeTransport transport;
    transport.handler = [](const HttpRequest& req) {
        if (req.url == "https://storage.test/p2") return ok("<Error>SlowDown</Error>", 503);
        return ok();
    };
    LfsTransfer lfs(kEndpoint, transport);
    auto err = lfs.uploadOne(item, action);
    EXPECT_EQ(err.code, HubErrorCode::kTransferFailed);
    EXPECT_EQ(err.status, 503);
    EXPECT_EQ(err.body, "<Error>SlowDown</Error>");
    EXPECT_FALSE(item.uploaded);
    // no completion call after a failed part
    EXPECT_EQ(transport.requests.size(), 2u);
}

TEST(LfsTransferTest, VerifyFailureFailsItem) {
    auto item = uploadItemFromBytes("a.bin", "abc");
    TransferAction verify;
    verify.href = "https://hub.test/verify";

    FakeTransport transport;
    transport.handler = [](const HttpRequest&) { return ok("mismatch", 422); };
    LfsTransfer lfs(kEndpoint, transport);
    auto err = lfs.verifyOne(item, verify);
    EXPECT_EQ(err.code, HubErrorCode::kVerifyFailed);
    EXPECT_EQ(err.status, 422);
    EXPECT_EQ(item.state, TransferState::Failed);
    EXPECT_EQ(transport.requests[0].content_type, "application/json");
}

TEST(LfsTransferTest, FirstFailureAbortsBatch) {
    std::vector<UploadItem> items;
    for (int i = 0; i < 6; ++i) {
        items.push_back(uploadItemFromBytes("f" + std::to_string(i), "payload-" + std::to_string(i)));
    }
    const auto batch = uploadObjects(items, false);
    const auto failing = "https://storage.test/" + fingerprintHex(items[0].fingerprint);

    FakeTransport transport;
    transport.handler = [&](const HttpRequest& req) {
        if (req.url == kBatchUrl) return ok(batch.dump());
        if (req.url == failing) return ok("boom", 500);
        return ok();
    };
    LfsTransfer lfs(kEndpoint, transport);
    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items, 1);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.code, HubErrorCode::kTransferFailed);
    EXPECT_EQ(result.error.status, 500);
    EXPECT_EQ(result.uploaded, 0u);
    // batch + the failing PUT only
    EXPECT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(items[0].state, TransferState::Failed);
    EXPECT_EQ(items[5].state, TransferState::Negotiated);
}

TEST(LfsTransferTest, NegotiationFailureMarksEveryItemFailed) {
    std::vector<UploadItem> items{uploadItemFromBytes("a", "1"), uploadItemFromBytes("b", "2")};
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) { return ok("", 401); };
    LfsTransfer lfs(kEndpoint, transport);
    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.code, HubErrorCode::kUnauthorized);
    for (const auto& item : items) EXPECT_EQ(item.state, TransferState::Failed);
}

TEST(LfsTransferTest, MissingObjectInResponseIsInvalid) {
    std::vector<UploadItem> items{uploadItemFromBytes("a", "1")};
    FakeTransport transport;
    transport.handler = [](const HttpRequest&) { return ok(R"({"objects":[]})"); };
    LfsTransfer lfs(kEndpoint, transport);
    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.code, HubErrorCode::kInvalidResponse);
}

TEST(LfsTransferTest, PerObjectErrorFailsBatch) {
    std::vector<UploadItem> items{uploadItemFromBytes("a", "1")};
    json object;
    object["oid"] = fingerprintHex(items[0].fingerprint);
    object["size"] = 1;
    object["error"] = {{"code", 422}, {"message", "size mismatch"}};
    json body;
    body["objects"] = json::array({object});
    FakeTransport transport;
    transport.handler = [&](const HttpRequest&) { return ok(body.dump()); };
    LfsTransfer lfs(kEndpoint, transport);
    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.status, 422);
    EXPECT_EQ(result.error.message, "size mismatch");
}

TEST(LfsTransferTest, EmptyBatchSucceedsWithoutRequests) {
    std::vector<UploadItem> items;
    FakeTransport transport;
    LfsTransfer lfs(kEndpoint, transport);
    EXPECT_TRUE(lfs.uploadBatch("user/repo", RepoType::Model, items).success);
    EXPECT_TRUE(transport.requests.empty());
}

TEST(MultipartHeadersTest, ChunkSizeAndPartOrdering) {
    TransferAction single;
    single.header = {{"Authorization", "Basic x"}};
    EXPECT_FALSE(multipartChunkSize(single).has_value());

    TransferAction multi;
    multi.header = {{"chunk_size", "5242880"}, {"10", "u10"}, {"2", "u2"}, {"1", "u1"}};
    EXPECT_EQ(multipartChunkSize(multi).value_or(0), 5242880u);
    EXPECT_EQ(multipartPartUrls(multi), (std::vector<std::string>{"u1", "u2", "u10"}));

    TransferAction bad;
    bad.header = {{"chunk_size", "abc"}};
    EXPECT_FALSE(multipartChunkSize(bad).has_value());
}
