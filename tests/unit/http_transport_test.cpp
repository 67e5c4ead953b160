#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <mutex>
#include <string>

#include "transfer/http_transport.h"
#include "transfer/lfs_transfer.h"
#include "../test_support.h"

using namespace hubcache;
using namespace std::chrono_literals;
using json = nlohmann::json;

class HttpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.server.Put("/upload", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex);
            received = req.body;
            content_type = req.get_header_value("Content-Type");
            res.set_header("ETag", "\"abc\"");
            res.status = 200;
        });
        server.server.Put("/moved", [](const httplib::Request&, httplib::Response& res) {
            res.status = 307;
            res.set_header("Location", "/upload");
        });
        server.server.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(req.body, "text/plain");
        });
        server.server.Get("/teapot", [](const httplib::Request&, httplib::Response& res) {
            res.status = 418;
            res.set_content("short and stout", "text/plain");
        });
        server.start();
    }

    void TearDown() override { server.stop(); }

    std::string receivedBody() {
        std::lock_guard<std::mutex> lock(mutex);
        return received;
    }

    test::LocalServer server;
    std::mutex mutex;
    std::string received;
    std::string content_type;
};

TEST_F(HttpTransportTest, PutStreamsFileSlice) {
    test::TempDir tmp("transport");
    const auto path = tmp.path / "data.bin";
    std::string data;
    for (int i = 0; i < 200000; ++i) data.push_back(static_cast<char>('a' + i % 26));
    test::writeFile(path, data);

    HttplibTransport transport(5000ms);
    HttpRequest req;
    req.method = "PUT";
    req.url = server.url("/upload");
    req.file_body = FileSlice{path, 1000, 150000};
    auto res = transport.send(req);

    ASSERT_TRUE(res.received()) << res.error.describe();
    EXPECT_TRUE(res.is_success());
    EXPECT_EQ(res.header("etag"), "\"abc\"");
    EXPECT_EQ(receivedBody(), data.substr(1000, 150000));
    EXPECT_EQ(content_type, "application/octet-stream");
}

TEST_F(HttpTransportTest, RedirectedPutResendsSliceFromStart) {
    test::TempDir tmp("transport");
    const auto path = tmp.path / "data.bin";
    std::string data;
    for (int i = 0; i < 100000; ++i) data.push_back(static_cast<char>('a' + i % 26));
    test::writeFile(path, data);

    HttplibTransport transport(5000ms);
    HttpRequest req;
    req.method = "PUT";
    req.url = server.url("/moved");
    req.file_body = FileSlice{path, 500, 80000};
    auto res = transport.send(req);

    ASSERT_TRUE(res.received()) << res.error.describe();
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(receivedBody(), data.substr(500, 80000));
}

TEST_F(HttpTransportTest, PostSendsStringBody) {
    HttplibTransport transport(5000ms);
    HttpRequest req;
    req.method = "POST";
    req.url = server.url("/echo");
    req.body = R"({"a":1})";
    req.content_type = "application/json";
    auto res = transport.send(req);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, R"({"a":1})");
}

TEST_F(HttpTransportTest, ErrorStatusIsReturnedNotRaised) {
    HttplibTransport transport(5000ms);
    HttpRequest req;
    req.url = server.url("/teapot");
    auto res = transport.send(req);
    EXPECT_TRUE(res.received());
    EXPECT_FALSE(res.is_success());
    EXPECT_EQ(res.status, 418);
    EXPECT_EQ(res.body, "short and stout");
    EXPECT_TRUE(res.error.ok());
}

TEST_F(HttpTransportTest, MissingFileBodyIsIoError) {
    HttplibTransport transport(5000ms);
    HttpRequest req;
    req.method = "PUT";
    req.url = server.url("/upload");
    req.file_body = FileSlice{"/nonexistent/file.bin", 0, 10};
    auto res = transport.send(req);
    EXPECT_FALSE(res.received());
    EXPECT_EQ(res.error.code, HubErrorCode::kIoError);
}

TEST_F(HttpTransportTest, UnsupportedMethodIsRejected) {
    HttplibTransport transport(5000ms);
    HttpRequest req;
    req.method = "TRACE";
    req.url = server.url("/echo");
    auto res = transport.send(req);
    EXPECT_FALSE(res.received());
    EXPECT_EQ(res.error.code, HubErrorCode::kHttpError);
}

TEST(HttpTransportConnectionTest, ClosedPortIsConnectionFailed) {
    std::string url;
    {
        test::LocalServer closed;
        closed.start();
        url = closed.url("/x");
    }
    HttplibTransport transport(1000ms);
    HttpRequest req;
    req.url = url;
    auto res = transport.send(req);
    EXPECT_FALSE(res.received());
    EXPECT_EQ(res.error.code, HubErrorCode::kConnectionFailed);
}

// Full two-phase upload against an in-process hub.
TEST(LfsUploadEndToEndTest, NegotiatesUploadsAndVerifies) {
    test::LocalServer hub;
    std::mutex mutex;
    std::string stored;
    int verify_calls = 0;

    auto item = uploadItemFromBytes("model.bin", std::string(4096, 'm'));
    const auto oid = fingerprintHex(item.fingerprint);

    hub.server.Post("/user/repo.git/info/lfs/objects/batch", [&](const httplib::Request& req, httplib::Response& res) {
        auto body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || body["operation"] != "upload") {
            res.status = 400;
            return;
        }
        json object;
        object["oid"] = body["objects"][0]["oid"];
        object["size"] = body["objects"][0]["size"];
        object["actions"]["upload"]["href"] = hub.url("/storage/" + oid);
        object["actions"]["verify"]["href"] = hub.url("/verify");
        json out;
        out["transfer"] = "basic";
        out["objects"] = json::array({object});
        res.set_content(out.dump(), kLfsMediaType);
    });
    hub.server.Put("/storage/" + oid, [&](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex);
        stored = req.body;
        res.status = 200;
    });
    hub.server.Post("/verify", [&](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex);
        ++verify_calls;
        auto body = json::parse(req.body, nullptr, false);
        res.status = (!body.is_discarded() && body["oid"] == oid) ? 200 : 422;
    });
    hub.start();

    HttplibTransport transport(5000ms);
    LfsTransfer lfs(hub.url(), transport);
    std::vector<UploadItem> items{item};
    auto result = lfs.uploadBatch("user/repo", RepoType::Model, items);
    hub.stop();

    ASSERT_TRUE(result.success) << result.error.describe();
    EXPECT_EQ(result.uploaded, 1u);
    EXPECT_EQ(result.verified, 1u);
    EXPECT_EQ(stored, std::string(4096, 'm'));
    EXPECT_EQ(verify_calls, 1);
    EXPECT_EQ(items[0].state, TransferState::Verified);
}
