#include "transfer/http_transport.h"

#include <algorithm>
#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
#include <vector>

#include "utils/glob.h"
#include "utils/http_url.h"

namespace hubcache {

std::string HttpResponse::header(const std::string& name) const {
    const auto wanted = toLowerAscii(name);
    for (const auto& kv : headers) {
        if (toLowerAscii(kv.first) == wanted) return kv.second;
    }
    return "";
}

HttplibTransport::HttplibTransport(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResponse HttplibTransport::send(const HttpRequest& request) {
    HttpResponse out;
    HttpUrl url = parseUrl(request.url);
    auto client = makeClient(url, timeout_);
    if (!client) {
        out.error = HubError::make(HubErrorCode::kConnectionFailed, "failed to create HTTP client for " + request.url);
        return out;
    }

    const std::string content_type =
        request.content_type.empty() ? std::string("application/octet-stream") : request.content_type;

    httplib::Result res;
    if (request.file_body) {
        const FileSlice slice = *request.file_body;
        auto in = std::make_shared<std::ifstream>(slice.path, std::ios::binary);
        if (!in->is_open()) {
            out.error = HubError::make(HubErrorCode::kIoError, "failed to open " + slice.path.string());
            return out;
        }
        // httplib may replay the body (redirects), so position from its offset on every call
        auto provider = [in, slice](size_t offset, size_t length, httplib::DataSink& sink) {
            in->clear();
            in->seekg(static_cast<std::streamoff>(slice.offset + offset));
            std::vector<char> buf(std::min<size_t>(length, 64 * 1024));
            in->read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const auto n = in->gcount();
            if (n <= 0) return false;
            return sink.write(buf.data(), static_cast<size_t>(n));
        };
        const auto len = static_cast<size_t>(slice.length);
        if (request.method == "PUT") {
            res = client->Put(url.path, request.headers, len, provider, content_type);
        } else if (request.method == "POST") {
            res = client->Post(url.path, request.headers, len, provider, content_type);
        } else {
            out.error = HubError::make(HubErrorCode::kHttpError, "file body not supported for " + request.method);
            return out;
        }
    } else if (request.method == "GET") {
        res = client->Get(url.path, request.headers);
    } else if (request.method == "PUT") {
        res = client->Put(url.path, request.headers, request.body, content_type);
    } else if (request.method == "POST") {
        res = client->Post(url.path, request.headers, request.body, content_type);
    } else if (request.method == "DELETE") {
        res = client->Delete(url.path, request.headers, request.body, content_type);
    } else {
        out.error = HubError::make(HubErrorCode::kHttpError, "unsupported method " + request.method);
        return out;
    }

    if (!res) {
        out.error = HubError::make(HubErrorCode::kConnectionFailed,
                                   request.method + " " + request.url + " failed: " + httplib::to_string(res.error()));
        spdlog::warn("HttpTransport: {}", out.error.message);
        return out;
    }

    out.status = res->status;
    out.headers = res->headers;
    out.body = res->body;
    return out;
}

}  // namespace hubcache
