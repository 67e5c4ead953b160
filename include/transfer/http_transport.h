// HttpTransport - request/response seam used by the LFS transfer protocol.
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <httplib.h>
#include <optional>
#include <string>

#include "hub/hub_error.h"

namespace hubcache {

// Body streamed from a byte range of a file instead of held in memory.
struct FileSlice {
    std::filesystem::path path;
    uint64_t offset{0};
    uint64_t length{0};
};

struct HttpRequest {
    std::string method{"GET"};
    std::string url;  // absolute
    httplib::Headers headers;
    std::string body;
    std::optional<FileSlice> file_body;  // takes precedence over body
    std::string content_type;
};

struct HttpResponse {
    int status{0};
    httplib::Headers headers;
    std::string body;
    HubError error;  // set when no response was received

    bool received() const { return status != 0; }
    bool is_success() const { return status >= 200 && status < 300; }
    // Case-insensitive lookup, "" when absent.
    std::string header(const std::string& name) const;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    HttpResponse send(const HttpRequest& request) override;

private:
    std::chrono::milliseconds timeout_;
};

}  // namespace hubcache
