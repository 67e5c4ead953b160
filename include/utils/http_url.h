#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace httplib {
class Client;
}

namespace hubcache {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;  // path + query, "/" when empty

    bool valid() const { return !scheme.empty() && !host.empty(); }
    // scheme://host:port, the form httplib::Client accepts
    std::string origin() const;
};

HttpUrl parseUrl(const std::string& url);

// Configure timeouts and redirects the same way for every client we create.
// Returns nullptr for malformed URLs or https without TLS support compiled in.
std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout);

std::string trimTrailingSlash(std::string value);

}  // namespace hubcache
