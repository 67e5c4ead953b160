#include "utils/http_url.h"

#include <httplib.h>
#include <cstdlib>
#include <regex>

namespace hubcache {

std::string HttpUrl::origin() const {
    std::string out = scheme + "://" + host;
    if (port != 0) {
        out += ":" + std::to_string(port);
    }
    return out;
}

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (std::regex_match(url, match, re)) {
        const std::string scheme = match[1].str();
        int port = scheme == "https" ? 443 : 80;
        if (match[3].matched) {
            // regex guarantees digits only; reject anything beyond 65535
            const std::string digits = match[3].str();
            if (digits.size() > 5) return HttpUrl{};
            port = static_cast<int>(std::strtol(digits.c_str(), nullptr, 10));
            if (port <= 0 || port > 65535) return HttpUrl{};
        }
        parsed.scheme = scheme;
        parsed.host = match[2].str();
        parsed.port = port;
        parsed.path = match[4].str().empty() ? "/" : match[4].str();
    }
    return parsed;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (!url.valid()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    auto client = std::make_unique<httplib::Client>(url.origin());
    if (client && client->is_valid()) {
        const int sec = static_cast<int>(timeout.count() / 1000);
        const int usec = static_cast<int>((timeout.count() % 1000) * 1000);
        client->set_connection_timeout(sec, usec);
        client->set_read_timeout(sec, usec);
        client->set_write_timeout(sec, usec);
        client->set_follow_location(true);
        return client;
    }

    return nullptr;
}

std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace hubcache
