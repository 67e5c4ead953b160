// JsonRequester - generic authenticated JSON request collaborator for metadata calls.
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

#include "hub/hub_error.h"

namespace hubcache {

class TokenProvider;

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
};

const char* toString(HttpMethod method);

struct JsonResponse {
    bool success{false};
    int status{0};
    nlohmann::json body;
    HubError error;
};

class JsonRequester {
public:
    virtual ~JsonRequester() = default;
    // path is relative to the endpoint (e.g. "/api/models/user/repo/revision/main")
    virtual JsonResponse request(HttpMethod method,
                                 const std::string& path,
                                 const nlohmann::json* body = nullptr) = 0;
};

class HttplibJsonRequester : public JsonRequester {
public:
    HttplibJsonRequester(std::string endpoint,
                         std::chrono::milliseconds timeout,
                         const TokenProvider* tokens = nullptr,
                         std::string user_agent = "hubcache");

    JsonResponse request(HttpMethod method,
                         const std::string& path,
                         const nlohmann::json* body = nullptr) override;

private:
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
    const TokenProvider* tokens_;
    std::string user_agent_;
};

}  // namespace hubcache
