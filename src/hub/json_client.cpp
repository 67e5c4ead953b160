#include "hub/json_client.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "hub/token_provider.h"
#include "utils/http_url.h"

namespace hubcache {

const char* toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Patch:
            return "PATCH";
        case HttpMethod::Delete:
            return "DELETE";
    }
    return "GET";
}

HttplibJsonRequester::HttplibJsonRequester(std::string endpoint,
                                           std::chrono::milliseconds timeout,
                                           const TokenProvider* tokens,
                                           std::string user_agent)
    : endpoint_(trimTrailingSlash(std::move(endpoint))),
      timeout_(timeout),
      tokens_(tokens),
      user_agent_(std::move(user_agent)) {}

JsonResponse HttplibJsonRequester::request(HttpMethod method,
                                           const std::string& path,
                                           const nlohmann::json* body) {
    JsonResponse out;
    HttpUrl base = parseUrl(endpoint_);
    auto client = makeClient(base, timeout_);
    if (!client) {
        out.error = HubError::make(HubErrorCode::kConnectionFailed, "failed to create HTTP client for " + endpoint_);
        return out;
    }

    httplib::Headers headers{{"Accept", "application/json"}, {"User-Agent", user_agent_}};
    if (tokens_) {
        if (auto token = tokens_->token()) {
            headers.emplace("Authorization", "Bearer " + *token);
        }
    }

    // endpoint may carry a path prefix (e.g. a mirror mounted under /hf)
    std::string full_path = base.path == "/" ? path : trimTrailingSlash(base.path) + path;
    const std::string payload = body ? body->dump() : std::string();

    httplib::Result res;
    switch (method) {
        case HttpMethod::Get:
            res = client->Get(full_path, headers);
            break;
        case HttpMethod::Post:
            res = client->Post(full_path, headers, payload, "application/json");
            break;
        case HttpMethod::Put:
            res = client->Put(full_path, headers, payload, "application/json");
            break;
        case HttpMethod::Patch:
            res = client->Patch(full_path, headers, payload, "application/json");
            break;
        case HttpMethod::Delete:
            res = client->Delete(full_path, headers, payload, "application/json");
            break;
    }

    if (!res) {
        out.error = HubError::make(HubErrorCode::kConnectionFailed,
                                   std::string(toString(method)) + " " + full_path + " failed: " +
                                       httplib::to_string(res.error()));
        spdlog::warn("JsonRequester: {}", out.error.message);
        return out;
    }

    out.status = res->status;
    if (res->status < 200 || res->status >= 300) {
        out.error = HubError::fromStatus(res->status, res->body);
        spdlog::debug("JsonRequester: {} {} -> {}", toString(method), full_path, res->status);
        return out;
    }

    if (res->body.empty()) {
        out.success = true;
        return out;
    }

    auto parsed = nlohmann::json::parse(res->body, nullptr, false);
    if (parsed.is_discarded()) {
        out.error = HubError::make(HubErrorCode::kInvalidResponse, "response is not valid JSON", res->status);
        return out;
    }
    out.body = std::move(parsed);
    out.success = true;
    return out;
}

}  // namespace hubcache
