#include "hub/repo_listing.h"

#include <spdlog/spdlog.h>

namespace hubcache {
namespace {

bool parseSiblings(const nlohmann::json& j, std::vector<std::string>& out) {
    if (!j.is_object() || !j.contains("siblings") || !j["siblings"].is_array()) return false;
    for (const auto& s : j["siblings"]) {
        if (!s.is_object()) continue;
        auto name = s.value("rfilename", std::string{});
        if (!name.empty()) out.push_back(std::move(name));
    }
    return true;
}

bool parseTree(const nlohmann::json& j, std::vector<std::string>& out) {
    if (!j.is_array()) return false;
    for (const auto& entry : j) {
        if (!entry.is_object()) continue;
        const auto type = entry.value("type", std::string("file"));
        if (type != "file") continue;
        auto path = entry.value("path", std::string{});
        if (!path.empty()) out.push_back(std::move(path));
    }
    return true;
}

bool parseFiles(const nlohmann::json& j, std::vector<std::string>& out) {
    if (!j.is_object() || !j.contains("files") || !j["files"].is_array()) return false;
    for (const auto& f : j["files"]) {
        if (f.is_string()) {
            out.push_back(f.get<std::string>());
        } else if (f.is_object()) {
            auto path = f.value("path", std::string{});
            if (!path.empty()) out.push_back(std::move(path));
        }
    }
    return true;
}

}  // namespace

HubError parseRepoListing(const nlohmann::json& listing, std::vector<std::string>& files) {
    files.clear();
    try {
        if (parseSiblings(listing, files) || parseTree(listing, files) || parseFiles(listing, files)) {
            return {};
        }
    } catch (const nlohmann::json::exception& e) {
        files.clear();
        spdlog::warn("RepoListing: malformed listing: {}", e.what());
        return HubError::make(HubErrorCode::kInvalidResponse, std::string("malformed listing: ") + e.what());
    }
    return HubError::make(HubErrorCode::kInvalidResponse, "unrecognized repository listing");
}

}  // namespace hubcache
