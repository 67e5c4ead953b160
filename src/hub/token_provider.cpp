#include "hub/token_provider.h"

#include <cstdlib>
#include <spdlog/spdlog.h>

namespace hubcache {

std::optional<std::string> EnvTokenProvider::token() const {
    if (const char* v = std::getenv("HF_TOKEN"); v && *v) {
        return std::string(v);
    }
    if (const char* v = std::getenv("HUGGING_FACE_HUB_TOKEN"); v && *v) {
        spdlog::warn("Environment variable 'HUGGING_FACE_HUB_TOKEN' is deprecated, use 'HF_TOKEN' instead");
        return std::string(v);
    }
    return std::nullopt;
}

}  // namespace hubcache
