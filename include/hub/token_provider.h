#pragma once

#include <memory>
#include <optional>
#include <string>

namespace hubcache {

// Resolves the bearer token used for hub requests.
class TokenProvider {
public:
    virtual ~TokenProvider() = default;
    virtual std::optional<std::string> token() const = 0;
};

// HF_TOKEN, then HUGGING_FACE_HUB_TOKEN.
class EnvTokenProvider : public TokenProvider {
public:
    std::optional<std::string> token() const override;
};

class StaticTokenProvider : public TokenProvider {
public:
    explicit StaticTokenProvider(std::string token) : token_(std::move(token)) {}
    std::optional<std::string> token() const override {
        if (token_.empty()) return std::nullopt;
        return token_;
    }

private:
    std::string token_;
};

}  // namespace hubcache
