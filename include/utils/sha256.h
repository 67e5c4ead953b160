#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <openssl/sha.h>
#include <string>
#include <vector>

namespace hubcache {

using Sha256Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

inline std::string toHex(const uint8_t* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string hexout;
    hexout.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hexout.push_back(hex[(data[i] >> 4) & 0x0F]);
        hexout.push_back(hex[data[i] & 0x0F]);
    }
    return hexout;
}

inline std::string toHex(const Sha256Digest& digest) {
    return toHex(digest.data(), digest.size());
}

// Incremental SHA-256 for streamed content.
class Sha256Hasher {
public:
    Sha256Hasher() { ok_ = SHA256_Init(&ctx_) == 1; }

    void update(const void* data, size_t len) {
        if (!ok_ || len == 0) return;
        ok_ = SHA256_Update(&ctx_, data, len) == 1;
    }

    // Returns false if OpenSSL reported a failure at any step.
    bool finish(Sha256Digest& out) {
        if (!ok_) return false;
        ok_ = SHA256_Final(out.data(), &ctx_) == 1;
        return ok_;
    }

    std::string finishHex() {
        Sha256Digest digest{};
        if (!finish(digest)) return "";
        return toHex(digest);
    }

private:
    SHA256_CTX ctx_{};
    bool ok_{false};
};

inline std::string sha256_text(const std::string& text) {
    Sha256Hasher hasher;
    hasher.update(text.data(), text.size());
    return hasher.finishHex();
}

constexpr size_t kHashChunkSize = 64 * 1024;

// Empty string when the file cannot be read.
inline std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    Sha256Hasher hasher;
    std::vector<char> buf(kHashChunkSize);
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = file.gcount();
        if (n > 0) {
            hasher.update(buf.data(), static_cast<size_t>(n));
        }
    }
    if (file.bad()) return "";
    return hasher.finishHex();
}

}  // namespace hubcache
