// ContentFingerprint - identifies an object for LFS negotiation (digest, size, leading sample).
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "hub/hub_error.h"
#include "utils/sha256.h"

namespace hubcache {

constexpr size_t kFingerprintSampleSize = 512;

struct ContentFingerprint {
    Sha256Digest digest{};
    uint64_t size{0};
    std::string sample;  // first min(size, 512) bytes
};

// Streams the file through SHA-256 in 64 KiB chunks; size comes from stat and
// the sample is read independently.
std::optional<ContentFingerprint> fingerprintFromPath(const std::filesystem::path& path,
                                                      HubError* error = nullptr);

ContentFingerprint fingerprintFromBytes(const std::string& data);

// 64 lowercase hex characters; also the LFS object id.
std::string fingerprintHex(const ContentFingerprint& fingerprint);

}  // namespace hubcache
