#include "transfer/content_fingerprint.h"

#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

namespace fs = std::filesystem;

namespace hubcache {

namespace {

void setError(HubError* error, HubError value) {
    if (error) *error = std::move(value);
}

}  // namespace

std::optional<ContentFingerprint> fingerprintFromPath(const fs::path& path, HubError* error) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        setError(error, HubError::make(HubErrorCode::kIoError, "stat failed for " + path.string() + ": " + ec.message()));
        return std::nullopt;
    }

    ContentFingerprint fp;
    fp.size = static_cast<uint64_t>(size);

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        setError(error, HubError::make(HubErrorCode::kIoError, "cannot open " + path.string()));
        return std::nullopt;
    }

    Sha256Hasher hasher;
    std::vector<char> buf(kHashChunkSize);
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize n = ifs.gcount();
        if (n > 0) hasher.update(buf.data(), static_cast<size_t>(n));
    }
    if (ifs.bad() || !hasher.finish(fp.digest)) {
        setError(error, HubError::make(HubErrorCode::kIoError, "failed to hash " + path.string()));
        return std::nullopt;
    }

    std::ifstream sample_in(path, std::ios::binary);
    const size_t sample_len = static_cast<size_t>(std::min<uint64_t>(fp.size, kFingerprintSampleSize));
    fp.sample.resize(sample_len);
    if (sample_len > 0) {
        sample_in.read(fp.sample.data(), static_cast<std::streamsize>(sample_len));
        fp.sample.resize(static_cast<size_t>(std::max<std::streamsize>(sample_in.gcount(), 0)));
    }
    return fp;
}

ContentFingerprint fingerprintFromBytes(const std::string& data) {
    ContentFingerprint fp;
    Sha256Hasher hasher;
    hasher.update(data.data(), data.size());
    if (!hasher.finish(fp.digest)) {
        spdlog::error("ContentFingerprint: SHA-256 failed for {} byte buffer", data.size());
    }
    fp.size = data.size();
    fp.sample = data.substr(0, std::min(data.size(), kFingerprintSampleSize));
    return fp;
}

std::string fingerprintHex(const ContentFingerprint& fingerprint) {
    return toHex(fingerprint.digest);
}

}  // namespace hubcache
