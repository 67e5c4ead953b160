#pragma once

#include <string>

namespace hubcache {

inline std::string urlEncodePathSegment(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        const bool unreserved =
            (c >= 'A' && c <= 'Z') ||
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0x0F]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// Encode each '/'-separated segment, keeping the separators.
inline std::string urlEncodePath(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        const std::string segment = (pos == std::string::npos) ? path.substr(start)
                                                               : path.substr(start, pos - start);
        out += urlEncodePathSegment(segment);
        if (pos == std::string::npos) break;
        out.push_back('/');
        start = pos + 1;
    }
    return out;
}

}  // namespace hubcache
