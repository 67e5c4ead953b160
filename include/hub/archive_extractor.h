#pragma once

#include <filesystem>
#include <string>

#include "hub/hub_error.h"
#include "utils/glob.h"

namespace hubcache {

// Post-download extraction hook. Implementations return NotArchive when the
// downloaded file is not an archive they understand.
class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;
    virtual HubError extract(const std::filesystem::path& archive,
                             const std::filesystem::path& destination) = 0;
};

// "weights.tar.gz" -> "weights"; paths without a known archive suffix are returned unchanged.
inline std::filesystem::path defaultExtractPath(const std::filesystem::path& archive) {
    static const char* kSuffixes[] = {".tar.gz", ".tgz", ".tar.xz", ".tar", ".zip", ".gz"};
    const std::string name = archive.filename().string();
    const std::string lower = toLowerAscii(name);
    for (const char* suffix : kSuffixes) {
        if (endsWith(lower, suffix) && lower.size() > std::char_traits<char>::length(suffix)) {
            return archive.parent_path() / name.substr(0, name.size() - std::char_traits<char>::length(suffix));
        }
    }
    return archive;
}

}  // namespace hubcache
