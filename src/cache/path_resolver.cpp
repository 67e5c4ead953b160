#include "cache/path_resolver.h"

#include "utils/http_url.h"
#include "utils/url_encode.h"

namespace fs = std::filesystem;

namespace hubcache {

namespace {

std::string replaceSlashes(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char c : value) {
        if (c == '/') {
            out += kRepoIdSeparator;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace

const char* toString(RepoType kind) {
    switch (kind) {
        case RepoType::Model:
            return "model";
        case RepoType::Dataset:
            return "dataset";
        case RepoType::Space:
            return "space";
    }
    return "model";
}

std::optional<RepoType> parseRepoType(const std::string& text) {
    if (text == "model" || text == "models") return RepoType::Model;
    if (text == "dataset" || text == "datasets") return RepoType::Dataset;
    if (text == "space" || text == "spaces") return RepoType::Space;
    return std::nullopt;
}

const char* repoTypeUrlPrefix(RepoType kind) {
    switch (kind) {
        case RepoType::Model:
            return "";
        case RepoType::Dataset:
            return "datasets/";
        case RepoType::Space:
            return "spaces/";
    }
    return "";
}

std::string PathResolver::flattenRepoId(const std::string& repo_id) {
    return replaceSlashes(repo_id);
}

std::string PathResolver::repoFolderName(const std::string& repo_id, RepoType kind) {
    return std::string(toString(kind)) + "s" + kRepoIdSeparator + flattenRepoId(repo_id);
}

fs::path PathResolver::hubDir(const fs::path& root) {
    return root / "hub";
}

fs::path PathResolver::repoDir(const fs::path& root, const std::string& repo_id, RepoType kind) {
    return hubDir(root) / repoFolderName(repo_id, kind);
}

fs::path PathResolver::snapshotDir(const fs::path& root,
                                   const std::string& repo_id,
                                   RepoType kind,
                                   const std::string& revision) {
    return repoDir(root, repo_id, kind) / "snapshots" / revision;
}

fs::path PathResolver::filePath(const fs::path& root,
                                const std::string& repo_id,
                                RepoType kind,
                                const std::string& filename,
                                const std::string& revision) {
    return snapshotDir(root, repo_id, kind, revision) / fs::path(filename);
}

fs::path PathResolver::locksDir(const fs::path& root) {
    return root / "locks";
}

fs::path PathResolver::lockPath(const fs::path& root, const std::string& repo_id, const std::string& filename) {
    return locksDir(root) / (replaceSlashes(repo_id) + kRepoIdSeparator + replaceSlashes(filename) + ".lock");
}

fs::path PathResolver::checksumPath(const fs::path& file) {
    return fs::path(file.string() + ".sha256");
}

fs::path PathResolver::incompletePath(const fs::path& file) {
    return fs::path(file.string() + ".incomplete");
}

std::string PathResolver::resolveUrl(const std::string& endpoint,
                                     const std::string& repo_id,
                                     RepoType kind,
                                     const std::string& revision,
                                     const std::string& filename) {
    std::string out = trimTrailingSlash(endpoint);
    out += "/";
    out += repoTypeUrlPrefix(kind);
    out += urlEncodePath(repo_id);
    out += "/resolve/";
    out += urlEncodePathSegment(revision);
    out += "/";
    out += urlEncodePath(filename);
    return out;
}

std::string PathResolver::lfsBatchUrl(const std::string& endpoint, const std::string& repo_id, RepoType kind) {
    std::string out = trimTrailingSlash(endpoint);
    out += "/";
    out += repoTypeUrlPrefix(kind);
    out += urlEncodePath(repo_id);
    out += ".git/info/lfs/objects/batch";
    return out;
}

std::string PathResolver::revisionInfoPath(const std::string& repo_id, RepoType kind, const std::string& revision) {
    return "/api/" + std::string(toString(kind)) + "s/" + urlEncodePath(repo_id) + "/revision/" +
           urlEncodePathSegment(revision);
}

}  // namespace hubcache
