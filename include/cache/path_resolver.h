// PathResolver - deterministic mapping from (repo, kind, revision, filename) to cache paths.
// Layout: {root}/hub/{kind}s--{repo with '/' -> '--'}/snapshots/{revision}/{filename}
#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace hubcache {

enum class RepoType {
    Model,
    Dataset,
    Space,
};

constexpr const char* kDefaultRevision = "main";
constexpr const char* kRepoIdSeparator = "--";

const char* toString(RepoType kind);
std::optional<RepoType> parseRepoType(const std::string& text);

// "" for models, "datasets/" and "spaces/" otherwise.
const char* repoTypeUrlPrefix(RepoType kind);

class PathResolver {
public:
    // "user/repo" -> "user--repo"
    static std::string flattenRepoId(const std::string& repo_id);

    // models--user--repo
    static std::string repoFolderName(const std::string& repo_id, RepoType kind);

    static std::filesystem::path hubDir(const std::filesystem::path& root);
    static std::filesystem::path repoDir(const std::filesystem::path& root,
                                         const std::string& repo_id,
                                         RepoType kind);
    static std::filesystem::path snapshotDir(const std::filesystem::path& root,
                                             const std::string& repo_id,
                                             RepoType kind,
                                             const std::string& revision = kDefaultRevision);
    static std::filesystem::path filePath(const std::filesystem::path& root,
                                          const std::string& repo_id,
                                          RepoType kind,
                                          const std::string& filename,
                                          const std::string& revision = kDefaultRevision);

    static std::filesystem::path locksDir(const std::filesystem::path& root);
    // {root}/locks/{repo}--{filename}.lock, '/' flattened in both parts
    static std::filesystem::path lockPath(const std::filesystem::path& root,
                                          const std::string& repo_id,
                                          const std::string& filename);

    static std::filesystem::path checksumPath(const std::filesystem::path& file);
    static std::filesystem::path incompletePath(const std::filesystem::path& file);

    // Remote URLs
    static std::string resolveUrl(const std::string& endpoint,
                                  const std::string& repo_id,
                                  RepoType kind,
                                  const std::string& revision,
                                  const std::string& filename);
    static std::string lfsBatchUrl(const std::string& endpoint,
                                   const std::string& repo_id,
                                   RepoType kind);
    static std::string revisionInfoPath(const std::string& repo_id,
                                        RepoType kind,
                                        const std::string& revision);
};

}  // namespace hubcache
