#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "hub/hub_error.h"

namespace hubcache {

// Extract file paths from a revision listing. Accepted shapes, tried in order:
//   {"siblings": [{"rfilename": "..."}]}
//   [{"type": "file", "path": "..."}]          (directories are skipped)
//   {"files": ["..." | {"path": "..."}]}
// InvalidResponse when none of them match.
HubError parseRepoListing(const nlohmann::json& listing, std::vector<std::string>& files);

}  // namespace hubcache
