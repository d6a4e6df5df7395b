#pragma once

#include <codecheck/models.h>

#include <string>
#include <vector>

namespace codecheck {

inline constexpr char kRootNodeName[] = "root";

// Nests the file nodes under one directory node per distinct parent path
// prefix (resolved to an absolute path), below a synthetic directory named
// "root" whose path is root_path. Directories and files keep encounter
// order.
ReportNode BuildTree(std::vector<ReportNode> files, std::string root_path);
ReportNode BuildTree(std::vector<ReportNode> files);

// Descends through single-child directory chains until the first directory
// that branches or directly contains files. Idempotent.
ReportNode PruneTree(ReportNode root);

} // namespace codecheck
