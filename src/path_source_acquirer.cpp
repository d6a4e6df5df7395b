#include <codecheck/path_source_acquirer.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace codecheck {

namespace {

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }
  return std::distance(potential_parent.begin(), potential_parent.end()) <=
             std::distance(candidate.begin(), candidate.end()) &&
         std::equal(potential_parent.begin(), potential_parent.end(),
                    candidate.begin());
}

bool IsIgnoredPath(const std::filesystem::path &path,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  return std::any_of(
      ignored_paths.begin(), ignored_paths.end(),
      [&](const auto &ignored) { return IsWithin(path, ignored); });
}

std::vector<std::filesystem::path>
ResolveIgnoredPaths(const std::vector<std::string> &raw_paths) {
  std::vector<std::filesystem::path> resolved;
  resolved.reserve(raw_paths.size());
  for (const auto &raw : raw_paths) {
    resolved.push_back(
        std::filesystem::weakly_canonical(std::filesystem::absolute(raw)));
  }
  return resolved;
}

std::vector<std::filesystem::path>
CollectDirectory(const std::filesystem::path &root,
                 const std::vector<std::filesystem::path> &ignored_paths) {
  std::vector<std::filesystem::path> files;
  // Unreadable subdirectories are left out of the walk.
  for (std::filesystem::recursive_directory_iterator
           it(root, std::filesystem::directory_options::skip_permission_denied),
       end;
       it != end; ++it) {
    const auto &entry = *it;
    if (entry.is_symlink()) {
      continue;
    }
    if (IsIgnoredPath(entry.path(), ignored_paths)) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (entry.is_regular_file() && IsSourceExtension(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

bool IsSourceExtension(const std::filesystem::path &path) {
  static const std::set<std::string> kExtensions = {
      ".c", ".cc", ".cpp", ".cxx", ".c++", ".h", ".hh", ".hpp", ".hxx"};
  return kExtensions.count(path.extension().string()) > 0;
}

PathSourceAcquirer::PathSourceAcquirer(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

SourceAcquisitionResult
PathSourceAcquirer::Acquire(const AnalysisConfig &config) {
  const auto ignored_paths = ResolveIgnoredPaths(config.ignored_paths);

  SourceAcquisitionResult result;
  std::unordered_set<std::string> seen;
  const auto add_file = [&](const std::filesystem::path &file) {
    if (seen.insert(file.string()).second) {
      result.files.push_back(file.string());
    }
  };
  const auto skip = [&](const std::filesystem::path &path,
                        const std::string &reason) {
    logger_->Log(LogLevel::kWarn, "input.skipped",
                 {{"path", path.string()}, {"reason", reason}});
    result.skipped.push_back(path.string());
  };

  for (const auto &raw : config.paths) {
    std::error_code error;
    const auto path = std::filesystem::weakly_canonical(
        std::filesystem::absolute(raw), error);
    if (error) {
      skip(raw, error.message());
      continue;
    }
    if (seen.count(path.string()) > 0) {
      continue;
    }
    if (std::filesystem::is_directory(path)) {
      for (const auto &file : CollectDirectory(path, ignored_paths)) {
        add_file(file);
      }
      continue;
    }
    if (std::filesystem::is_regular_file(path) && IsSourceExtension(path)) {
      if (IsIgnoredPath(path, ignored_paths)) {
        continue;
      }
      add_file(path);
      continue;
    }
    skip(path, "neither a directory nor a C/C++ source file");
  }

  logger_->Log(LogLevel::kInfo, "Collected source files",
               {{"count", std::to_string(result.files.size())},
                {"skipped", std::to_string(result.skipped.size())}});
  return result;
}

} // namespace codecheck
