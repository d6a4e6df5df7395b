#pragma once

#include <codecheck/interfaces.h>
#include <codecheck/logging.h>

#include <filesystem>
#include <memory>

namespace codecheck {

bool IsSourceExtension(const std::filesystem::path &path);

// Expands the configured paths into a deduplicated list of absolute source
// files. Directories are walked recursively without following symlinks;
// unusable paths are logged and skipped.
class PathSourceAcquirer : public SourceAcquirer {
public:
  explicit PathSourceAcquirer(std::shared_ptr<Logger> logger = nullptr);
  SourceAcquisitionResult Acquire(const AnalysisConfig &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace codecheck
