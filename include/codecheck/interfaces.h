#pragma once

#include <codecheck/models.h>

#include <cstddef>
#include <string>
#include <vector>

namespace codecheck {

struct AnalysisConfig {
  std::vector<std::string> paths;
  std::vector<std::string> ignored_paths;
  bool compute_duplication = true;
};

struct SourceAcquisitionResult {
  std::vector<std::string> files;
  std::vector<std::string> skipped;
};

struct AnalysisResult {
  ReportNode tree;
  std::string report;
  std::size_t file_count = 0;
  std::size_t leaf_count = 0;
  std::size_t duplicate_count = 0;
};

class SourceAcquirer {
public:
  virtual ~SourceAcquirer() = default;
  virtual SourceAcquisitionResult Acquire(const AnalysisConfig &config) = 0;
};

class SourceParser {
public:
  virtual ~SourceParser() = default;
  // Throws ParseError when the file cannot be parsed.
  virtual ParsedFile Parse(const std::string &path) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual std::string Render(const ReportNode &root) = 0;
};

class AnalysisPipeline {
public:
  virtual ~AnalysisPipeline() = default;
  virtual AnalysisResult Run(const AnalysisConfig &config) = 0;
};

} // namespace codecheck
