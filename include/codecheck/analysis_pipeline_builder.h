#pragma once

#include <codecheck/interfaces.h>
#include <codecheck/logging.h>
#include <codecheck/progress.h>

#include <memory>
#include <string>
#include <vector>

namespace codecheck {

class DefaultAnalysisPipeline;

struct PipelineComponents {
  std::unique_ptr<SourceAcquirer> source_acquirer;
  std::unique_ptr<SourceParser> parser;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
  ProgressCallback progress;
};

class AnalysisPipelineBuilder {
public:
  AnalysisPipelineBuilder &
  WithSourceAcquirer(std::unique_ptr<SourceAcquirer> source_acquirer);
  AnalysisPipelineBuilder &WithParser(std::unique_ptr<SourceParser> parser);
  AnalysisPipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  AnalysisPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalysisPipelineBuilder &WithProgress(ProgressCallback progress);
  // Extra front-end arguments for the default parser.
  AnalysisPipelineBuilder &WithClangArguments(std::vector<std::string> args);

  // Missing components fall back to PathSourceAcquirer, ClangSourceParser
  // and JsonReporter.
  DefaultAnalysisPipeline Build();

private:
  PipelineComponents components_;
  std::vector<std::string> clang_arguments_;
};

} // namespace codecheck
