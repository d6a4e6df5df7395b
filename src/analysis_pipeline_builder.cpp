#include <codecheck/analysis_pipeline_builder.h>

#include <codecheck/clang_source_parser.h>
#include <codecheck/default_analysis_pipeline.h>
#include <codecheck/json_reporter.h>
#include <codecheck/path_source_acquirer.h>

#include <utility>

namespace codecheck {

AnalysisPipelineBuilder &AnalysisPipelineBuilder::WithSourceAcquirer(
    std::unique_ptr<SourceAcquirer> source_acquirer) {
  components_.source_acquirer = std::move(source_acquirer);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithParser(std::unique_ptr<SourceParser> parser) {
  components_.parser = std::move(parser);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithProgress(ProgressCallback progress) {
  components_.progress = std::move(progress);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithClangArguments(std::vector<std::string> args) {
  clang_arguments_ = std::move(args);
  return *this;
}

DefaultAnalysisPipeline AnalysisPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.source_acquirer =
      components_.source_acquirer
          ? std::move(components_.source_acquirer)
          : std::make_unique<PathSourceAcquirer>(components_.logger);
  components_.parser = components_.parser
                           ? std::move(components_.parser)
                           : std::make_unique<ClangSourceParser>(
                                 clang_arguments_, components_.logger);
  components_.reporter = components_.reporter
                             ? std::move(components_.reporter)
                             : std::make_unique<JsonReporter>();
  return DefaultAnalysisPipeline(std::move(components_));
}

} // namespace codecheck
