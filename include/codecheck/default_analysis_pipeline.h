#pragma once

#include <codecheck/analysis_pipeline_builder.h>

#include <memory>

namespace codecheck {

// discover -> analyse -> duplication -> tree -> render. A ParseError from
// the parser aborts the run.
class DefaultAnalysisPipeline : public AnalysisPipeline {
public:
  explicit DefaultAnalysisPipeline(PipelineComponents components);

  SourceAcquisitionResult Discover(const AnalysisConfig &config);
  AnalysisResult Analyse(const AnalysisConfig &config,
                         const SourceAcquisitionResult &sources);

  AnalysisResult Run(const AnalysisConfig &config) override;

private:
  std::unique_ptr<SourceAcquirer> source_acquirer_;
  std::unique_ptr<SourceParser> parser_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
  ProgressCallback progress_;
};

} // namespace codecheck
