#include <codecheck/default_analysis_pipeline.h>

#include <codecheck/duplicate_matcher.h>
#include <codecheck/file_analyzer.h>
#include <codecheck/tree_builder.h>

#include <chrono>
#include <utility>
#include <vector>

namespace codecheck {

DefaultAnalysisPipeline::DefaultAnalysisPipeline(PipelineComponents components)
    : source_acquirer_(std::move(components.source_acquirer)),
      parser_(std::move(components.parser)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))),
      progress_(std::move(components.progress)) {}

SourceAcquisitionResult
DefaultAnalysisPipeline::Discover(const AnalysisConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"paths", std::to_string(config.paths.size())},
                {"duplication", config.compute_duplication ? "true" : "false"}});
  auto sources = source_acquirer_->Acquire(config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "discover"},
                {"file_count", std::to_string(sources.files.size())},
                {"skipped", std::to_string(sources.skipped.size())}});
  return sources;
}

AnalysisResult
DefaultAnalysisPipeline::Analyse(const AnalysisConfig &config,
                                 const SourceAcquisitionResult &sources) {
  const auto pipeline_start = std::chrono::steady_clock::now();
  const auto total = sources.files.size();

  std::vector<ReportNode> files;
  files.reserve(total);
  for (std::size_t i = 0; i < total; ++i) {
    files.push_back(AnalyzeFile(parser_->Parse(sources.files[i])));
    ReportProgress(progress_, i + 1, total, "analyse");
  }
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "analyse"}, {"files", std::to_string(files.size())}});

  AnalysisResult result;
  result.file_count = files.size();
  if (config.compute_duplication) {
    const auto summary = DuplicateMatcher(logger_, progress_).Match(files);
    result.leaf_count = summary.leaves;
    result.duplicate_count = summary.duplicates;
    logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
                 {{"stage", "duplication"},
                  {"duplicates", std::to_string(summary.duplicates)}});
  } else {
    result.leaf_count = CollectLeaves(files).size();
  }

  result.tree = PruneTree(BuildTree(std::move(files)));
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "tree"}, {"root", result.tree.path}});

  result.report = reporter_->Render(result.tree);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "render"},
                {"bytes", std::to_string(result.report.size())}});

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"files", std::to_string(result.file_count)},
                {"units", std::to_string(result.leaf_count)},
                {"duplicates", std::to_string(result.duplicate_count)}});
  return result;
}

AnalysisResult DefaultAnalysisPipeline::Run(const AnalysisConfig &config) {
  return Analyse(config, Discover(config));
}

} // namespace codecheck
