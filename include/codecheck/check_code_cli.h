#pragma once

#include <codecheck/interfaces.h>
#include <codecheck/logging.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace codecheck {

inline constexpr char kDefaultOutputFile[] = "result.json";

struct AnalyzeOptions {
  std::vector<std::string> paths;
  std::optional<std::filesystem::path> output;
  std::optional<std::filesystem::path> config_file;
  std::optional<bool> duplication;
  std::optional<bool> progress;
  std::optional<bool> dry_run;
  std::vector<std::string> clang_args;
  std::vector<std::string> ignored_paths;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
// Relative paths inside the file are resolved against its directory.
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
// Set command-line values win; command-line lists replace config lists.
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options);
LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options);

void PrintAnalyzeUsage(std::ostream &out);

// Runs one analysis. Errors propagate as exceptions.
int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &err);
int RunAnalyze(const std::vector<std::string> &arguments);

} // namespace codecheck
