#include <codecheck/check_code_cli.h>

#include <codecheck/analysis_pipeline_builder.h>
#include <codecheck/default_analysis_pipeline.h>
#include <codecheck/progress.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using codecheck::AnalyzeOptions;

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value, const std::string &key_name) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a boolean, got: " + value);
}

std::vector<std::string> SplitPathList(const std::string &raw_paths) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_paths) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendRawPathStrings(const std::string &raw_paths,
                          std::vector<std::string> &target) {
  for (auto path_value : SplitPathList(raw_paths)) {
    path_value = Trim(path_value);
    if (path_value.empty()) {
      continue;
    }
    const auto normalized = std::filesystem::path(path_value).generic_string();
    if (std::find(target.begin(), target.end(), normalized) == target.end()) {
      target.push_back(normalized);
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = codecheck::ParseLogLevel(
        RequireValue(arguments, index, std::string(argument)));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = codecheck::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = codecheck::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleToggleOption(const std::string &argument, AnalyzeOptions &options) {
  if (argument == "--duplication") {
    options.duplication = true;
    return true;
  }
  if (argument == "--no-duplication") {
    options.duplication = false;
    return true;
  }
  if (argument == "--no-progress") {
    options.progress = false;
    return true;
  }
  if (argument == "--dry-run") {
    options.dry_run = true;
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--output" || argument == "-o") {
    options.output = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--clang-arg") {
    options.clang_args.push_back(
        RequireValue(arguments, index, "--clang-arg"));
    return true;
  }
  if (argument == "--ignored-paths") {
    AppendRawPathStrings(RequireValue(arguments, index, "--ignored-paths"),
                         options.ignored_paths);
    return true;
  }
  if (HandleToggleOption(argument, options)) {
    return true;
  }
  return HandleLoggingOption(arguments, index, options);
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::vector<std::pair<std::string, ConfigValue>>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "paths",       "output",        "duplication", "progress",
      "dry_run",     "clang_args",    "ignored_paths", "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"out", "output"}, {"path", "paths"}, {"clang_arg", "clang_args"}};
  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      values.push_back(child.as<std::string>());
    }
    return values;
  }
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean");
  }
  return ParseBool(node.as<std::string>(), key_name);
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "paths" || key == "clang_args" || key == "ignored_paths") {
    return ExtractList(node, key);
  }
  if (key == "duplication" || key == "progress" || key == "dry_run") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "output" || key == "log_level") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config.emplace_back(key, ToConfigValue(key, entry.second));
  }
  return config;
}

std::string ResolveAgainst(const std::filesystem::path &base,
                           const std::string &value) {
  const std::filesystem::path path(value);
  if (path.is_absolute()) {
    return path.generic_string();
  }
  return (base / path).lexically_normal().generic_string();
}

std::vector<std::string> ResolveAllAgainst(const std::filesystem::path &base,
                                           std::vector<std::string> values) {
  for (auto &value : values) {
    value = ResolveAgainst(base, value);
  }
  return values;
}

void ApplyConfig(const RawConfig &config, const std::filesystem::path &base,
                 AnalyzeOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "paths") {
      options.paths =
          ResolveAllAgainst(base, std::get<std::vector<std::string>>(value));
      continue;
    }
    if (key == "output") {
      options.output = ResolveAgainst(base, std::get<std::string>(value));
      continue;
    }
    if (key == "ignored_paths") {
      options.ignored_paths =
          ResolveAllAgainst(base, std::get<std::vector<std::string>>(value));
      continue;
    }
    if (key == "clang_args") {
      options.clang_args = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "duplication") {
      options.duplication = std::get<bool>(value);
      continue;
    }
    if (key == "progress") {
      options.progress = std::get<bool>(value);
      continue;
    }
    if (key == "dry_run") {
      options.dry_run = std::get<bool>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = codecheck::ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    ThrowUnknownKey(key);
  }
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (options.paths.empty()) {
    throw std::invalid_argument(
        "At least one path is required (or set 'paths' in the config file)");
  }
}

void WriteReport(const std::filesystem::path &path,
                 const std::string &content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
  if (!stream) {
    throw std::runtime_error("Failed to write output file: " + path.string());
  }
}

} // namespace

namespace codecheck {

void PrintAnalyzeUsage(std::ostream &out) {
  out << "Usage: check-code [analyze] <paths...> [options]\n"
      << "Options:\n"
      << "  -o, --output <file>     JSON output file (default: result.json)\n"
      << "  --dry-run               List the files that would be analysed\n"
      << "  --duplication           Compute duplication metrics (default)\n"
      << "  --no-duplication        Skip duplication metrics\n"
      << "  --no-progress           Disable progress bars\n"
      << "  --config <file>         Optional YAML config file\n"
      << "  --clang-arg <arg>       Extra front-end argument (repeatable)\n"
      << "  --ignored-paths <list>  Comma-separated paths to skip\n"
      << "  --log-level <level>     Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose               Shortcut for --log-level info\n"
      << "  --debug                 Shortcut for --log-level debug\n"
      << "  -h, --help              Show this message\n";
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  bool options_ended = false;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (options_ended || argument.empty() || argument.front() != '-' ||
        argument == "-") {
      options.paths.push_back(argument);
      continue;
    }
    if (argument == "--") {
      options_ended = true;
      continue;
    }
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + argument);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeOptions options;
  options.config_file = path;
  const auto base = std::filesystem::absolute(path).parent_path();
  ApplyConfig(ParseYamlConfig(path), base, options);
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_list(merged.paths, cli_options.paths);
  override_list(merged.clang_args, cli_options.clang_args);
  override_list(merged.ignored_paths, cli_options.ignored_paths);
  override_value(merged.output, cli_options.output);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.duplication, cli_options.duplication);
  override_value(merged.progress, cli_options.progress);
  override_value(merged.dry_run, cli_options.dry_run);
  override_value(merged.log_level, cli_options.log_level);
  merged.show_help = cli_options.show_help;
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options) {
  AnalysisConfig config;
  config.paths = options.paths;
  config.ignored_paths = options.ignored_paths;
  config.compute_duplication = options.duplication.value_or(true);
  return config;
}

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &err) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(out);
    return 0;
  }

  const auto options = ResolveAnalyzeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(options), err);

  AnalysisPipelineBuilder builder;
  builder.WithLogger(logger).WithClangArguments(options.clang_args);
  if (options.progress.value_or(true)) {
    builder.WithProgress(MakeProgressBar(err));
  }
  auto pipeline = builder.Build();

  const auto config = BuildAnalysisConfig(options);
  const auto sources = pipeline.Discover(config);

  if (options.dry_run.value_or(false)) {
    out << "Planned analysis (" << sources.files.size() << " file(s)):\n";
    for (const auto &file : sources.files) {
      out << "  " << file << "\n";
    }
    return 0;
  }

  err << "Analysing " << sources.files.size() << " files…\n";
  const auto result = pipeline.Analyse(config, sources);

  const auto output = options.output.value_or(kDefaultOutputFile);
  WriteReport(output, result.report);
  out << "→ JSON written to " << output.string() << "\n";
  return 0;
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  return RunAnalyze(arguments, std::cout, std::clog);
}

} // namespace codecheck
