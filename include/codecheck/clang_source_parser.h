#pragma once

#include <codecheck/interfaces.h>
#include <codecheck/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace codecheck {

// Strips comment markers (///, //!, /**, /*!, */, leading *) from a raw
// documentation comment and trims blank leading and trailing lines.
std::string CleanDocComment(const std::string &raw);

// Front-end arguments for one file: the configured ones, plus "-x c++" and
// "-std=c++17" for anything but C sources unless already given.
std::vector<std::string>
BuildParserArguments(const std::filesystem::path &file,
                     const std::vector<std::string> &configured);

// libclang front-end. Reports top-level function and class definitions of
// the main file (namespaces and linkage blocks are transparent) and, per
// class, its directly defined methods.
class ClangSourceParser : public SourceParser {
public:
  explicit ClangSourceParser(std::vector<std::string> arguments = {},
                             std::shared_ptr<Logger> logger = nullptr);

  ParsedFile Parse(const std::string &path) override;

private:
  std::vector<std::string> arguments_;
  std::shared_ptr<Logger> logger_;
};

} // namespace codecheck
