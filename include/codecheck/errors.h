#pragma once

#include <stdexcept>
#include <string>

namespace codecheck {

// A source file could not be turned into a syntax tree.
class ParseError : public std::runtime_error {
public:
  ParseError(const std::string &path, const std::string &detail)
      : std::runtime_error("Failed to parse " + path + ": " + detail),
        path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

// An internal precondition failed. Programming fault, never recovered.
class InvariantViolation : public std::logic_error {
public:
  explicit InvariantViolation(const std::string &message)
      : std::logic_error("Invariant violated: " + message) {}
};

} // namespace codecheck
