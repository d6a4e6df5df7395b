#pragma once

#include <codecheck/models.h>

#include <string>
#include <string_view>

namespace codecheck {

// Lines [first_line, last_line] (1-based, inclusive) with their line
// endings. Lines outside the text are ignored.
std::string SliceLines(std::string_view text, int first_line, int last_line);

// Leaf node for a function or method unit, with metrics and fingerprint.
ReportNode AnalyzeFunction(const ParsedUnit &unit, const std::string &path,
                           std::string_view file_source);

ReportNode AnalyzeClass(const ParsedUnit &unit, const std::string &path,
                        std::string_view file_source);

// File node with one child per top-level class and function.
ReportNode AnalyzeFile(const ParsedFile &file);

} // namespace codecheck
