#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

namespace codecheck {

// Observes (current, total, label) after each completed unit of work. Must
// not influence control flow; an empty callback is a no-op.
using ProgressCallback =
    std::function<void(std::size_t current, std::size_t total,
                       const std::string &label)>;

void ReportProgress(const ProgressCallback &callback, std::size_t current,
                    std::size_t total, const std::string &label);

// "\r<label> [#####---------------] 5/20", newline once current == total.
std::string FormatProgressBar(std::size_t current, std::size_t total,
                              const std::string &label);

ProgressCallback MakeProgressBar(std::ostream &stream);

} // namespace codecheck
