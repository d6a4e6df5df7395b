#pragma once

#include <codecheck/interfaces.h>

#include <string>

namespace codecheck {

// "0.987", "1.0", "0.5": three decimals at most, one at least.
std::string FormatScore(double score);

// Pretty-printed JSON (two-space indent) of the report tree. Fingerprints
// are internal and never rendered.
class JsonReporter : public Reporter {
public:
  std::string Render(const ReportNode &root) override;
};

} // namespace codecheck
