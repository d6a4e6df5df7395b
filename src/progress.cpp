#include <codecheck/progress.h>

#include <codecheck/errors.h>

#include <ostream>

namespace codecheck {

namespace {
constexpr std::size_t kBarLength = 20;
} // namespace

void ReportProgress(const ProgressCallback &callback, std::size_t current,
                    std::size_t total, const std::string &label) {
  if (callback) {
    callback(current, total, label);
  }
}

std::string FormatProgressBar(std::size_t current, std::size_t total,
                              const std::string &label) {
  if (total == 0 && current != 0) {
    throw InvariantViolation("progress " + std::to_string(current) +
                             " reported against an empty total");
  }
  if (current > total) {
    throw InvariantViolation("progress " + std::to_string(current) +
                             " exceeds total " + std::to_string(total));
  }
  const auto filled = total == 0 ? kBarLength : kBarLength * current / total;
  std::string line = "\r" + label + " [";
  line.append(filled, '#');
  line.append(kBarLength - filled, '-');
  line += "] " + std::to_string(current) + "/" + std::to_string(total);
  if (current == total) {
    line.push_back('\n');
  }
  return line;
}

ProgressCallback MakeProgressBar(std::ostream &stream) {
  return [&stream](std::size_t current, std::size_t total,
                   const std::string &label) {
    stream << FormatProgressBar(current, total, label) << std::flush;
  };
}

} // namespace codecheck
