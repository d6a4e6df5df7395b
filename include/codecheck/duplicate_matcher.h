#pragma once

#include <codecheck/logging.h>
#include <codecheck/models.h>
#include <codecheck/progress.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace codecheck {

inline constexpr double kJaccardMin = 0.3;

struct MatchSummary {
  std::size_t leaves = 0;
  std::size_t pairs_compared = 0;
  std::size_t pairs_skipped = 0;
  std::size_t duplicates = 0;
};

// Leaf nodes (functions and methods) of the given trees in pre-order.
std::vector<ReportNode *> CollectLeaves(std::vector<ReportNode> &roots);

double RoundScore(double ratio);

class DuplicateMatcher {
public:
  explicit DuplicateMatcher(std::shared_ptr<Logger> logger = nullptr,
                            ProgressCallback progress = {});

  // Attaches to every leaf its single best match among all other leaves.
  // A pair is only compared exactly when both fingerprints are non-empty
  // and their Jaccard similarity is at least kJaccardMin. Ties keep the
  // first match in ascending (i, j) order.
  MatchSummary Match(std::vector<ReportNode> &files) const;

private:
  std::shared_ptr<Logger> logger_;
  ProgressCallback progress_;
};

} // namespace codecheck
