#include <codecheck/duplicate_matcher.h>

#include <codecheck/fingerprint.h>
#include <codecheck/sequence_matcher.h>

#include <cmath>
#include <optional>
#include <utility>

namespace codecheck {

namespace {

constexpr char kProgressLabel[] = "duplication";

struct BestMatch {
  double ratio = 0.0;
  std::optional<std::size_t> partner;

  void Offer(double candidate, std::size_t index) {
    if (candidate > ratio) {
      ratio = candidate;
      partner = index;
    }
  }
};

} // namespace

std::vector<ReportNode *> CollectLeaves(std::vector<ReportNode> &roots) {
  std::vector<ReportNode *> leaves;
  std::vector<ReportNode *> stack;
  for (auto root = roots.rbegin(); root != roots.rend(); ++root) {
    stack.push_back(&*root);
  }
  while (!stack.empty()) {
    auto *node = stack.back();
    stack.pop_back();
    if (node->IsLeaf()) {
      leaves.push_back(node);
      continue;
    }
    for (auto child = node->children.rbegin(); child != node->children.rend();
         ++child) {
      stack.push_back(&*child);
    }
  }
  return leaves;
}

double RoundScore(double ratio) { return std::round(ratio * 1000.0) / 1000.0; }

DuplicateMatcher::DuplicateMatcher(std::shared_ptr<Logger> logger,
                                   ProgressCallback progress)
    : logger_(EnsureLogger(std::move(logger))),
      progress_(std::move(progress)) {}

MatchSummary DuplicateMatcher::Match(std::vector<ReportNode> &files) const {
  const auto leaves = CollectLeaves(files);
  const auto count = leaves.size();

  MatchSummary summary;
  summary.leaves = count;
  std::vector<BestMatch> best(count);

  for (std::size_t i = 0; i < count; ++i) {
    ReportProgress(progress_, i + 1, count, kProgressLabel);
    const auto &left = leaves[i]->Leaf();
    for (std::size_t j = i + 1; j < count; ++j) {
      const auto &right = leaves[j]->Leaf();
      if (left.fingerprint.empty() || right.fingerprint.empty()) {
        ++summary.pairs_skipped;
        continue;
      }
      if (JaccardSimilarity(left.fingerprint, right.fingerprint) <
          kJaccardMin) {
        ++summary.pairs_skipped;
        continue;
      }

      ++summary.pairs_compared;
      const auto ratio = SimilarityRatio(left.source, right.source);
      best[i].Offer(ratio, j);
      best[j].Offer(ratio, i);
    }
  }
  ReportProgress(progress_, count, count, kProgressLabel);

  for (std::size_t index = 0; index < count; ++index) {
    if (!best[index].partner) {
      continue;
    }
    const auto *other = leaves[*best[index].partner];
    Duplication record;
    record.score = RoundScore(best[index].ratio);
    record.other = other->qualname.empty() ? other->name : other->qualname;
    record.lines_other = other->Leaf().metrics.lines;
    leaves[index]->AttachDuplication(std::move(record));
    ++summary.duplicates;
  }

  logger_->Log(LogLevel::kInfo, "duplication.summary",
               {{"leaves", std::to_string(summary.leaves)},
                {"pairs_compared", std::to_string(summary.pairs_compared)},
                {"pairs_skipped", std::to_string(summary.pairs_skipped)},
                {"duplicates", std::to_string(summary.duplicates)}});
  return summary;
}

} // namespace codecheck
