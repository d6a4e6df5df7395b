#include <codecheck/sequence_matcher.h>

#include <algorithm>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace codecheck {

namespace {

constexpr std::size_t kAutoJunkMinLength = 200;

std::size_t Index(char character) {
  return static_cast<unsigned char>(character);
}

} // namespace

SequenceMatcher::SequenceMatcher(std::string_view a, std::string_view b)
    : a_(a), b_(b) {
  for (std::size_t j = 0; j < b_.size(); ++j) {
    b2j_[Index(b_[j])].push_back(j);
  }
  if (b_.size() >= kAutoJunkMinLength) {
    const auto threshold = b_.size() / 100 + 1;
    for (auto &positions : b2j_) {
      if (positions.size() > threshold) {
        positions.clear();
      }
    }
  }
}

SequenceMatcher::Block
SequenceMatcher::FindLongestMatch(std::size_t alo, std::size_t ahi,
                                  std::size_t blo, std::size_t bhi) const {
  std::size_t best_i = alo;
  std::size_t best_j = blo;
  std::size_t best_size = 0;

  // j2len[j] = length of the longest match ending at a[i-1] and b[j].
  std::unordered_map<std::size_t, std::size_t> j2len;
  for (std::size_t i = alo; i < ahi; ++i) {
    std::unordered_map<std::size_t, std::size_t> next_j2len;
    for (const auto j : b2j_[Index(a_[i])]) {
      if (j < blo) {
        continue;
      }
      if (j >= bhi) {
        break;
      }
      std::size_t length = 1;
      if (j > 0) {
        const auto previous = j2len.find(j - 1);
        if (previous != j2len.end()) {
          length = previous->second + 1;
        }
      }
      next_j2len[j] = length;
      if (length > best_size) {
        best_i = i + 1 - length;
        best_j = j + 1 - length;
        best_size = length;
      }
    }
    j2len = std::move(next_j2len);
  }

  while (best_i > alo && best_j > blo && a_[best_i - 1] == b_[best_j - 1]) {
    --best_i;
    --best_j;
    ++best_size;
  }
  while (best_i + best_size < ahi && best_j + best_size < bhi &&
         a_[best_i + best_size] == b_[best_j + best_size]) {
    ++best_size;
  }
  return {best_i, best_j, best_size};
}

std::vector<SequenceMatcher::Block> SequenceMatcher::MatchingBlocks() const {
  std::vector<Block> found;
  std::vector<std::tuple<std::size_t, std::size_t, std::size_t, std::size_t>>
      pending = {{0, a_.size(), 0, b_.size()}};
  while (!pending.empty()) {
    const auto [alo, ahi, blo, bhi] = pending.back();
    pending.pop_back();
    const auto match = FindLongestMatch(alo, ahi, blo, bhi);
    if (match.size == 0) {
      continue;
    }
    found.push_back(match);
    if (alo < match.a && blo < match.b) {
      pending.emplace_back(alo, match.a, blo, match.b);
    }
    if (match.a + match.size < ahi && match.b + match.size < bhi) {
      pending.emplace_back(match.a + match.size, ahi, match.b + match.size,
                           bhi);
    }
  }

  std::sort(found.begin(), found.end(), [](const auto &left, const auto &right) {
    return std::tie(left.a, left.b) < std::tie(right.a, right.b);
  });

  std::vector<Block> merged;
  for (const auto &block : found) {
    if (!merged.empty()) {
      auto &last = merged.back();
      if (last.a + last.size == block.a && last.b + last.size == block.b) {
        last.size += block.size;
        continue;
      }
    }
    merged.push_back(block);
  }
  return merged;
}

double SequenceMatcher::Ratio() const {
  const auto total = a_.size() + b_.size();
  if (total == 0) {
    return 1.0;
  }
  std::size_t matches = 0;
  for (const auto &block : MatchingBlocks()) {
    matches += block.size;
  }
  return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

double SimilarityRatio(std::string_view a, std::string_view b) {
  return SequenceMatcher(a, b).Ratio();
}

} // namespace codecheck
