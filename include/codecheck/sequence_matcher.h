#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace codecheck {

// Ratcliff/Obershelp matcher over the characters of two texts. Characters
// that occur in more than 1% of a text of at least 200 characters are
// "popular" and never seed a match, though matches may extend over them.
class SequenceMatcher {
public:
  struct Block {
    std::size_t a = 0;
    std::size_t b = 0;
    std::size_t size = 0;
  };

  SequenceMatcher(std::string_view a, std::string_view b);

  Block FindLongestMatch(std::size_t alo, std::size_t ahi, std::size_t blo,
                         std::size_t bhi) const;
  // Non-overlapping matching blocks in ascending order, adjacent blocks
  // merged.
  std::vector<Block> MatchingBlocks() const;
  // 2*M / (|a| + |b|); 1.0 when both texts are empty.
  double Ratio() const;

private:
  std::string_view a_;
  std::string_view b_;
  std::array<std::vector<std::size_t>, 256> b2j_;
};

double SimilarityRatio(std::string_view a, std::string_view b);

} // namespace codecheck
