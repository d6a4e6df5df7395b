#include <codecheck/fingerprint.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace codecheck {
namespace {

// int accumulate(const int *values, int count) { int total = 0; for (...)
// { total += values[i] * 0; } return total; }
const std::vector<std::string> kAccumulate = {
    "int",   "accumulate", "(",     "const", "int",    "*",      "values",
    ",",     "int",        "count", ")",     "{",      "int",    "total",
    "=",     "0",          ";",     "for",   "(",      "int",    "i",
    "=",     "0",          ";",     "i",     "<",      "count",  ";",
    "++",    "i",          ")",     "{",     "total",  "+=",     "values",
    "[",     "i",          "]",     "*",     "0",      ";",      "}",
    "return", "total",     ";",     "}"};

std::vector<std::string> DistinctCalls(int calls) {
  std::vector<std::string> tokens;
  for (int i = 0; i < calls; ++i) {
    for (const auto &token :
         {"f" + std::to_string(i), std::string("("), "a" + std::to_string(i),
          std::string(")"), std::string(";")}) {
      tokens.push_back(token);
    }
  }
  return tokens;
}

std::vector<std::string> Repeated(const std::vector<std::string> &block,
                                  int times) {
  std::vector<std::string> tokens;
  for (int i = 0; i < times; ++i) {
    tokens.insert(tokens.end(), block.begin(), block.end());
  }
  return tokens;
}

TEST(NormalizeLiteralTest, DistinguishesNumbersFromStrings) {
  EXPECT_EQ("0", NormalizeLiteral("42"));
  EXPECT_EQ("0", NormalizeLiteral("0x1fu"));
  EXPECT_EQ("0", NormalizeLiteral(".5f"));
  EXPECT_EQ("STR", NormalizeLiteral("\"text\""));
  EXPECT_EQ("STR", NormalizeLiteral("'c'"));
  EXPECT_EQ("STR", NormalizeLiteral("u8\"wide\""));
  EXPECT_EQ("STR", NormalizeLiteral("R\"x(raw)x\""));
}

TEST(FingerprintTest, IsDeterministic) {
  const auto first = ComputeFingerprint(kAccumulate);

  EXPECT_FALSE(first.empty());
  EXPECT_EQ(first, ComputeFingerprint(kAccumulate));
}

TEST(FingerprintTest, ChangesWithTheTokenStream) {
  auto renamed = kAccumulate;
  renamed[1] = "sum";

  EXPECT_NE(ComputeFingerprint(kAccumulate), ComputeFingerprint(renamed));
}

TEST(FingerprintTest, IsEmptyBelowMinimumTokenCount) {
  const std::vector<std::string> short_unit(kMinTokens - 1, "x");
  auto long_enough = short_unit;
  long_enough.push_back("y");

  EXPECT_TRUE(ComputeFingerprint(short_unit).empty());
  EXPECT_FALSE(ComputeFingerprint(long_enough).empty());
}

TEST(FingerprintTest, KeepsAtMostFiftyHashes) {
  const auto fingerprint = ComputeFingerprint(DistinctCalls(40));

  EXPECT_EQ(kFingerprintSize, fingerprint.size());
}

TEST(FingerprintTest, KeepsTheSmallestHashes) {
  const auto tokens = DistinctCalls(40);
  const auto fingerprint = ComputeFingerprint(tokens);
  const auto longer = ComputeFingerprint(DistinctCalls(41));

  // Adding shingles can only push the selection towards smaller values.
  EXPECT_LE(*longer.rbegin(), *fingerprint.rbegin());
}

TEST(FingerprintTest, RepeatedShinglesOccupySeveralSlots) {
  // Four distinct windows, each occurring 39 times: the 50 smallest entries
  // are every copy of the smallest hash and 11 copies of the next one.
  const auto tokens = Repeated({"a", "=", "b", ";"}, 40);

  EXPECT_EQ(2u, ComputeFingerprint(tokens).size());
}

TEST(JaccardSimilarityTest, ComputesIntersectionOverUnion) {
  const Fingerprint a = {1, 2, 3, 4};
  const Fingerprint b = {3, 4, 5, 6};

  EXPECT_DOUBLE_EQ(2.0 / 6.0, JaccardSimilarity(a, b));
  EXPECT_DOUBLE_EQ(1.0, JaccardSimilarity(a, a));
  EXPECT_DOUBLE_EQ(0.0, JaccardSimilarity(a, {}));
  EXPECT_DOUBLE_EQ(0.0, JaccardSimilarity({}, {}));
}

} // namespace
} // namespace codecheck
