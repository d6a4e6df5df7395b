#pragma once

#include <codecheck/models.h>

#include <cstddef>
#include <string>
#include <vector>

namespace codecheck {

inline constexpr std::size_t kShingleWidth = 5;
inline constexpr std::size_t kFingerprintSize = 50;
inline constexpr std::size_t kMinTokens = 25;

inline constexpr char kNumberPlaceholder[] = "0";
inline constexpr char kStringPlaceholder[] = "STR";

// Placeholder for a literal token: "0" for numbers (spelling starts with a
// digit or '.'), "STR" for string and character literals.
std::string NormalizeLiteral(const std::string &spelling);

// Winnowing sketch over normalized tokens: hashes of all kShingleWidth-token
// windows, sorted with repeats kept, of which the first kFingerprintSize form
// the set. Empty when there are fewer than kMinTokens tokens.
Fingerprint ComputeFingerprint(const std::vector<std::string> &tokens);

double JaccardSimilarity(const Fingerprint &a, const Fingerprint &b);

} // namespace codecheck
