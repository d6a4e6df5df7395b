#include <codecheck/fingerprint.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>

namespace codecheck {

std::string NormalizeLiteral(const std::string &spelling) {
  if (!spelling.empty() &&
      (std::isdigit(static_cast<unsigned char>(spelling.front())) != 0 ||
       spelling.front() == '.')) {
    return kNumberPlaceholder;
  }
  return kStringPlaceholder;
}

Fingerprint ComputeFingerprint(const std::vector<std::string> &tokens) {
  if (tokens.size() < kMinTokens) {
    return {};
  }

  const std::hash<std::string> hasher;
  std::vector<std::uint64_t> hashes;
  hashes.reserve(tokens.size() - kShingleWidth + 1);
  for (std::size_t i = 0; i + kShingleWidth <= tokens.size(); ++i) {
    std::string window = tokens[i];
    for (std::size_t j = 1; j < kShingleWidth; ++j) {
      window.push_back(' ');
      window.append(tokens[i + j]);
    }
    hashes.push_back(static_cast<std::uint64_t>(hasher(window)));
  }

  // Repeated shingles take several of the kept slots.
  std::sort(hashes.begin(), hashes.end());
  const auto keep = std::min(hashes.size(), kFingerprintSize);
  return Fingerprint(hashes.begin(),
                     hashes.begin() + static_cast<std::ptrdiff_t>(keep));
}

double JaccardSimilarity(const Fingerprint &a, const Fingerprint &b) {
  if (a.empty() && b.empty()) {
    return 0.0;
  }
  std::size_t intersection = 0;
  auto left = a.begin();
  auto right = b.begin();
  while (left != a.end() && right != b.end()) {
    if (*left < *right) {
      ++left;
    } else if (*right < *left) {
      ++right;
    } else {
      ++intersection;
      ++left;
      ++right;
    }
  }
  const auto union_size = a.size() + b.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(union_size);
}

} // namespace codecheck
