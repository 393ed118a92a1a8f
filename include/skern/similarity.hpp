#ifndef SKERN_SIMILARITY_HPP_
#define SKERN_SIMILARITY_HPP_

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "skern/types.hpp"

namespace skern {

// Rows are rescaled by 2^-kRescaleExponent once they grow past 2^512.
inline constexpr int kRescaleExponent = 512;
inline constexpr double kRescaleThreshold = 0x1p512;

// Weighted common-subsequence score of two symbol sequences.
//
// dp[i][k] counts the pairs of index subsequences of lhs[0, i) and rhs[0, k)
// which spell the same symbol string, the empty pair included. Row 0 and
// column 0 hold the base value 1. Only the previous row of dp is kept:
//
//   p[k] = p[last] (+ dp[i - 1][k - 1] and last = k if rhs[k - 1] == lhs[i - 1])
//   dp[i][k] = dp[i - 1][k] + p[k]
//
// The empty alignment is removed from the result unless config.count_empty
// is set.
template <class T>
  requires std::equality_comparable<T>
SimilarityScore SubsequenceScore(std::span<const T> lhs,
                                 std::span<const T> rhs,
                                 SimilarityConfig config = {}) {
  std::vector<double> row(rhs.size() + 1, 1.);
  std::vector<double> acc(rhs.size() + 1, 0.);
  std::int64_t exponent = 0;

  for (auto i = 1uz; i <= lhs.size(); ++i) {
    auto last = 0uz;
    acc[0] = 0.;
    for (auto k = 1uz; k <= rhs.size(); ++k) {
      acc[k] = acc[last];
      if (rhs[k - 1] == lhs[i - 1]) {
        acc[k] = acc[last] + row[k - 1];
        last = k;
      }
    }

    for (auto k = 1uz; k <= rhs.size(); ++k) {
      row[k] += acc[k];
    }

    // rows are non-decreasing, the last cell is the maximum
    if (row.back() > kRescaleThreshold) {
      for (auto& it : row) {
        it = std::ldexp(it, -kRescaleExponent);
      }
      exponent += kRescaleExponent;
    }
  }

  if (config.count_empty) {
    return SimilarityScore(row.back(), exponent);
  }

  auto base = std::ldexp(1., static_cast<int>(-exponent));
  return SimilarityScore(std::max(0., row.back() - base), exponent);
}

template <class T>
  requires std::equality_comparable<T>
double SubsequenceSimilarity(std::span<const T> lhs, std::span<const T> rhs,
                             SimilarityConfig config = {}) {
  return SubsequenceScore<T>(lhs, rhs, config).value();
}

SimilarityScore SubsequenceScore(std::string_view lhs, std::string_view rhs,
                                 SimilarityConfig config = {});

// Throws InvalidInputError if either pointer is null.
SimilarityScore SubsequenceScore(const char* lhs, const char* rhs,
                                 SimilarityConfig config = {});

// Throws InvalidInputError if either pointer is null.
SimilarityScore SubsequenceScore(const std::unique_ptr<Sequence>& lhs,
                                 const std::unique_ptr<Sequence>& rhs,
                                 SimilarityConfig config = {});

double SubsequenceSimilarity(std::string_view lhs, std::string_view rhs,
                             SimilarityConfig config = {});

double SubsequenceSimilarity(const char* lhs, const char* rhs,
                             SimilarityConfig config = {});

double SubsequenceSimilarity(const std::unique_ptr<Sequence>& lhs,
                             const std::unique_ptr<Sequence>& rhs,
                             SimilarityConfig config = {});

// log k(lhs, rhs) - (log k(lhs, lhs) + log k(rhs, rhs)) / 2, exponentiated.
// Zero when either side has a zero self score.
double NormalizedSimilarity(std::string_view lhs, std::string_view rhs,
                            SimilarityConfig config = {});

}  // namespace skern

#endif  // SKERN_SIMILARITY_HPP_
