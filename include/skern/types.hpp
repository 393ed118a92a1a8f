#ifndef SKERN_TYPES_HPP_
#define SKERN_TYPES_HPP_

#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>

#include "thread_pool/thread_pool.hpp"

namespace skern {

// Raised when a similarity is requested for an absent sequence.
class InvalidInputError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct SimilarityConfig {
  // report the empty common subsequence as one alignment
  bool count_empty = false;
};

struct StringKernelConfig {
  std::shared_ptr<thread_pool::ThreadPool> thread_pool;
  SimilarityConfig similarity;
  bool normalize = false;
  // called once per finished Gram matrix row, possibly from pool threads
  std::function<void()> update_progress;
};

// Non-negative score stored as significand * 2^exponent.
struct SimilarityScore {
 public:
  constexpr SimilarityScore() {}

  constexpr SimilarityScore(double significand, std::int64_t exponent)
      : significand(significand), exponent(exponent) {}

  // +inf once the score leaves the range of double
  double value() const noexcept {
    return std::ldexp(significand, static_cast<int>(exponent));
  }

  // -inf for a zero score
  double log() const noexcept {
    return std::log(significand) +
           static_cast<double>(exponent) * std::numbers::ln2;
  }

  bool is_zero() const noexcept { return significand == 0.; }

  double significand = 0.;
  std::int64_t exponent = 0;
};

// Named symbol string, constructible by the bioparser parsers.
struct Sequence {
 public:
  Sequence() = default;

  Sequence(std::string name, std::string data)
      : name(std::move(name)), data(std::move(data)) {}

  Sequence(const char* name, std::uint32_t name_len, const char* data,
           std::uint32_t data_len)
      : name(name, name_len), data(data, data_len) {}

  Sequence(const char* name, std::uint32_t name_len, const char* data,
           std::uint32_t data_len, const char* /* quality */,
           std::uint32_t /* quality_len */)
      : Sequence(name, name_len, data, data_len) {}

  std::string name;
  std::string data;
};

}  // namespace skern

#endif  // SKERN_TYPES_HPP_
