#include "skern/similarity.hpp"

#include <sstream>

namespace skern {

namespace {

[[noreturn]] void ThrowNullInput(std::string_view func, bool lhs_null,
                                 bool rhs_null) {
  throw InvalidInputError([&] {
    auto ostrm = std::ostringstream{};
    ostrm << "[skern::" << func << "] error: ";
    if (lhs_null && rhs_null) {
      ostrm << "both sequences are null";
    } else {
      ostrm << (lhs_null ? "lhs" : "rhs") << " sequence is null";
    }
    return ostrm.str();
  }());
}

}  // namespace

SimilarityScore SubsequenceScore(std::string_view lhs, std::string_view rhs,
                                 SimilarityConfig config) {
  return SubsequenceScore<char>(std::span(lhs.data(), lhs.size()),
                                std::span(rhs.data(), rhs.size()), config);
}

SimilarityScore SubsequenceScore(const char* lhs, const char* rhs,
                                 SimilarityConfig config) {
  if (lhs == nullptr || rhs == nullptr) {
    ThrowNullInput("SubsequenceScore", lhs == nullptr, rhs == nullptr);
  }
  return SubsequenceScore(std::string_view(lhs), std::string_view(rhs),
                          config);
}

SimilarityScore SubsequenceScore(const std::unique_ptr<Sequence>& lhs,
                                 const std::unique_ptr<Sequence>& rhs,
                                 SimilarityConfig config) {
  if (lhs == nullptr || rhs == nullptr) {
    ThrowNullInput("SubsequenceScore", lhs == nullptr, rhs == nullptr);
  }
  return SubsequenceScore(std::string_view(lhs->data),
                          std::string_view(rhs->data), config);
}

double SubsequenceSimilarity(std::string_view lhs, std::string_view rhs,
                             SimilarityConfig config) {
  return SubsequenceScore(lhs, rhs, config).value();
}

double SubsequenceSimilarity(const char* lhs, const char* rhs,
                             SimilarityConfig config) {
  return SubsequenceScore(lhs, rhs, config).value();
}

double SubsequenceSimilarity(const std::unique_ptr<Sequence>& lhs,
                             const std::unique_ptr<Sequence>& rhs,
                             SimilarityConfig config) {
  return SubsequenceScore(lhs, rhs, config).value();
}

double NormalizedSimilarity(std::string_view lhs, std::string_view rhs,
                            SimilarityConfig config) {
  auto cross = SubsequenceScore(lhs, rhs, config);
  if (cross.is_zero()) {
    return 0.;
  }

  auto lhs_self = SubsequenceScore(lhs, lhs, config);
  auto rhs_self = SubsequenceScore(rhs, rhs, config);
  if (lhs_self.is_zero() || rhs_self.is_zero()) {
    return 0.;
  }

  return std::exp(cross.log() - 0.5 * (lhs_self.log() + rhs_self.log()));
}

}  // namespace skern
