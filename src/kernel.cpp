#include "skern/kernel.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include "skern/gram.hpp"
#include "skern/similarity.hpp"

namespace skern {

namespace {

auto CreateLogScorer(SimilarityConfig config) {
  return [config](const std::string& lhs, const std::string& rhs) -> double {
    return SubsequenceScore(lhs, rhs, config).log();
  };
}

constexpr bool IsZeroScore(double log_score) noexcept {
  return log_score == -std::numeric_limits<double>::infinity();
}

// gram(i, j) = exp(log_gram(i, j) - (lhs_self(i) + rhs_self(j)) / 2)
Eigen::MatrixXd NormalizeLogGram(const Eigen::MatrixXd& log_gram,
                                 const Eigen::VectorXd& lhs_self,
                                 const Eigen::VectorXd& rhs_self) {
  Eigen::MatrixXd gram(log_gram.rows(), log_gram.cols());
  for (Eigen::Index i = 0; i < log_gram.rows(); ++i) {
    for (Eigen::Index j = 0; j < log_gram.cols(); ++j) {
      if (IsZeroScore(log_gram(i, j)) || IsZeroScore(lhs_self(i)) ||
          IsZeroScore(rhs_self(j))) {
        gram(i, j) = 0.;
        continue;
      }
      gram(i, j) =
          std::exp(log_gram(i, j) - 0.5 * (lhs_self(i) + rhs_self(j)));
    }
  }
  return gram;
}

}  // namespace

struct StringKernel::Impl {
  StringKernelConfig config;
};

StringKernel::StringKernel(StringKernelConfig config)
    : pimpl_(std::unique_ptr<Impl>(new Impl{.config = std::move(config)})) {}

StringKernel::~StringKernel() = default;

const StringKernelConfig& StringKernel::config() const noexcept {
  return pimpl_->config;
}

double StringKernel::Compute(const std::string& lhs,
                             const std::string& rhs) const {
  if (pimpl_->config.normalize) {
    return NormalizedSimilarity(lhs, rhs, pimpl_->config.similarity);
  }
  return SubsequenceSimilarity(lhs, rhs, pimpl_->config.similarity);
}

Eigen::MatrixXd StringKernel::K(std::span<const std::string> inputs) const {
  const auto& cfg = pimpl_->config;
  if (!cfg.normalize) {
    return ComputeGram<std::string>(*this, inputs, cfg.thread_pool,
                                     cfg.update_progress);
  }

  auto log_gram = EvaluateSymmetricGram<std::string>(
      inputs, CreateLogScorer(cfg.similarity), cfg.thread_pool,
      cfg.update_progress);
  Eigen::VectorXd log_self = log_gram.diagonal();
  return NormalizeLogGram(log_gram, log_self, log_self);
}

Eigen::MatrixXd StringKernel::K(std::span<const std::string> lhs,
                                std::span<const std::string> rhs) const {
  const auto& cfg = pimpl_->config;
  if (!cfg.normalize) {
    return ComputeGram<std::string>(*this, lhs, rhs, cfg.thread_pool,
                                     cfg.update_progress);
  }

  auto log_scorer = CreateLogScorer(cfg.similarity);
  auto lhs_self =
      EvaluateDiagonal<std::string>(lhs, log_scorer, cfg.thread_pool);
  auto rhs_self =
      EvaluateDiagonal<std::string>(rhs, log_scorer, cfg.thread_pool);
  auto log_gram = EvaluateGram<std::string>(lhs, rhs, log_scorer,
                                            cfg.thread_pool,
                                            cfg.update_progress);
  return NormalizeLogGram(log_gram, lhs_self, rhs_self);
}

Eigen::VectorXd StringKernel::Kdiag(std::span<const std::string> inputs) const {
  const auto& cfg = pimpl_->config;
  if (!cfg.normalize) {
    return ComputeDiagonal<std::string>(*this, inputs, cfg.thread_pool);
  }

  // k(s, s) is zero only for the empty string without the empty alignment
  Eigen::VectorXd diag(static_cast<Eigen::Index>(inputs.size()));
  for (auto i = 0uz; i < inputs.size(); ++i) {
    diag(static_cast<Eigen::Index>(i)) =
        cfg.similarity.count_empty || !inputs[i].empty() ? 1. : 0.;
  }
  return diag;
}

}  // namespace skern
