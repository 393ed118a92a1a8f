#ifndef SKERN_GRAM_HPP_
#define SKERN_GRAM_HPP_

#include <concepts>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <span>
#include <type_traits>
#include <vector>

#include "Eigen/Dense"
#include "skern/kernel.hpp"
#include "thread_pool/thread_pool.hpp"

namespace skern {

// Pairwise evaluation function accepted by the Gram routines.
template <class F, class Input>
concept PairwiseFunction = requires(const F& f, const Input& input) {
  { f(input, input) } -> std::convertible_to<double>;
};

namespace detail {

// Runs row_op(i) for every row, one pool task per row. All tasks are joined
// before the first exception, if any, is rethrown. update_progress is called
// once per finished row and must be thread safe.
template <class RowOp>
inline void ForEachRow(std::size_t num_rows, const RowOp& row_op,
                       const std::shared_ptr<thread_pool::ThreadPool>& pool,
                       const std::function<void()>& update_progress) {
  auto run_row = [&row_op, &update_progress](std::size_t row_idx) -> void {
    row_op(row_idx);
    if (update_progress) {
      update_progress();
    }
  };

  if (pool == nullptr) {
    for (auto i = 0uz; i < num_rows; ++i) {
      run_row(i);
    }
    return;
  }

  std::vector<std::future<void>> futures;
  futures.reserve(num_rows);
  for (auto i = 0uz; i < num_rows; ++i) {
    futures.push_back(pool->Submit(run_row, i));
  }

  for (auto& future : futures) {
    future.wait();
  }
  for (auto& future : futures) {
    future.get();
  }
}

}  // namespace detail

template <class Input, class F>
  requires(PairwiseFunction<F, Input>)
Eigen::MatrixXd EvaluateGram(
    std::span<const Input> lhs, std::span<const Input> rhs, const F& func,
    const std::shared_ptr<thread_pool::ThreadPool>& thread_pool = nullptr,
    const std::function<void()>& update_progress = {}) {
  Eigen::MatrixXd gram(static_cast<Eigen::Index>(lhs.size()),
                       static_cast<Eigen::Index>(rhs.size()));
  detail::ForEachRow(
      lhs.size(),
      [&](std::size_t i) -> void {
        for (auto j = 0uz; j < rhs.size(); ++j) {
          gram(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
              func(lhs[i], rhs[j]);
        }
      },
      thread_pool, update_progress);
  return gram;
}

// Evaluates the upper triangle only and mirrors it.
template <class Input, class F>
  requires(PairwiseFunction<F, Input>)
Eigen::MatrixXd EvaluateSymmetricGram(
    std::span<const Input> inputs, const F& func,
    const std::shared_ptr<thread_pool::ThreadPool>& thread_pool = nullptr,
    const std::function<void()>& update_progress = {}) {
  const auto n = static_cast<Eigen::Index>(inputs.size());
  Eigen::MatrixXd gram(n, n);
  detail::ForEachRow(
      inputs.size(),
      [&](std::size_t i) -> void {
        const auto row = static_cast<Eigen::Index>(i);
        for (auto j = i; j < inputs.size(); ++j) {
          const auto col = static_cast<Eigen::Index>(j);
          gram(row, col) = gram(col, row) = func(inputs[i], inputs[j]);
        }
      },
      thread_pool, update_progress);
  return gram;
}

template <class Input, class F>
  requires(PairwiseFunction<F, Input>)
Eigen::VectorXd EvaluateDiagonal(
    std::span<const Input> inputs, const F& func,
    const std::shared_ptr<thread_pool::ThreadPool>& thread_pool = nullptr,
    const std::function<void()>& update_progress = {}) {
  Eigen::VectorXd diag(static_cast<Eigen::Index>(inputs.size()));
  detail::ForEachRow(
      inputs.size(),
      [&](std::size_t i) -> void {
        diag(static_cast<Eigen::Index>(i)) = func(inputs[i], inputs[i]);
      },
      thread_pool, update_progress);
  return diag;
}

template <class Input>
Eigen::MatrixXd ComputeGram(
    const Kernel<Input>& kernel,
    std::span<const std::type_identity_t<Input>> lhs,
    std::span<const std::type_identity_t<Input>> rhs,
    const std::shared_ptr<thread_pool::ThreadPool>& thread_pool = nullptr,
    const std::function<void()>& update_progress = {}) {
  return EvaluateGram<Input>(
      lhs, rhs,
      [&kernel](const Input& l, const Input& r) -> double {
        return kernel.Compute(l, r);
      },
      thread_pool, update_progress);
}

template <class Input>
Eigen::MatrixXd ComputeGram(
    const Kernel<Input>& kernel,
    std::span<const std::type_identity_t<Input>> inputs,
    const std::shared_ptr<thread_pool::ThreadPool>& thread_pool = nullptr,
    const std::function<void()>& update_progress = {}) {
  return EvaluateSymmetricGram<Input>(
      inputs,
      [&kernel](const Input& l, const Input& r) -> double {
        return kernel.Compute(l, r);
      },
      thread_pool, update_progress);
}

template <class Input>
Eigen::VectorXd ComputeDiagonal(
    const Kernel<Input>& kernel,
    std::span<const std::type_identity_t<Input>> inputs,
    const std::shared_ptr<thread_pool::ThreadPool>& thread_pool = nullptr,
    const std::function<void()>& update_progress = {}) {
  return EvaluateDiagonal<Input>(
      inputs,
      [&kernel](const Input& l, const Input& r) -> double {
        return kernel.Compute(l, r);
      },
      thread_pool, update_progress);
}

// Smallest eigenvalue of a symmetric matrix, 0 for an empty one.
// Throws std::invalid_argument if gram is not square.
double MinEigenvalue(const Eigen::MatrixXd& gram);

// Empirical check: the smallest eigenvalue is not below
// -tolerance * max(1, largest absolute eigenvalue).
bool IsPositiveSemiDefinite(const Eigen::MatrixXd& gram,
                            double tolerance = 1e-9);

}  // namespace skern

#endif  // SKERN_GRAM_HPP_
