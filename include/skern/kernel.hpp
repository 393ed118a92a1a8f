#ifndef SKERN_KERNEL_HPP_
#define SKERN_KERNEL_HPP_

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "Eigen/Dense"
#include "skern/types.hpp"

namespace skern {

// Covariance function over a pair of same-typed inputs.
template <class Input>
class Kernel {
 public:
  virtual ~Kernel() = default;

  virtual std::string_view name() const noexcept = 0;

  virtual std::uint32_t input_dim() const noexcept = 0;

  virtual std::uint32_t output_dim() const noexcept = 0;

  virtual double Compute(const Input& lhs, const Input& rhs) const = 0;
};

class StringKernel : public Kernel<std::string> {
 public:
  explicit StringKernel(StringKernelConfig config = {});

  StringKernel(const StringKernel&) = delete;
  StringKernel& operator=(const StringKernel&) = delete;

  StringKernel(StringKernel&&) = default;
  StringKernel& operator=(StringKernel&&) = default;

  ~StringKernel() override;

  std::string_view name() const noexcept override { return "sk"; }

  std::uint32_t input_dim() const noexcept override { return 1; }

  std::uint32_t output_dim() const noexcept override { return 1; }

  const StringKernelConfig& config() const noexcept;

  // raw subsequence similarity, or its normalized form in [0, 1]
  double Compute(const std::string& lhs,
                 const std::string& rhs) const override;

  // symmetric Gram matrix over inputs
  Eigen::MatrixXd K(std::span<const std::string> inputs) const;

  // |lhs| x |rhs| cross Gram matrix
  Eigen::MatrixXd K(std::span<const std::string> lhs,
                    std::span<const std::string> rhs) const;

  Eigen::VectorXd Kdiag(std::span<const std::string> inputs) const;

 private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
};

}  // namespace skern

#endif  // SKERN_KERNEL_HPP_
