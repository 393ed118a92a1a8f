// Copyright (c) 2026 skern authors

#include "skern/kernel.hpp"

#include <atomic>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "skern/gram.hpp"
#include "skern/similarity.hpp"
#include "thread_pool/thread_pool.hpp"

namespace skern {
namespace test {

class SkernStringKernelTest : public ::testing::Test {
 public:
  void SetUp() override {
    thread_pool = std::make_shared<thread_pool::ThreadPool>(2);
    inputs = {"cat", "car", "abc", "GATTACA", "", "aaa", "aab"};
  }

  std::shared_ptr<thread_pool::ThreadPool> thread_pool;
  std::vector<std::string> inputs;
};

TEST_F(SkernStringKernelTest, Metadata) {
  StringKernel kernel;
  EXPECT_EQ("sk", kernel.name());
  EXPECT_EQ(1u, kernel.input_dim());
  EXPECT_EQ(1u, kernel.output_dim());
  EXPECT_FALSE(kernel.config().normalize);
  EXPECT_FALSE(kernel.config().thread_pool);
}

TEST_F(SkernStringKernelTest, Compute) {
  StringKernel kernel;
  EXPECT_EQ(7., kernel.Compute("abc", "abc"));
  EXPECT_EQ(3., kernel.Compute("cat", "car"));
  EXPECT_EQ(0., kernel.Compute("", "car"));

  StringKernel counting(
      StringKernelConfig{.similarity = SimilarityConfig{.count_empty = true}});
  EXPECT_EQ(8., counting.Compute("abc", "abc"));
  EXPECT_EQ(1., counting.Compute("", "car"));

  StringKernel normalized(StringKernelConfig{.normalize = true});
  EXPECT_DOUBLE_EQ(1., normalized.Compute("GATTACA", "GATTACA"));
  EXPECT_NEAR(3. / 7., normalized.Compute("cat", "car"), 1e-12);
  EXPECT_EQ(0., normalized.Compute("", ""));
}

TEST_F(SkernStringKernelTest, Gram) {
  StringKernel kernel(StringKernelConfig{.thread_pool = thread_pool});
  auto gram = kernel.K(inputs);

  ASSERT_EQ(static_cast<Eigen::Index>(inputs.size()), gram.rows());
  ASSERT_EQ(static_cast<Eigen::Index>(inputs.size()), gram.cols());
  for (auto i = 0uz; i < inputs.size(); ++i) {
    for (auto j = 0uz; j < inputs.size(); ++j) {
      EXPECT_EQ(SubsequenceSimilarity(inputs[i], inputs[j]),
                gram(static_cast<Eigen::Index>(i),
                     static_cast<Eigen::Index>(j)))
          << inputs[i] << " " << inputs[j];
    }
  }
  EXPECT_TRUE(gram == gram.transpose());

  StringKernel sequential;
  EXPECT_TRUE(gram == sequential.K(inputs));
  EXPECT_TRUE(gram.diagonal() == kernel.Kdiag(inputs));
}

TEST_F(SkernStringKernelTest, CrossGram) {
  StringKernel kernel(StringKernelConfig{.thread_pool = thread_pool});
  auto rhs = std::vector<std::string>{"ca", "GAT"};
  auto gram = kernel.K(inputs, rhs);

  ASSERT_EQ(static_cast<Eigen::Index>(inputs.size()), gram.rows());
  ASSERT_EQ(2, gram.cols());
  EXPECT_EQ(SubsequenceSimilarity("cat", "ca"), gram(0, 0));
  EXPECT_EQ(SubsequenceSimilarity("GATTACA", "GAT"), gram(3, 1));
  EXPECT_EQ(0., gram(4, 0));

  auto transposed = kernel.K(rhs, inputs);
  EXPECT_TRUE(gram == transposed.transpose());
}

TEST_F(SkernStringKernelTest, NormalizedGram) {
  StringKernel kernel(
      StringKernelConfig{.thread_pool = thread_pool, .normalize = true});
  auto gram = kernel.K(inputs);

  for (Eigen::Index i = 0; i < gram.rows(); ++i) {
    // the empty string has no self alignment
    EXPECT_DOUBLE_EQ(inputs[i].empty() ? 0. : 1., gram(i, i));
    for (Eigen::Index j = 0; j < gram.cols(); ++j) {
      EXPECT_GE(gram(i, j), 0.);
      EXPECT_LE(gram(i, j), 1. + 1e-12);
      EXPECT_NEAR(kernel.Compute(inputs[i], inputs[j]), gram(i, j), 1e-12);
    }
  }

  auto diag = kernel.Kdiag(inputs);
  for (Eigen::Index i = 0; i < diag.size(); ++i) {
    EXPECT_EQ(inputs[i].empty() ? 0. : 1., diag(i));
  }

  auto cross = kernel.K(inputs, inputs);
  EXPECT_TRUE(cross.isApprox(gram, 1e-12));
}

TEST_F(SkernStringKernelTest, NormalizedCountEmpty) {
  StringKernel kernel(StringKernelConfig{
      .thread_pool = thread_pool,
      .similarity = SimilarityConfig{.count_empty = true},
      .normalize = true,
  });

  auto gram = kernel.K(inputs);
  auto diag = kernel.Kdiag(inputs);
  ASSERT_EQ(gram.rows(), diag.size());
  for (Eigen::Index i = 0; i < diag.size(); ++i) {
    EXPECT_EQ(1., diag(i));
    EXPECT_NEAR(1., gram(i, i), 1e-12);
  }

  // the empty alignment is the only one shared with ""
  auto empty_row = kernel.K(std::vector<std::string>{""}, inputs);
  // k("cat", "cat") counts 7 non-empty alignments plus the empty one
  EXPECT_NEAR(1. / std::sqrt(8.), empty_row(0, 0), 1e-12);
  EXPECT_NEAR(1., empty_row(0, 4), 1e-12);
}

TEST_F(SkernStringKernelTest, NormalizedDiagonalOfLongInputs) {
  StringKernel kernel(StringKernelConfig{.normalize = true});
  auto long_inputs =
      std::vector<std::string>{std::string(2000, 'A'), "", "C"};
  auto diag = kernel.Kdiag(long_inputs);
  ASSERT_EQ(3, diag.size());
  EXPECT_EQ(1., diag(0));
  EXPECT_EQ(0., diag(1));
  EXPECT_EQ(1., diag(2));
}

TEST_F(SkernStringKernelTest, Progress) {
  std::atomic<std::size_t> num_rows{0};
  StringKernel kernel(StringKernelConfig{
      .thread_pool = thread_pool,
      .update_progress = [&num_rows] { ++num_rows; },
  });

  kernel.K(inputs);
  EXPECT_EQ(inputs.size(), num_rows.load());

  num_rows = 0;
  kernel.K(inputs, std::vector<std::string>{"a"});
  EXPECT_EQ(inputs.size(), num_rows.load());
}

TEST_F(SkernStringKernelTest, KernelInterface) {
  StringKernel string_kernel;
  const Kernel<std::string>& kernel = string_kernel;

  EXPECT_EQ("sk", kernel.name());
  EXPECT_TRUE(ComputeGram(kernel, inputs, thread_pool) ==
              string_kernel.K(inputs));
  EXPECT_TRUE(ComputeDiagonal(kernel, inputs) == string_kernel.Kdiag(inputs));
}

TEST_F(SkernStringKernelTest, PositiveSemiDefinite) {
  StringKernel kernel(
      StringKernelConfig{.thread_pool = thread_pool, .normalize = true});
  auto corpus = std::vector<std::string>{
      "GATTACA", "ATTAC",  "GATTA", "TACAG", "CAGATTACA",
      "ACGTACGT", "TTTT", "AAAA",  "CCGG",  "GCGCGC"};
  auto gram = kernel.K(corpus);
  EXPECT_TRUE(IsPositiveSemiDefinite(gram, 1e-9));
  EXPECT_GT(MinEigenvalue(gram), -1e-9);
}

TEST_F(SkernStringKernelTest, OverflowingGram) {
  auto corpus = std::vector<std::string>{std::string(600, 'A'),
                                         std::string(600, 'A')};

  auto raw = StringKernel(StringKernelConfig{.thread_pool = thread_pool});
  auto gram = raw.K(corpus);
  EXPECT_FALSE(gram.allFinite());
  EXPECT_THROW(MinEigenvalue(gram), std::invalid_argument);
  EXPECT_THROW(IsPositiveSemiDefinite(gram), std::invalid_argument);

  auto normalized = StringKernel(
      StringKernelConfig{.thread_pool = thread_pool, .normalize = true});
  auto normalized_gram = normalized.K(corpus);
  ASSERT_TRUE(normalized_gram.allFinite());
  EXPECT_NEAR(1., normalized_gram(0, 1), 1e-12);
  EXPECT_TRUE(IsPositiveSemiDefinite(normalized_gram));
}

}  // namespace test
}  // namespace skern
