#ifndef SKERN_CLI_HPP_
#define SKERN_CLI_HPP_

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "Eigen/Dense"
#include "skern/types.hpp"

namespace skern {

struct CliConfig {
  // one path for a symmetric matrix, two for lhs x rhs
  std::vector<std::string> input_paths;
  SimilarityConfig similarity;
  bool normalize = false;
  bool check_psd = false;
  double tolerance = 1e-9;
  std::uint64_t num_threads = 1;
};

enum class PsdCheck : std::uint8_t {
  kSkippedNonSymmetric,
  kNonFinite,
  kPositiveSemiDefinite,
  kNotPositiveSemiDefinite,
};

// Runs the eigenvalue check on a Gram matrix and logs the outcome.
// Matrices with overflowed entries are reported instead of decomposed.
PsdCheck CheckGramMatrix(const Eigen::MatrixXd& gram, bool is_symmetric,
                         double tolerance);

// Loads the inputs, writes the TSV Gram matrix to ostrm.
void RunGramMatrix(const CliConfig& config, std::ostream& ostrm);

// Command line entry point; returns the process exit status. Errors are
// written to errstrm.
int RunCli(int argc, char** argv, std::ostream& ostrm, std::ostream& errstrm);

}  // namespace skern

#endif  // SKERN_CLI_HPP_
