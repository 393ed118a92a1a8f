#include "skern/cli.hpp"

#include <format>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "biosoup/progress_bar.hpp"
#include "cxxopts.hpp"
#include "glog/logging.h"
#include "skern/gram.hpp"
#include "skern/io.hpp"
#include "skern/kernel.hpp"
#include "thread_pool/thread_pool.hpp"

namespace skern {

namespace {

cxxopts::Options CreateOptions() {
  cxxopts::Options options("skern", "subsequence string kernel Gram matrix");

  /* clang-format off */
  options.add_options()
    ("inputs", "row and column sequences",
      cxxopts::value<std::vector<std::string>>());
  options.add_options("kernel")
    ("n,normalize",
      "divide k(s, t) by sqrt(k(s, s) * k(t, t))")
    ("count-empty",
      "count the empty common subsequence as an alignment")
    ("check-psd",
      "report whether the symmetric Gram matrix is positive semi-definite")
    ("tolerance",
      "relative eigenvalue tolerance used by --check-psd",
      cxxopts::value<double>()->default_value("1e-9"))
    ("t,threads",
      "number of threads",
      cxxopts::value<std::uint64_t>()->default_value("1"));
  options.add_options("info")
    ("v,version", "print version and exit early")
    ("h,help", "print help and exit early");
  options.positional_help("<sequences> [<sequences>]");
  /* clang-format on */

  options.parse_positional({"inputs"});
  return options;
}

CliConfig CreateCliConfig(const cxxopts::ParseResult& parsed_options) {
  auto input_paths = parsed_options["inputs"].as<std::vector<std::string>>();
  if (input_paths.size() > 2) {
    throw std::runtime_error(
        "[skern::RunCli] error: expected at most two sequence files");
  }

  return CliConfig{
      .input_paths = std::move(input_paths),
      .similarity =
          SimilarityConfig{
              .count_empty = parsed_options["count-empty"].as<bool>(),
          },
      .normalize = parsed_options["normalize"].as<bool>(),
      .check_psd = parsed_options["check-psd"].as<bool>(),
      .tolerance = parsed_options["tolerance"].as<double>(),
      .num_threads = parsed_options["threads"].as<std::uint64_t>(),
  };
}

}  // namespace

PsdCheck CheckGramMatrix(const Eigen::MatrixXd& gram, bool is_symmetric,
                         double tolerance) {
  if (!is_symmetric) {
    LOG(WARNING) << "event=check-psd value=skipped-non-symmetric";
    return PsdCheck::kSkippedNonSymmetric;
  }

  if (!gram.allFinite()) {
    LOG(WARNING) << "event=check-psd value=non-finite-entries "
                    "hint=rerun-with-normalize";
    return PsdCheck::kNonFinite;
  }

  LOG(INFO) << std::format("event=min-eigenvalue value={}",
                           MinEigenvalue(gram));
  if (!IsPositiveSemiDefinite(gram, tolerance)) {
    LOG(WARNING) << "event=check-psd value=not-positive-semi-definite";
    return PsdCheck::kNotPositiveSemiDefinite;
  }

  LOG(INFO) << "event=check-psd value=positive-semi-definite";
  return PsdCheck::kPositiveSemiDefinite;
}

void RunGramMatrix(const CliConfig& config, std::ostream& ostrm) {
  if (config.input_paths.empty() || config.input_paths.size() > 2) {
    throw std::invalid_argument(
        "[skern::RunGramMatrix] error: expected one or two sequence files");
  }

  auto rows = LoadSequences(config.input_paths.front());
  LOG(INFO) << std::format("event=parsed-sequences value={}", rows.size());

  auto is_symmetric = config.input_paths.size() == 1uz;
  std::vector<std::unique_ptr<Sequence>> cols;
  if (!is_symmetric) {
    cols = LoadSequences(config.input_paths.back());
    LOG(INFO) << std::format("event=parsed-sequences value={}", cols.size());
  }

  std::mutex bar_mtx;
  biosoup::ProgressBar bar{static_cast<std::uint32_t>(rows.size()), 16};
  auto kernel = StringKernel(StringKernelConfig{
      .thread_pool =
          std::make_shared<thread_pool::ThreadPool>(config.num_threads),
      .similarity = config.similarity,
      .normalize = config.normalize,
      .update_progress =
          [&bar, &bar_mtx, n = rows.size()] {
            std::lock_guard lk{bar_mtx};
            if (++bar) {
              LOG(INFO) << std::format("event=gram-progress value={}/{}",
                                       bar.event_counter(), n);
            }
          },
  });

  auto row_data = ExtractData(rows);
  Eigen::MatrixXd gram;
  if (is_symmetric) {
    gram = kernel.K(row_data);
  } else {
    auto col_data = ExtractData(cols);
    gram = kernel.K(row_data, col_data);
  }

  if (config.check_psd) {
    CheckGramMatrix(gram, is_symmetric, config.tolerance);
  }

  PrintGramMatrix(ostrm, rows, is_symmetric ? rows : cols, gram);
}

int RunCli(int argc, char** argv, std::ostream& ostrm, std::ostream& errstrm) {
  auto options = CreateOptions();

  try {
    auto early_quit = false;
    auto parsed_options = options.parse(argc, argv);
    if (parsed_options.count("version")) {
      errstrm << VERSION << std::endl;
      early_quit = true;
    }

    if (parsed_options.count("help")) {
      errstrm << options.help() << std::endl;
      early_quit = true;
    }

    if (early_quit) {
      return 0;
    }

    if (!parsed_options.count("inputs")) {
      errstrm << options.help() << std::endl;
      return 1;
    }

    RunGramMatrix(CreateCliConfig(parsed_options), ostrm);
  } catch (const std::exception& exception) {
    errstrm << exception.what() << std::endl;
    return 1;
  }

  return 0;
}

}  // namespace skern
