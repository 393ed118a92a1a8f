#include "skern/io.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <functional>
#include <sstream>
#include <string_view>

#include "bioparser/fasta_parser.hpp"
#include "bioparser/fastq_parser.hpp"
#include "glog/logging.h"

static constexpr auto kFastaSuffixes = std::array<char const*, 6>{
    ".fasta", ".fasta.gz", ".fna", ".fna.gz", ".fa", ".fa.gz"};

static constexpr auto kFastqSuffixes =
    std::array<char const*, 4>{".fastq", ".fastq.gz", ".fq", ".fq.gz"};

static constexpr auto kTextSuffix = std::string_view(".txt");

static auto IsSuffixFor(std::string_view const suffix,
                        std::string_view const query) -> bool {
  return suffix.length() <= query.length()
             ? suffix == query.substr(query.length() - suffix.length())
             : false;
}

namespace skern {

namespace {

std::vector<std::unique_ptr<Sequence>> LoadLines(const std::string& path) {
  auto istrm = std::ifstream(path);
  if (!istrm.is_open()) {
    throw std::runtime_error("[skern::LoadSequences] error: unable to open " +
                             path);
  }

  std::vector<std::unique_ptr<Sequence>> dst;
  std::string line;
  for (auto line_idx = 1uz; std::getline(istrm, line); ++line_idx) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    dst.push_back(
        std::make_unique<Sequence>(std::format("line{}", line_idx), line));
  }

  if (istrm.bad()) {
    throw std::runtime_error("[skern::LoadSequences] error: failed reading " +
                             path);
  }
  return dst;
}

}  // namespace

std::unique_ptr<bioparser::Parser<Sequence>> CreateParser(
    const std::string& path) {
  using namespace std::placeholders;
  if (std::any_of(kFastaSuffixes.cbegin(), kFastaSuffixes.cend(),
                  std::bind(IsSuffixFor, _1, path.c_str()))) {
    return bioparser::Parser<Sequence>::Create<bioparser::FastaParser>(path);
  }
  if (std::any_of(kFastqSuffixes.cbegin(), kFastqSuffixes.cend(),
                  std::bind(IsSuffixFor, _1, path.c_str()))) {
    return bioparser::Parser<Sequence>::Create<bioparser::FastqParser>(path);
  }

  throw std::runtime_error([path] {
    auto ostrm = std::ostringstream{};
    ostrm << "[skern::CreateParser] error: file " << path
          << " has unsupported format extension (valid extensions: .fasta, "
          << ".fasta.gz, .fna, .fna.gz, .fa, .fa.gz, .fastq, .fastq.gz, "
          << ".fq, .fq.gz)";
    return ostrm.str();
  }());
}

std::vector<std::unique_ptr<Sequence>> LoadSequences(const std::string& path) {
  if (IsSuffixFor(kTextSuffix, path)) {
    return LoadLines(path);
  }
  return CreateParser(path)->Parse(-1);
}

std::vector<std::string> ExtractData(
    std::span<const std::unique_ptr<Sequence>> sequences) {
  std::vector<std::string> dst;
  dst.reserve(sequences.size());
  for (const auto& it : sequences) {
    dst.push_back(it->data);
  }
  return dst;
}

void PrintGramMatrix(std::ostream& ostrm,
                     std::span<const std::unique_ptr<Sequence>> rows,
                     std::span<const std::unique_ptr<Sequence>> cols,
                     const Eigen::MatrixXd& gram) {
  DCHECK_EQ(gram.rows(), static_cast<Eigen::Index>(rows.size()));
  DCHECK_EQ(gram.cols(), static_cast<Eigen::Index>(cols.size()));

  for (const auto& it : cols) {
    ostrm << '\t' << it->name;
  }
  ostrm << '\n';

  for (auto i = 0uz; i < rows.size(); ++i) {
    ostrm << rows[i]->name;
    for (auto j = 0uz; j < cols.size(); ++j) {
      ostrm << std::format(
          "\t{}",
          gram(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)));
    }
    ostrm << '\n';
  }

  std::flush(ostrm);
}

}  // namespace skern
