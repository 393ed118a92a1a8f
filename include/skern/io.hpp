#ifndef SKERN_IO_HPP_
#define SKERN_IO_HPP_

#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "Eigen/Dense"
#include "bioparser/parser.hpp"
#include "skern/types.hpp"

namespace skern {

std::unique_ptr<bioparser::Parser<Sequence>> CreateParser(
    const std::string& path);

// Reads every sequence in path. FASTA/FASTQ files go through bioparser, .txt
// files hold one sequence per line (empty lines skipped, named by line).
std::vector<std::unique_ptr<Sequence>> LoadSequences(const std::string& path);

std::vector<std::string> ExtractData(
    std::span<const std::unique_ptr<Sequence>> sequences);

// Tab separated matrix: a header line with the column sequence names,
// then one line per row sequence starting with its name.
void PrintGramMatrix(std::ostream& ostrm,
                     std::span<const std::unique_ptr<Sequence>> rows,
                     std::span<const std::unique_ptr<Sequence>> cols,
                     const Eigen::MatrixXd& gram);

}  // namespace skern

#endif  // SKERN_IO_HPP_
