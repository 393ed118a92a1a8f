#include "skern/gram.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "Eigen/Eigenvalues"

namespace skern {

namespace {

Eigen::VectorXd Eigenvalues(const Eigen::MatrixXd& gram) {
  if (gram.rows() != gram.cols()) {
    throw std::invalid_argument([&gram] {
      auto ostrm = std::ostringstream{};
      ostrm << "[skern::MinEigenvalue] error: gram matrix is not square ("
            << gram.rows() << "x" << gram.cols() << ")";
      return ostrm.str();
    }());
  }

  if (gram.size() == 0) {
    return Eigen::VectorXd();
  }

  if (!gram.allFinite()) {
    throw std::invalid_argument(
        "[skern::MinEigenvalue] error: gram matrix has non-finite entries");
  }

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(
      gram, Eigen::EigenvaluesOnly);
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error(
        "[skern::MinEigenvalue] error: eigen decomposition did not converge");
  }
  return solver.eigenvalues();
}

}  // namespace

double MinEigenvalue(const Eigen::MatrixXd& gram) {
  auto eigenvalues = Eigenvalues(gram);
  return eigenvalues.size() == 0 ? 0. : eigenvalues.minCoeff();
}

bool IsPositiveSemiDefinite(const Eigen::MatrixXd& gram, double tolerance) {
  auto eigenvalues = Eigenvalues(gram);
  if (eigenvalues.size() == 0) {
    return true;
  }

  auto scale = std::max(1., eigenvalues.cwiseAbs().maxCoeff());
  return eigenvalues.minCoeff() >= -tolerance * scale;
}

}  // namespace skern
