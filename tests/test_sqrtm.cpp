#include <algorithm>
#include <cmath>

#include <Eigen/Core>
#include <Eigen/LU>

#include "pnode/logging.hpp"
#include "pnode/sqrtm.hpp"

namespace {

using pnode::Matrix;
using pnode::Vector;

// Deterministic, well-conditioned test matrix.
Matrix Arange(int rows, int cols, double offset) {
  Matrix m(rows, cols);
  for (int i = 0; i < rows; ++i) {
    for (int j = 0; j < cols; ++j) {
      m(i, j) = std::sin(1.0 + offset + 0.7 * i + 1.3 * j) + (i == j ? 2.0 : 0.0);
    }
  }
  return m;
}

bool IsLowerWithNonNegativeDiagonal(const Matrix& l) {
  for (Eigen::Index i = 0; i < l.rows(); ++i) {
    if (l(i, i) < 0.0) {
      return false;
    }
    for (Eigen::Index j = i + 1; j < l.cols(); ++j) {
      if (l(i, j) != 0.0) {
        return false;
      }
    }
  }
  return true;
}

double RelDiff(const Matrix& a, const Matrix& b) {
  return (a - b).norm() / std::max(1.0, b.norm());
}

int TestTriangularize() {
  const int shapes[][2] = {{4, 7}, {5, 5}, {6, 2}};
  for (const auto& shape : shapes) {
    const Matrix m = Arange(shape[0], shape[1], 0.1 * shape[1]);
    const Matrix l = pnode::sqrtm::triangularize(m);
    if (l.rows() != shape[0] || l.cols() != shape[0]) {
      pnode::log::Error("triangularize returned wrong shape");
      return 1;
    }
    if (!IsLowerWithNonNegativeDiagonal(l)) {
      pnode::log::Error("triangularize result is not lower triangular with non-negative diagonal");
      return 1;
    }
    if (RelDiff(l * l.transpose(), m * m.transpose()) > 1e-13) {
      pnode::log::Error("triangularize does not preserve M M^T for shape ", shape[0], "x", shape[1]);
      return 1;
    }
  }

  const Matrix a = Arange(4, 4, 0.0);
  const Matrix b = Arange(4, 3, 1.0);
  const Matrix s = pnode::sqrtm::sum_of_sqrtm_factors(a, b);
  if (RelDiff(s * s.transpose(), a * a.transpose() + b * b.transpose()) > 1e-13) {
    pnode::log::Error("sum_of_sqrtm_factors mismatch");
    return 1;
  }
  return 0;
}

int TestRevertConditional() {
  const int n = 5;
  const int m = 2;
  const Matrix l = pnode::sqrtm::triangularize(Arange(n, n, 0.3));
  const Matrix h = Arange(m, n, 2.0);
  const Matrix r = 0.1 * Matrix::Identity(m, m);

  const auto rev = pnode::sqrtm::revert_conditional(h * l, l, r);

  const Matrix sigma = l * l.transpose();
  const Matrix s = h * sigma * h.transpose() + r * r.transpose();
  const Matrix k = sigma * h.transpose() * s.inverse();
  const Matrix post = sigma - k * s * k.transpose();

  if (!IsLowerWithNonNegativeDiagonal(rev.marginal_sqrt) || !IsLowerWithNonNegativeDiagonal(rev.posterior_sqrt)) {
    pnode::log::Error("reversion factors are not lower triangular");
    return 1;
  }
  if (RelDiff(rev.marginal_sqrt * rev.marginal_sqrt.transpose(), s) > 1e-12) {
    pnode::log::Error("innovation covariance mismatch");
    return 1;
  }
  if (RelDiff(rev.gain, k) > 1e-10) {
    pnode::log::Error("Kalman gain mismatch");
    return 1;
  }
  if (RelDiff(rev.posterior_sqrt * rev.posterior_sqrt.transpose(), post) > 1e-10) {
    pnode::log::Error("posterior covariance mismatch");
    return 1;
  }

  const auto rev_nf = pnode::sqrtm::revert_conditional_noisefree(h * l, l);
  const Matrix s_nf = h * sigma * h.transpose();
  const Matrix k_nf = sigma * h.transpose() * s_nf.inverse();
  if (RelDiff(rev_nf.gain, k_nf) > 1e-10) {
    pnode::log::Error("noise-free Kalman gain mismatch");
    return 1;
  }
  return 0;
}

int TestSingularInnovation() {
  // The second observed direction carries no uncertainty.
  Matrix l = Matrix::Zero(3, 3);
  l(0, 0) = 1.0;
  l(1, 0) = 0.5;
  l(1, 1) = 0.2;
  Matrix h = Matrix::Zero(2, 3);
  h(0, 0) = 1.0;
  h(1, 2) = 1.0;

  const auto rev = pnode::sqrtm::revert_conditional_noisefree(h * l, l);
  if (!rev.gain.allFinite()) {
    pnode::log::Error("gain must stay finite for singular innovation");
    return 1;
  }
  if (rev.gain.col(1).norm() != 0.0) {
    pnode::log::Error("singular innovation direction must receive zero gain");
    return 1;
  }

  Vector z(2);
  z << 2.0, 3.0;
  const Vector w = pnode::sqrtm::solve_lower(rev.marginal_sqrt, z);
  if (!w.allFinite() || w(1) != 0.0 || std::abs(w(0) - 2.0) > 1e-14) {
    pnode::log::Error("whitening must skip singular directions");
    return 1;
  }
  return 0;
}

int TestCholesky() {
  const Matrix a = Arange(4, 4, 0.5);
  const Matrix spd = a * a.transpose();
  Matrix l;
  if (!pnode::sqrtm::cholesky_lower(spd, l) || RelDiff(pnode::sqrtm::covariance(l), spd) > 1e-13) {
    pnode::log::Error("cholesky_lower failed on SPD input");
    return 1;
  }
  Matrix indefinite = Matrix::Identity(2, 2);
  indefinite(1, 1) = -1.0;
  if (pnode::sqrtm::cholesky_lower(indefinite, l)) {
    pnode::log::Error("cholesky_lower must fail on indefinite input");
    return 1;
  }
  return 0;
}

}  // namespace

int main() {
  if (TestTriangularize() != 0) {
    return 1;
  }
  if (TestRevertConditional() != 0) {
    return 1;
  }
  if (TestSingularInnovation() != 0) {
    return 1;
  }
  if (TestCholesky() != 0) {
    return 1;
  }
  return 0;
}
