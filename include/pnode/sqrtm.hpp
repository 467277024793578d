/**
 * @file sqrtm.hpp
 * @brief Square-root covariance utilities: QR triangularization and conditional reversion.
 *
 * Every covariance in the engine is carried as a factor `L` with `Sigma = L L^T`.
 * Sums, predictions, and conditionings are computed by triangularizing stacked factors,
 * so no covariance is ever formed and re-factored.
 */
#pragma once

#include <algorithm>

#include <Eigen/Cholesky>
#include <Eigen/QR>

#include "pnode/types.hpp"

namespace pnode::sqrtm {

/**
 * @brief Lower-triangular `L` (rows x rows) with `L L^T = M M^T` and non-negative diagonal.
 *
 * Uses a Householder QR of `M^T`; the transposed `R` factor is the lower factor. Wide
 * inputs are compressed, tall inputs are padded with zero columns.
 */
[[nodiscard]] inline Matrix triangularize(const Matrix& m) {
  const Eigen::Index rows = m.rows();
  const Eigen::Index cols = m.cols();
  Matrix out = Matrix::Zero(rows, rows);
  if (rows == 0 || cols == 0) {
    return out;
  }

  const Eigen::HouseholderQR<Matrix> qr(m.transpose());
  const Eigen::Index k = std::min(rows, cols);
  const Matrix r = qr.matrixQR().topRows(k).triangularView<Eigen::Upper>();
  out.leftCols(k) = r.transpose();

  for (Eigen::Index j = 0; j < k; ++j) {
    if (out(j, j) < 0.0) {
      out.col(j) *= -1.0;
    }
  }
  return out;
}

/** @brief Factor of `A A^T + B B^T` for two factors with equal row count. */
[[nodiscard]] inline Matrix sum_of_sqrtm_factors(const Matrix& a, const Matrix& b) {
  Matrix stacked(a.rows(), a.cols() + b.cols());
  stacked.leftCols(a.cols()) = a;
  stacked.rightCols(b.cols()) = b;
  return triangularize(stacked);
}

/**
 * @brief Solve `K S = G` for `K` with `S` lower triangular.
 *
 * Columns belonging to a zero diagonal entry of `S` (a direction with no uncertainty)
 * receive zero gain instead of dividing by zero.
 */
[[nodiscard]] inline Matrix solve_right_lower(const Matrix& s, const Matrix& g) {
  const Eigen::Index m = s.rows();
  Matrix k = Matrix::Zero(g.rows(), m);
  for (Eigen::Index j = m - 1; j >= 0; --j) {
    const double sjj = s(j, j);
    if (!(sjj > 0.0)) {
      continue;
    }
    Vector col = g.col(j);
    for (Eigen::Index l = j + 1; l < m; ++l) {
      col -= k.col(l) * s(l, j);
    }
    k.col(j) = col / sjj;
  }
  return k;
}

/** @brief Solve `S w = z` by forward substitution; zero-diagonal rows yield zero. */
[[nodiscard]] inline Vector solve_lower(const Matrix& s, const Vector& z) {
  const Eigen::Index m = s.rows();
  Vector w = Vector::Zero(m);
  for (Eigen::Index j = 0; j < m; ++j) {
    const double sjj = s(j, j);
    if (!(sjj > 0.0)) {
      continue;
    }
    double acc = z(j);
    for (Eigen::Index l = 0; l < j; ++l) {
      acc -= s(j, l) * w(l);
    }
    w(j) = acc / sjj;
  }
  return w;
}

/**
 * @brief Result of reverting a linear-Gaussian conditional in square-root form.
 *
 * For `x ~ N(., L L^T)` and `y = H x + v`, `v ~ N(0, R R^T)`:
 * `marginal_sqrt` factors `cov(y)`, `gain` is `cov(x, y) cov(y)^-1`, and
 * `posterior_sqrt` factors `cov(x | y)`.
 */
struct ConditionalReversion {
  Matrix marginal_sqrt{};
  Matrix gain{};
  Matrix posterior_sqrt{};
};

/**
 * @brief Triangularize `[[H L, R], [L, 0]]` and read off the three blocks.
 * @param hl `H L`, m x k.
 * @param l `L`, n x k.
 * @param noise `R`, m x r (may have zero columns).
 */
[[nodiscard]] inline ConditionalReversion revert_conditional(const Matrix& hl,
                                                             const Matrix& l,
                                                             const Matrix& noise) {
  const Eigen::Index m = hl.rows();
  const Eigen::Index n = l.rows();
  const Eigen::Index k = hl.cols();
  const Eigen::Index r = noise.cols();

  Matrix pre = Matrix::Zero(m + n, k + r);
  pre.topLeftCorner(m, k) = hl;
  if (r > 0) {
    pre.topRightCorner(m, r) = noise;
  }
  pre.bottomLeftCorner(n, k) = l;

  const Matrix post = triangularize(pre);

  ConditionalReversion out{};
  out.marginal_sqrt = post.topLeftCorner(m, m);
  out.posterior_sqrt = post.bottomRightCorner(n, n);
  out.gain = solve_right_lower(out.marginal_sqrt, post.bottomLeftCorner(n, m));
  return out;
}

/** @brief Noise-free variant of revert_conditional. */
[[nodiscard]] inline ConditionalReversion revert_conditional_noisefree(const Matrix& hl, const Matrix& l) {
  return revert_conditional(hl, l, Matrix(hl.rows(), 0));
}

/** @brief Compute lower-triangular Cholesky factor `L` where `A = L L^T`. */
[[nodiscard]] inline bool cholesky_lower(const Matrix& a, Matrix& l_out) {
  if (a.rows() != a.cols() || !a.allFinite()) {
    return false;
  }
  const Eigen::LLT<Matrix> llt(a);
  if (llt.info() != Eigen::Success) {
    return false;
  }
  l_out = llt.matrixL();
  return true;
}

[[nodiscard]] inline Matrix covariance(const Matrix& l) {
  return (l * l.transpose()).eval();
}

}  // namespace pnode::sqrtm
