/**
 * @file belief.hpp
 * @brief Gaussian beliefs over stacked derivatives and the state layout they live in.
 */
#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Core>
#include <unsupported/Eigen/KroneckerProduct>

#include "pnode/types.hpp"

namespace pnode {

/**
 * @brief Layout of the stacked state `(u, u', ..., u^(q))` of a d-dimensional ODE.
 *
 * Derivative-major: component `a` of derivative `i` sits at flat index `i * dim + a`,
 * so the mean read as a row-major `(q+1) x d` matrix is the derivative stack.
 */
struct StateLayout {
  int order = 0;
  int dim = 0;

  [[nodiscard]] int num_derivatives() const { return order + 1; }
  [[nodiscard]] Eigen::Index state_size() const {
    return static_cast<Eigen::Index>(order + 1) * dim;
  }
  [[nodiscard]] Eigen::Index index(int derivative, int component) const {
    return static_cast<Eigen::Index>(derivative) * dim + component;
  }

  /** @brief Repeat each entry of a per-derivative vector `dim` times. */
  [[nodiscard]] Vector expand(const Vector& per_derivative) const {
    Vector out(state_size());
    for (int i = 0; i < num_derivatives(); ++i) {
      out.segment(index(i, 0), dim).setConstant(per_derivative(i));
    }
    return out;
  }

  /** @brief Tile a per-component vector across all derivatives. */
  [[nodiscard]] Vector tile(const Vector& per_component) const {
    Vector out(state_size());
    for (int i = 0; i < num_derivatives(); ++i) {
      out.segment(index(i, 0), dim) = per_component;
    }
    return out;
  }

  /** @brief `kron(m, I_d)`: a per-component matrix acting identically on every component. */
  [[nodiscard]] Matrix kron_identity(const Matrix& m) const {
    const Matrix eye = Matrix::Identity(dim, dim);
    Matrix out = Eigen::kroneckerProduct(m, eye);
    return out;
  }

  /** @brief `kron(m, diag(s))`: per-component scaling of a shared factor. */
  [[nodiscard]] Matrix kron_diagonal(const Matrix& m, const Vector& s) const {
    const Matrix diag = s.asDiagonal();
    Matrix out = Eigen::kroneckerProduct(m, diag);
    return out;
  }

  /** @brief Selection matrix `E_i` (dim x state_size) extracting derivative `i`. */
  [[nodiscard]] Matrix selector(int derivative) const {
    Matrix e = Matrix::Zero(dim, state_size());
    e.middleCols(index(derivative, 0), dim).setIdentity();
    return e;
  }
};

/** @brief Gaussian belief with square-root covariance: `N(mean, cov_sqrt cov_sqrt^T)`. */
struct GaussianBelief {
  Vector mean{};
  Matrix cov_sqrt{};

  [[nodiscard]] Matrix covariance() const {
    return (cov_sqrt * cov_sqrt.transpose()).eval();
  }
};

/** @brief Whether an output belief conditions on the past only or on the whole trajectory. */
enum class Provenance {
  Filtered,
  Smoothed
};

[[nodiscard]] inline const char* ToString(Provenance provenance) {
  switch (provenance) {
    case Provenance::Filtered:
      return "filtered";
    case Provenance::Smoothed:
      return "smoothed";
  }
  return "unknown";
}

/** @brief Posterior belief at one output time. */
struct PosteriorPoint {
  double t = 0.0;
  GaussianBelief belief{};
  Provenance provenance = Provenance::Filtered;
};

/** @brief Mean of derivative `i` (size dim). */
[[nodiscard]] inline Vector derivative_mean(const StateLayout& layout, const GaussianBelief& b, int i) {
  return b.mean.segment(layout.index(i, 0), layout.dim);
}

/** @brief Marginal standard deviation of derivative `i` (size dim). */
[[nodiscard]] inline Vector derivative_std(const StateLayout& layout, const GaussianBelief& b, int i) {
  const Matrix rows = b.cov_sqrt.middleRows(layout.index(i, 0), layout.dim);
  return rows.rowwise().norm();
}

/** @brief Mean as the `(q+1) x d` derivative stack. */
[[nodiscard]] inline MatrixRM mean_matrix(const StateLayout& layout, const GaussianBelief& b) {
  return Eigen::Map<const MatrixRM>(b.mean.data(), layout.num_derivatives(), layout.dim);
}

/** @brief Rescale the covariance by a per-component output scale (rows of the factor). */
[[nodiscard]] inline GaussianBelief scale_covariance(const StateLayout& layout,
                                                     const GaussianBelief& b,
                                                     const Vector& scale) {
  GaussianBelief out = b;
  out.cov_sqrt = layout.tile(scale).asDiagonal() * b.cov_sqrt;
  return out;
}

/**
 * @brief Belief with the given derivatives as mean and zero covariance.
 *
 * Missing higher derivatives are padded with zeros. Fails on empty input, inconsistent
 * component sizes, more derivatives than the layout holds, or non-finite values.
 */
[[nodiscard]] inline bool initial_belief(const StateLayout& layout,
                                         const std::vector<Vector>& derivatives,
                                         GaussianBelief& out) {
  if (derivatives.empty() || derivatives.size() > static_cast<std::size_t>(layout.num_derivatives())) {
    return false;
  }
  out.mean = Vector::Zero(layout.state_size());
  out.cov_sqrt = Matrix::Zero(layout.state_size(), layout.state_size());
  for (std::size_t i = 0; i < derivatives.size(); ++i) {
    if (derivatives[i].size() != layout.dim || !derivatives[i].allFinite()) {
      return false;
    }
    out.mean.segment(layout.index(static_cast<int>(i), 0), layout.dim) = derivatives[i];
  }
  return true;
}

}  // namespace pnode
