/**
 * @file jacobian.hpp
 * @brief Vector-field concepts and Jacobians by forward-mode AD or finite differences.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

#include <Eigen/Core>
#include <unsupported/Eigen/AutoDiff>

#include "pnode/types.hpp"

namespace pnode {

using AutoDiffScalar = Eigen::AutoDiffScalar<Eigen::VectorXd>;
using AutoDiffVector = Eigen::Matrix<AutoDiffScalar, Eigen::Dynamic, 1>;

/** @brief Callable `f(t, u, du)` on double vectors. */
template <class F>
concept VectorField = requires(F& f, double t, const Vector& u, Vector& du) {
  f(t, u, du);
};

/** @brief Vector field that also accepts forward-mode AD scalars. */
template <class F>
concept AutoDiffVectorField = requires(F& f, const AutoDiffScalar& t, const AutoDiffVector& u, AutoDiffVector& du) {
  f(t, u, du);
};

/** @brief Evaluate `f(t, u)`; fails on wrong output size or non-finite values. */
template <VectorField F>
[[nodiscard]] inline bool evaluate(F& f, double t, const Vector& u, Vector& du) {
  du.resize(u.size());
  f(t, u, du);
  return du.size() == u.size() && du.allFinite();
}

/** @brief Jacobian `df/du` via Eigen forward-mode automatic differentiation. */
template <class F>
requires AutoDiffVectorField<F>
[[nodiscard]] inline bool jacobian_forward_ad(F& f, double t, const Vector& u, Matrix& jac_out) {
  const Eigen::Index n = u.size();

  AutoDiffVector u_ad(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    u_ad(i).value() = u(i);
    u_ad(i).derivatives() = Eigen::VectorXd::Unit(n, i);
  }
  const AutoDiffScalar t_ad(t, Eigen::VectorXd::Zero(n));

  AutoDiffVector f_ad(n);
  f(t_ad, u_ad, f_ad);
  if (f_ad.size() != n) {
    return false;
  }

  jac_out.resize(n, n);
  for (Eigen::Index i = 0; i < n; ++i) {
    if (!std::isfinite(f_ad(i).value())) {
      return false;
    }
    if (f_ad(i).derivatives().size() == 0) {
      // Output did not depend on any input.
      jac_out.row(i).setZero();
      continue;
    }
    if (f_ad(i).derivatives().size() != n) {
      return false;
    }
    jac_out.row(i) = f_ad(i).derivatives().transpose();
  }
  return jac_out.allFinite();
}

/** @brief Jacobian by forward differences around a known `f(t, u)`. */
template <VectorField F>
[[nodiscard]] inline bool jacobian_finite_difference(F& f, double t, const Vector& u, const Vector& f0, Matrix& jac_out) {
  const Eigen::Index n = u.size();
  const double sqrt_eps = std::sqrt(std::numeric_limits<double>::epsilon());
  jac_out.resize(n, n);

  Vector u_pert = u;
  Vector f_pert(n);
  for (Eigen::Index j = 0; j < n; ++j) {
    const double h = sqrt_eps * std::max(1.0, std::abs(u(j)));
    u_pert(j) = u(j) + h;
    if (!evaluate(f, t, u_pert, f_pert)) {
      return false;
    }
    jac_out.col(j) = (f_pert - f0) / h;
    u_pert(j) = u(j);
  }
  return jac_out.allFinite();
}

/**
 * @brief Jacobian of `f` at `(t, u)`: forward-mode AD when `f` accepts AD scalars,
 * forward differences otherwise. `rhs_evals` counts the extra double evaluations.
 */
template <VectorField F>
[[nodiscard]] inline bool jacobian(F& f, double t, const Vector& u, const Vector& f0, Matrix& jac_out, long long& rhs_evals) {
  if constexpr (AutoDiffVectorField<F>) {
    (void)f0;
    (void)rhs_evals;
    return jacobian_forward_ad(f, t, u, jac_out);
  } else {
    rhs_evals += u.size();
    return jacobian_finite_difference(f, t, u, f0, jac_out);
  }
}

}  // namespace pnode
