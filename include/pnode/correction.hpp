/**
 * @file correction.hpp
 * @brief Linearization of the ODE residual, local error estimation, and the Kalman update.
 */
#pragma once

#include <cmath>
#include <limits>
#include <utility>

#include "pnode/belief.hpp"
#include "pnode/extrapolation.hpp"
#include "pnode/jacobian.hpp"
#include "pnode/sqrtm.hpp"
#include "pnode/state_space.hpp"
#include "pnode/types.hpp"

namespace pnode {

/** @brief Affine model `r(x) ~ z + H (x - m)` of the residual `r(x) = u' - f(t, u)` at the predicted mean. */
struct LinearizedResidual {
  Matrix h{};
  Vector residual{};
};

/** @brief Local diffusion estimate and local error vector of one step attempt (both size d). */
struct LocalErrorEstimate {
  // Squared diffusion; NaN where the estimate is undefined.
  Vector diffusion_sq{};
  Vector error{};
};

/** @brief Output of the measurement update. */
struct CorrectionResult {
  GaussianBelief belief{};
  Vector residual{};
  Matrix innovation_sqrt{};
  // S_sqrt^-1 z.
  Vector whitened{};
  double whitened_sq_norm = 0.0;
};

/**
 * @brief Linearize the residual around the predicted mean at time `t`.
 *
 * Zeroth order uses `H = E1`; first order uses `H = E1 - J E0` with `J` from
 * `jacobian()`. Fails when `f` or its Jacobian is non-finite.
 */
template <VectorField F>
[[nodiscard]] inline bool linearize(F& f,
                                    const StateLayout& layout,
                                    Linearization linearization,
                                    double t,
                                    const Vector& mean,
                                    LinearizedResidual& out,
                                    SolverStats& stats) {
  const int d = layout.dim;
  const Vector u = mean.segment(layout.index(0, 0), d);
  const Vector du = mean.segment(layout.index(1, 0), d);

  Vector fu;
  stats.rhs_evals += 1;
  if (!evaluate(f, t, u, fu)) {
    return false;
  }
  out.residual = du - fu;

  out.h = layout.selector(1);
  if (linearization == Linearization::FirstOrder) {
    Matrix jac;
    stats.jacobian_evals += 1;
    if (!jacobian(f, t, u, fu, jac, stats.rhs_evals)) {
      return false;
    }
    out.h.middleCols(layout.index(0, 0), d) -= jac;
  }
  return out.residual.allFinite();
}

/**
 * @brief Local diffusion MLE and error vector from the observed process noise.
 *
 * `S_Q = H Q(dt) H^T` at unit diffusion. The scalar model uses
 * `sigma^2 = z^T S_Q^-1 z / d`; the per-dimension model `sigma_a^2 = z_a^2 / (S_Q)_aa`.
 * The error is `e_a = dt * sigma_a * sqrt((S_Q)_aa)`, so it vanishes with the step even
 * when the residual does not.
 */
[[nodiscard]] inline LocalErrorEstimate estimate_local_error(const StateSpaceModel& ssm,
                                                             const MeanExtrapolation& ext,
                                                             const LinearizedResidual& lin,
                                                             DiffusionModel model) {
  const int d = ssm.layout().dim;
  const Vector unit = Vector::Ones(d);
  const Matrix hq = lin.h * (ext.p.asDiagonal() * ssm.q_bar_sqrt(unit));
  const Vector s_diag = hq.rowwise().squaredNorm();

  LocalErrorEstimate out{};
  out.diffusion_sq.resize(d);
  if (model == DiffusionModel::Scalar) {
    const Matrix s_sqrt = sqrtm::triangularize(hq);
    const Vector w = sqrtm::solve_lower(s_sqrt, lin.residual);
    out.diffusion_sq.setConstant(w.squaredNorm() / static_cast<double>(d));
  } else {
    for (int a = 0; a < d; ++a) {
      out.diffusion_sq(a) = s_diag(a) > 0.0 ? lin.residual(a) * lin.residual(a) / s_diag(a)
                                            : std::numeric_limits<double>::quiet_NaN();
    }
  }

  out.error.resize(d);
  for (int a = 0; a < d; ++a) {
    const double sigma_sq = std::isfinite(out.diffusion_sq(a)) ? out.diffusion_sq(a) : 0.0;
    out.error(a) = ext.dt * std::sqrt(sigma_sq * s_diag(a));
  }
  if (model == DiffusionModel::PerDimension) {
    // No process noise reaches these components; fall back to the raw residual.
    for (int a = 0; a < d; ++a) {
      if (!(s_diag(a) > 0.0)) {
        out.error(a) = ext.dt * std::abs(lin.residual(a));
      }
    }
  }
  return out;
}

/**
 * @brief Condition the predicted belief on `r(x) = 0`.
 *
 * Square-root update `tria([[H L, R_sqrt], [L, 0]])` with `R_sqrt = r I`; the mean moves
 * by `-K z`. Directions with singular innovation receive zero gain.
 */
[[nodiscard]] inline bool correct(const GaussianBelief& predicted,
                                  const LinearizedResidual& lin,
                                  double measurement_noise,
                                  CorrectionResult& out) {
  const Eigen::Index m = lin.h.rows();
  const Matrix hl = lin.h * predicted.cov_sqrt;

  sqrtm::ConditionalReversion rev;
  if (measurement_noise > 0.0) {
    const Matrix noise = measurement_noise * Matrix::Identity(m, m);
    rev = sqrtm::revert_conditional(hl, predicted.cov_sqrt, noise);
  } else {
    rev = sqrtm::revert_conditional_noisefree(hl, predicted.cov_sqrt);
  }

  out.belief.mean = predicted.mean - rev.gain * lin.residual;
  out.belief.cov_sqrt = std::move(rev.posterior_sqrt);
  out.residual = lin.residual;
  out.innovation_sqrt = std::move(rev.marginal_sqrt);
  out.whitened = sqrtm::solve_lower(out.innovation_sqrt, lin.residual);
  out.whitened_sq_norm = out.whitened.squaredNorm();

  return out.belief.mean.allFinite() && out.belief.cov_sqrt.allFinite() && std::isfinite(out.whitened_sq_norm);
}

}  // namespace pnode
