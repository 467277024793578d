/**
 * @file extrapolation.hpp
 * @brief Prediction through the prior transition, in preconditioned square-root form.
 */
#pragma once

#include "pnode/belief.hpp"
#include "pnode/sqrtm.hpp"
#include "pnode/state_space.hpp"
#include "pnode/types.hpp"

namespace pnode {

/**
 * @brief Mean half of a prediction.
 *
 * The predicted mean is needed to linearize the ODE and to calibrate the diffusion
 * before the covariance half is completed with that diffusion.
 */
struct MeanExtrapolation {
  double dt = 0.0;
  Vector p{};
  Vector p_inv{};
  Vector mean{};
};

/**
 * @brief Linear-Gaussian conditional `x | y ~ N(gain y + offset, noise_sqrt noise_sqrt^T)`.
 *
 * As a backward kernel `y` is the later state and `x` the earlier one; as a prior
 * transition the roles are swapped.
 */
struct GaussianConditional {
  Matrix gain{};
  Vector offset{};
  Matrix noise_sqrt{};
};

/** @brief Predicted mean `A(dt) m`, computed as `P A_bar P^-1 m`. */
[[nodiscard]] inline bool extrapolate_mean(const StateSpaceModel& ssm,
                                           const GaussianBelief& b,
                                           double dt,
                                           MeanExtrapolation& out) {
  if (!ssm.preconditioner(dt, out.p, out.p_inv)) {
    return false;
  }
  out.dt = dt;
  const Vector m_p = out.p_inv.cwiseProduct(b.mean);
  out.mean = out.p.cwiseProduct(ssm.a_bar() * m_p);
  return out.mean.allFinite();
}

/** @brief Predicted factor `tria([A L, Q_sqrt diag(sigma)])` for a prepared mean extrapolation. */
[[nodiscard]] inline GaussianBelief complete_extrapolation(const StateSpaceModel& ssm,
                                                           const GaussianBelief& b,
                                                           const MeanExtrapolation& ext,
                                                           const Vector& diffusion) {
  const Matrix l_p = ext.p_inv.asDiagonal() * b.cov_sqrt;
  const Matrix l_ext_p = sqrtm::sum_of_sqrtm_factors(ssm.a_bar() * l_p, ssm.q_bar_sqrt(diffusion));

  GaussianBelief out{};
  out.mean = ext.mean;
  out.cov_sqrt = ext.p.asDiagonal() * l_ext_p;
  return out;
}

/** @brief Predict the belief `dt` ahead with per-component diffusion `sigma`. */
[[nodiscard]] inline bool extrapolate(const StateSpaceModel& ssm,
                                      const GaussianBelief& b,
                                      double dt,
                                      const Vector& diffusion,
                                      GaussianBelief& out) {
  MeanExtrapolation ext;
  if (!extrapolate_mean(ssm, b, dt, ext)) {
    return false;
  }
  out = complete_extrapolation(ssm, b, ext, diffusion);
  return out.cov_sqrt.allFinite();
}

/**
 * @brief Predict `dt` ahead and also return the backward kernel of that transition.
 *
 * The kernel conditions the current state on the predicted one; it is what the
 * smoother and the smoothing interpolation consume. The reversion runs in
 * preconditioned coordinates and is mapped back afterwards.
 */
[[nodiscard]] inline bool extrapolate_with_backward_kernel(const StateSpaceModel& ssm,
                                                           const GaussianBelief& b,
                                                           double dt,
                                                           const Vector& diffusion,
                                                           GaussianBelief& predicted,
                                                           GaussianConditional& kernel) {
  Vector p;
  Vector p_inv;
  if (!ssm.preconditioner(dt, p, p_inv)) {
    return false;
  }

  const Vector m_p = p_inv.cwiseProduct(b.mean);
  const Matrix l_p = p_inv.asDiagonal() * b.cov_sqrt;
  const Vector m_ext_p = ssm.a_bar() * m_p;

  const sqrtm::ConditionalReversion rev =
      sqrtm::revert_conditional(ssm.a_bar() * l_p, l_p, ssm.q_bar_sqrt(diffusion));

  predicted.mean = p.cwiseProduct(m_ext_p);
  predicted.cov_sqrt = p.asDiagonal() * rev.marginal_sqrt;

  kernel.gain = p.asDiagonal() * rev.gain * p_inv.asDiagonal();
  kernel.offset = p.cwiseProduct(m_p - rev.gain * m_ext_p);
  kernel.noise_sqrt = p.asDiagonal() * rev.posterior_sqrt;

  return predicted.mean.allFinite() && predicted.cov_sqrt.allFinite() && kernel.gain.allFinite() &&
         kernel.offset.allFinite() && kernel.noise_sqrt.allFinite();
}

/** @brief Push a belief through a backward kernel. */
[[nodiscard]] inline GaussianBelief marginalize(const GaussianConditional& kernel, const GaussianBelief& b) {
  GaussianBelief out{};
  out.mean = kernel.gain * b.mean + kernel.offset;
  out.cov_sqrt = sqrtm::sum_of_sqrtm_factors(kernel.gain * b.cov_sqrt, kernel.noise_sqrt);
  return out;
}

}  // namespace pnode
