/**
 * @file state_space.hpp
 * @brief Prior of a d-dimensional ODE: one integrated Wiener process per component.
 */
#pragma once

#include <utility>

#include "pnode/belief.hpp"
#include "pnode/prior.hpp"
#include "pnode/types.hpp"

namespace pnode {

/**
 * @brief Full-state view of an IntegratedWienerProcess for a d-dimensional ODE.
 *
 * Caches `kron(A_bar, I_d)` and `kron(Q_bar_sqrt, I_d)`; a per-component diffusion
 * `sigma` enters as `kron(Q_bar_sqrt, diag(sigma))`.
 */
class StateSpaceModel {
 public:
  StateSpaceModel() = default;

  /** @brief Fails for `order < 0` or `dim < 1`. */
  [[nodiscard]] static bool from_order(int order, int dim, StateSpaceModel& out) {
    if (dim < 1) {
      return false;
    }
    IntegratedWienerProcess prior;
    if (!IntegratedWienerProcess::from_order(order, prior)) {
      return false;
    }
    out.layout_ = StateLayout{order, dim};
    out.a_bar_ = out.layout_.kron_identity(prior.a_bar());
    out.q_bar_sqrt_ = out.layout_.kron_identity(prior.q_bar_sqrt());
    out.prior_ = std::move(prior);
    return true;
  }

  [[nodiscard]] const StateLayout& layout() const { return layout_; }
  [[nodiscard]] const IntegratedWienerProcess& prior() const { return prior_; }
  [[nodiscard]] const Matrix& a_bar() const { return a_bar_; }

  /** @brief Preconditioned process-noise factor for the given per-component diffusion. */
  [[nodiscard]] Matrix q_bar_sqrt(const Vector& diffusion) const {
    return (q_bar_sqrt_ * layout_.tile(diffusion).asDiagonal()).eval();
  }

  /** @brief Full-state preconditioner `P(dt)` and its inverse. */
  [[nodiscard]] bool preconditioner(double dt, Vector& p, Vector& p_inv) const {
    Vector p_1d;
    Vector p_inv_1d;
    if (!prior_.preconditioner(dt, p_1d, p_inv_1d)) {
      return false;
    }
    p = layout_.expand(p_1d);
    p_inv = layout_.expand(p_inv_1d);
    return true;
  }

  /** @brief Full-state `(A(dt), Q_sqrt(dt) diag(sigma))` without preconditioning. */
  [[nodiscard]] bool transition(double dt, const Vector& diffusion, Transition& out) const {
    Transition one;
    if (!prior_.discretize(dt, one)) {
      return false;
    }
    out.a = layout_.kron_identity(one.a);
    out.q_sqrt = layout_.kron_diagonal(one.q_sqrt, diffusion);
    return true;
  }

 private:
  StateLayout layout_{};
  IntegratedWienerProcess prior_{};
  Matrix a_bar_{};
  Matrix q_bar_sqrt_{};
};

}  // namespace pnode
