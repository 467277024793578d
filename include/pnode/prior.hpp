/**
 * @file prior.hpp
 * @brief Integrated Wiener process prior with closed-form discrete transitions.
 */
#pragma once

#include <cmath>
#include <utility>

#include "pnode/sqrtm.hpp"
#include "pnode/types.hpp"

namespace pnode {

/** @brief Discrete transition of one ODE component: `x(t+dt) = A x(t) + N(0, Q_sqrt Q_sqrt^T)`. */
struct Transition {
  Matrix a{};
  Matrix q_sqrt{};
};

/**
 * @brief q-times integrated Wiener process over `(u, u', ..., u^(q))` of one component.
 *
 * The transition is written as `A(dt) = P A_bar P^-1` and `Q_sqrt(dt) = P Q_bar_sqrt`
 * with the diagonal preconditioner `P = diag(dt^(q-i+1/2) / (q-i)!)`, so that
 * `A_bar(i,j) = binom(q-i, j-i)` and `Q_bar(i,j) = 1 / (2q+1-i-j)` do not depend on
 * `dt`. The engine works in preconditioned coordinates; `discretize` returns the
 * plain matrices.
 */
class IntegratedWienerProcess {
 public:
  IntegratedWienerProcess() = default;

  /** @brief Build the step-size independent system matrices; fails for `order < 0`. */
  [[nodiscard]] static bool from_order(int order, IntegratedWienerProcess& out) {
    if (order < 0) {
      return false;
    }
    const int n = order + 1;

    Matrix a_bar = Matrix::Zero(n, n);
    for (int i = 0; i < n; ++i) {
      for (int j = i; j < n; ++j) {
        a_bar(i, j) = binomial(order - i, j - i);
      }
    }

    Matrix q_bar(n, n);
    for (int i = 0; i < n; ++i) {
      for (int j = 0; j < n; ++j) {
        q_bar(i, j) = 1.0 / static_cast<double>(2 * order + 1 - i - j);
      }
    }
    Matrix q_bar_sqrt;
    if (!sqrtm::cholesky_lower(q_bar, q_bar_sqrt)) {
      return false;
    }

    out.order_ = order;
    out.a_bar_ = std::move(a_bar);
    out.q_bar_sqrt_ = std::move(q_bar_sqrt);
    return true;
  }

  [[nodiscard]] int order() const { return order_; }
  [[nodiscard]] int num_states() const { return order_ + 1; }
  /** @brief Local error order used by the step-size controller. */
  [[nodiscard]] int error_order() const { return order_ + 1; }

  [[nodiscard]] const Matrix& a_bar() const { return a_bar_; }
  [[nodiscard]] const Matrix& q_bar_sqrt() const { return q_bar_sqrt_; }

  /** @brief Diagonal preconditioner and its inverse for step `dt > 0`. */
  [[nodiscard]] bool preconditioner(double dt, Vector& p, Vector& p_inv) const {
    if (!(dt > 0.0) || !std::isfinite(dt)) {
      return false;
    }
    const int n = num_states();
    p.resize(n);
    p_inv.resize(n);
    for (int i = 0; i < n; ++i) {
      const int power = order_ - i;
      p(i) = std::pow(dt, static_cast<double>(power) + 0.5) / factorial(power);
      p_inv(i) = 1.0 / p(i);
    }
    return p.allFinite() && p_inv.allFinite();
  }

  /** @brief Closed-form `(A(dt), Q_sqrt(dt))`; fails for non-positive or non-finite `dt`. */
  [[nodiscard]] bool discretize(double dt, Transition& out) const {
    Vector p;
    Vector p_inv;
    if (!preconditioner(dt, p, p_inv)) {
      return false;
    }
    out.a = p.asDiagonal() * a_bar_ * p_inv.asDiagonal();
    out.q_sqrt = p.asDiagonal() * q_bar_sqrt_;
    return out.a.allFinite() && out.q_sqrt.allFinite();
  }

 private:
  [[nodiscard]] static double factorial(int k) {
    double out = 1.0;
    for (int i = 2; i <= k; ++i) {
      out *= static_cast<double>(i);
    }
    return out;
  }

  [[nodiscard]] static double binomial(int n, int k) {
    double out = 1.0;
    for (int i = 1; i <= k; ++i) {
      out = out * static_cast<double>(n - k + i) / static_cast<double>(i);
    }
    return out;
  }

  int order_ = 0;
  Matrix a_bar_{};
  Matrix q_bar_sqrt_{};
};

}  // namespace pnode
