/**
 * @file controller.hpp
 * @brief Proportional-integral step-size controller.
 */
#pragma once

#include <algorithm>
#include <cmath>

namespace pnode {

/**
 * @brief PI controller: `dt * clip(safety * e^(-1/p) * (e_prev / e)^beta, fac_min, fac_max)`.
 *
 * `e_prev` is the normalized error of the last accepted step, starting at one.
 */
struct StepSizeController {
  double safety = 0.95;
  double fac_min = 0.2;
  double fac_max = 10.0;
  double beta = 0.1;
  double error_prev = 1.0;

  /** @brief Propose the next step size from the current step and normalized error. */
  [[nodiscard]] double propose(double dt, double err_norm, int error_order) const {
    if (err_norm <= 0.0) {
      return dt * fac_max;
    }
    const double p = static_cast<double>(error_order);
    double fac = safety * std::pow(err_norm, -1.0 / p) * std::pow(error_prev / err_norm, beta);
    if (!std::isfinite(fac)) {
      fac = fac_min;
    }
    fac = std::clamp(fac, fac_min, fac_max);
    return dt * fac;
  }

  /** @brief Record the error of an accepted step, floored at 1e-4. */
  void accept(double err_norm) {
    error_prev = std::max(err_norm, 1e-4);
  }
};

}  // namespace pnode
