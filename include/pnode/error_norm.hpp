/**
 * @file error_norm.hpp
 * @brief Weighted RMS error norm used for step acceptance.
 */
#pragma once

#include <algorithm>
#include <cmath>

#include "pnode/types.hpp"

namespace pnode {

/**
 * @brief Weighted RMS of a local error estimate.
 *
 * Each component is scaled by `atol + rtol * max(|u_prev|, |u_new|)`; a step is
 * acceptable when the result does not exceed one.
 */
[[nodiscard]] inline double weighted_rms_error(const Vector& err,
                                               const Vector& u_prev,
                                               const Vector& u_new,
                                               double atol,
                                               double rtol) {
  const Eigen::Index n = err.size();
  if (n == 0) {
    return 0.0;
  }
  double acc = 0.0;
  for (Eigen::Index i = 0; i < n; ++i) {
    const double scale = atol + rtol * std::max(std::abs(u_prev(i)), std::abs(u_new(i)));
    const double ratio = err(i) / scale;
    acc += ratio * ratio;
  }
  return std::sqrt(acc / static_cast<double>(n));
}

/** @brief Weighted RMS of `v` with scale `atol + rtol * |ref|`. */
[[nodiscard]] inline double weighted_rms_norm(const Vector& v, const Vector& ref, double atol, double rtol) {
  return weighted_rms_error(v, ref, ref, atol, rtol);
}

}  // namespace pnode
