/**
 * @file solution.hpp
 * @brief Step records and the solve result.
 */
#pragma once

#include <functional>
#include <vector>

#include "pnode/belief.hpp"
#include "pnode/types.hpp"

namespace pnode {

/**
 * @brief One accepted step: its end time, length, diffusion, predicted and filtered belief.
 *
 * The first record of a solve sits at `t0` with `dt = 0` and equal predicted and
 * filtered beliefs.
 */
struct StepRecord {
  double t = 0.0;
  double dt = 0.0;
  Vector diffusion{};
  GaussianBelief predicted{};
  GaussianBelief filtered{};
};

/** @brief Called after each accepted step with its record; return false to stop. */
using StepObserver = std::function<bool(const StepRecord&)>;

/** @brief Result of a solve. */
struct Solution {
  SolverStatus status = SolverStatus::Success;
  CalibrationMode calibration = CalibrationMode::None;
  StateLayout layout{};

  // Furthest time reached and the last accepted belief there.
  double t = 0.0;
  GaussianBelief state{};

  std::vector<PosteriorPoint> posterior{};
  std::vector<StepRecord> records{};
  // One per record, on the scale of the records; see calibrated().
  std::vector<GaussianBelief> smoothed{};

  Vector output_scale{};
  SolverStats stats{};

  [[nodiscard]] bool ok() const { return status == SolverStatus::Success; }

  /**
   * @brief A record-scale belief (filtered, smoothed, or interpolated from them) with the
   * global output scale applied, as in `posterior` and `state`. Identity for other modes.
   */
  [[nodiscard]] GaussianBelief calibrated(const GaussianBelief& b) const {
    if (calibration != CalibrationMode::Global || output_scale.size() != layout.dim) {
      return b;
    }
    return scale_covariance(layout, b, output_scale);
  }

  /** @brief Output times of the posterior. */
  [[nodiscard]] std::vector<double> times() const {
    std::vector<double> out;
    out.reserve(posterior.size());
    for (const auto& p : posterior) {
      out.push_back(p.t);
    }
    return out;
  }

  /** @brief Posterior mean of derivative `i` at every output time. */
  [[nodiscard]] std::vector<Vector> u(int i = 0) const {
    std::vector<Vector> out;
    out.reserve(posterior.size());
    for (const auto& p : posterior) {
      out.push_back(derivative_mean(layout, p.belief, i));
    }
    return out;
  }

  /** @brief Posterior marginal standard deviation of derivative `i` at every output time. */
  [[nodiscard]] std::vector<Vector> marginal_std(int i = 0) const {
    std::vector<Vector> out;
    out.reserve(posterior.size());
    for (const auto& p : posterior) {
      out.push_back(derivative_std(layout, p.belief, i));
    }
    return out;
  }
};

}  // namespace pnode
