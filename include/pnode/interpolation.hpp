/**
 * @file interpolation.hpp
 * @brief Posterior beliefs at times between two step records.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "pnode/belief.hpp"
#include "pnode/extrapolation.hpp"
#include "pnode/solution.hpp"
#include "pnode/state_space.hpp"

namespace pnode {

/**
 * @brief Filtering posterior at `t` in `[before.t, after.t]`.
 *
 * Extrapolates the earlier filtered belief with the later record's diffusion; grid
 * points return the stored filtered beliefs.
 */
[[nodiscard]] inline bool interpolate_filter(const StateSpaceModel& ssm,
                                             const StepRecord& before,
                                             const StepRecord& after,
                                             double t,
                                             GaussianBelief& out) {
  if (!(t >= before.t) || !(t <= after.t)) {
    return false;
  }
  if (t == before.t) {
    out = before.filtered;
    return true;
  }
  if (t == after.t) {
    out = after.filtered;
    return true;
  }
  return extrapolate(ssm, before.filtered, t - before.t, after.diffusion, out);
}

/**
 * @brief Smoothing posterior at `t` in `[before.t, after.t]`.
 *
 * The filtered belief is extrapolated to `t`, the transition from `t` to `after.t` is
 * reverted, and the result is marginalized against the smoothed belief at `after`.
 */
[[nodiscard]] inline bool interpolate_smoother(const StateSpaceModel& ssm,
                                               const StepRecord& before,
                                               const StepRecord& after,
                                               const GaussianBelief& smoothed_after,
                                               double t,
                                               GaussianBelief& out) {
  if (!(t >= before.t) || !(t <= after.t)) {
    return false;
  }
  if (t == after.t) {
    out = smoothed_after;
    return true;
  }

  GaussianBelief at_t;
  double dt_rest = after.dt;
  if (t == before.t) {
    at_t = before.filtered;
  } else {
    if (!extrapolate(ssm, before.filtered, t - before.t, after.diffusion, at_t)) {
      return false;
    }
    dt_rest = after.t - t;
  }

  GaussianBelief predicted;
  GaussianConditional kernel;
  if (!extrapolate_with_backward_kernel(ssm, at_t, dt_rest, after.diffusion, predicted, kernel)) {
    return false;
  }
  out = marginalize(kernel, smoothed_after);
  return out.mean.allFinite() && out.cov_sqrt.allFinite();
}

namespace detail {

/**
 * @brief Posterior at `t` from a record sequence, smoothed when `smoothed` covers every record.
 *
 * Returns false when `t` lies outside the recorded span.
 */
[[nodiscard]] inline bool posterior_at(const StateSpaceModel& ssm,
                                       const std::vector<StepRecord>& records,
                                       const std::vector<GaussianBelief>& smoothed,
                                       double t,
                                       PosteriorPoint& out) {
  if (records.empty() || t < records.front().t || t > records.back().t) {
    return false;
  }
  const bool use_smoothed = !smoothed.empty() && smoothed.size() == records.size();
  out.t = t;
  out.provenance = use_smoothed ? Provenance::Smoothed : Provenance::Filtered;

  const auto it = std::upper_bound(records.begin(), records.end(), t,
                                   [](double value, const StepRecord& r) { return value < r.t; });
  const std::size_t after = static_cast<std::size_t>(it - records.begin());
  if (after == records.size() || after == 0) {
    // Exactly on the last record (or a single-record sequence).
    const std::size_t k = after == 0 ? 0 : after - 1;
    out.belief = use_smoothed ? smoothed[k] : records[k].filtered;
    return true;
  }
  const std::size_t before = after - 1;
  if (t == records[before].t) {
    out.belief = use_smoothed ? smoothed[before] : records[before].filtered;
    return true;
  }
  if (use_smoothed) {
    return interpolate_smoother(ssm, records[before], records[after], smoothed[after], t, out.belief);
  }
  return interpolate_filter(ssm, records[before], records[after], t, out.belief);
}

}  // namespace detail

/**
 * @brief Posterior of a finished solve at arbitrary times within its recorded span.
 *
 * Uses the smoothed beliefs when the solution carries them and applies the solution's
 * global output scale. Fails if any time lies outside the recorded span.
 */
[[nodiscard]] inline bool offgrid_marginals(const StateSpaceModel& ssm,
                                            const Solution& solution,
                                            const std::vector<double>& ts,
                                            std::vector<PosteriorPoint>& out) {
  out.clear();
  out.reserve(ts.size());
  for (const double t : ts) {
    PosteriorPoint point;
    if (!detail::posterior_at(ssm, solution.records, solution.smoothed, t, point)) {
      out.clear();
      return false;
    }
    point.belief = solution.calibrated(point.belief);
    out.push_back(std::move(point));
  }
  return true;
}

}  // namespace pnode
