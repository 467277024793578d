/**
 * @file solver.hpp
 * @brief Adaptive and fixed-grid probabilistic ODE solve loops.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include "pnode/belief.hpp"
#include "pnode/calibration.hpp"
#include "pnode/controller.hpp"
#include "pnode/correction.hpp"
#include "pnode/error_norm.hpp"
#include "pnode/extrapolation.hpp"
#include "pnode/interpolation.hpp"
#include "pnode/jacobian.hpp"
#include "pnode/logging.hpp"
#include "pnode/smoother.hpp"
#include "pnode/solution.hpp"
#include "pnode/sqrtm.hpp"
#include "pnode/state_space.hpp"
#include "pnode/taylor.hpp"
#include "pnode/types.hpp"

namespace pnode {

/** @brief Check a configuration before any vector-field evaluation. */
[[nodiscard]] inline SolverStatus validate_options(const SolverOptions& opt) {
  if (opt.order < 1) {
    return SolverStatus::InvalidOrder;
  }
  if (!(opt.rtol > 0.0) || !(opt.atol > 0.0) || !std::isfinite(opt.rtol) || !std::isfinite(opt.atol)) {
    return SolverStatus::InvalidTolerance;
  }
  if (!(opt.dt_min > 0.0) || !(opt.dt_max >= opt.dt_min) || !std::isfinite(opt.dt_min) ||
      !std::isfinite(opt.dt_max) || !(opt.dt_init >= 0.0) || !std::isfinite(opt.dt_init)) {
    return SolverStatus::InvalidStepSize;
  }
  if (!(opt.output_scale > 0.0) || !std::isfinite(opt.output_scale) ||
      !(opt.dynamic_weight > 0.0) || !(opt.dynamic_weight <= 1.0) ||
      !(opt.measurement_noise >= 0.0) || !std::isfinite(opt.measurement_noise)) {
    return SolverStatus::InvalidOptions;
  }
  if (!(opt.safety > 0.0) || !(opt.safety <= 1.0) || !(opt.fac_min > 0.0) || !(opt.fac_min <= 1.0) ||
      !(opt.fac_max >= 1.0) || !std::isfinite(opt.fac_max) || !(opt.pi_beta >= 0.0) ||
      !std::isfinite(opt.pi_beta) || opt.max_consecutive_rejections < 1 || opt.max_steps < 1) {
    return SolverStatus::InvalidOptions;
  }
  if (opt.streaming && opt.smooth) {
    return SolverStatus::InvalidOptions;
  }
  return SolverStatus::Success;
}

namespace detail {

[[nodiscard]] inline bool valid_time_span(double t0, double t1) {
  return std::isfinite(t0) && std::isfinite(t1) && t1 > t0;
}

/** @brief Query times must be finite, non-decreasing, and inside `[t0, t1]`. */
[[nodiscard]] inline bool valid_query_times(const std::vector<double>& ts, double t0, double t1) {
  double prev = t0;
  for (const double t : ts) {
    if (!std::isfinite(t) || t < prev || t > t1) {
      return false;
    }
    prev = t;
  }
  return true;
}

[[nodiscard]] inline bool valid_grid(const std::vector<double>& grid) {
  if (grid.size() < 2) {
    return false;
  }
  for (std::size_t i = 0; i < grid.size(); ++i) {
    if (!std::isfinite(grid[i]) || (i > 0 && !(grid[i] > grid[i - 1]))) {
      return false;
    }
  }
  return true;
}

/** @brief `0.01 * ||u0|| / ||u'0||` in the weighted norm, clipped to the step bounds. */
[[nodiscard]] inline double estimate_initial_step(const Vector& u0,
                                                  const Vector& du0,
                                                  double t0,
                                                  double t1,
                                                  const SolverOptions& opt) {
  const double u_norm = weighted_rms_norm(u0, u0, opt.atol, opt.rtol);
  const double f_norm = weighted_rms_norm(du0, u0, opt.atol, opt.rtol);

  double dt = 0.01;
  if (f_norm > 1e-16) {
    dt = 0.01 * (u_norm / f_norm);
  }
  if (!std::isfinite(dt) || dt <= 0.0) {
    dt = (t1 - t0) / 100.0;
  }
  if (!std::isfinite(dt) || dt <= 0.0) {
    dt = opt.dt_min;
  }
  return std::clamp(dt, opt.dt_min, opt.dt_max);
}

/** @brief One attempted step from `t` to `t_new`. */
struct StepAttempt {
  double t = 0.0;
  double dt = 0.0;
  Vector diffusion{};
  LocalErrorEstimate local{};
  GaussianBelief predicted{};
  CorrectionResult correction{};
  double error_norm = 0.0;
};

/**
 * @brief Extrapolate, linearize, calibrate, and correct one step.
 *
 * Nothing is committed; the caller decides acceptance from `error_norm`. Fails on a
 * non-finite vector field, Jacobian, or belief.
 */
template <VectorField F>
[[nodiscard]] inline bool attempt_step(F& f,
                                       const StateSpaceModel& ssm,
                                       const Calibration& calibration,
                                       const SolverOptions& opt,
                                       double t,
                                       double t_new,
                                       const GaussianBelief& b,
                                       StepAttempt& out,
                                       SolverStats& stats) {
  const StateLayout& layout = ssm.layout();
  out.t = t_new;
  out.dt = t_new - t;

  MeanExtrapolation ext;
  if (!extrapolate_mean(ssm, b, out.dt, ext)) {
    return false;
  }
  LinearizedResidual lin;
  if (!linearize(f, layout, opt.linearization, t_new, ext.mean, lin, stats)) {
    return false;
  }

  out.local = estimate_local_error(ssm, ext, lin, opt.diffusion_model);
  out.diffusion = calibration.candidate(out.local);
  out.predicted = complete_extrapolation(ssm, b, ext, out.diffusion);
  if (!correct(out.predicted, lin, opt.measurement_noise, out.correction)) {
    return false;
  }

  out.error_norm = weighted_rms_error(out.local.error,
                                      derivative_mean(layout, b, 0),
                                      derivative_mean(layout, out.correction.belief, 0),
                                      opt.atol,
                                      opt.rtol);
  return std::isfinite(out.error_norm);
}

/** @brief Bring a user-supplied initial belief into the layout; fails on shape or finiteness. */
[[nodiscard]] inline bool normalize_initial_belief(const StateLayout& layout,
                                                   const GaussianBelief& in,
                                                   GaussianBelief& out) {
  const Eigen::Index n = layout.state_size();
  if (in.mean.size() != n || !in.mean.allFinite()) {
    return false;
  }
  out.mean = in.mean;
  if (in.cov_sqrt.size() == 0) {
    out.cov_sqrt = Matrix::Zero(n, n);
    return true;
  }
  if (in.cov_sqrt.rows() != n || !in.cov_sqrt.allFinite()) {
    return false;
  }
  out.cov_sqrt = sqrtm::triangularize(in.cov_sqrt);
  return true;
}

/** @brief Record-keeping shared by the adaptive and the fixed-grid loop. */
class ForwardPass {
 public:
  ForwardPass(const StateSpaceModel& ssm,
              const SolverOptions& opt,
              const std::vector<double>& query_times,
              const StepObserver& observer,
              Solution& sol)
      : ssm_(ssm), opt_(opt), queries_(query_times), observer_(observer), sol_(sol) {}

  /** @brief Seed the pass with the belief at `t0`. */
  void start(double t0, const GaussianBelief& init, const Vector& diffusion) {
    sol_.t = t0;
    sol_.state = init;
    StepRecord first;
    first.t = t0;
    first.dt = 0.0;
    first.diffusion = diffusion;
    first.predicted = init;
    first.filtered = init;
    sol_.records.push_back(std::move(first));
    emit_streaming();
  }

  /** @brief Append an accepted step. Returns false if the observer asks to stop. */
  [[nodiscard]] bool accept(StepAttempt&& attempt) {
    StepRecord record;
    record.t = attempt.t;
    record.dt = attempt.dt;
    record.diffusion = std::move(attempt.diffusion);
    record.predicted = std::move(attempt.predicted);
    record.filtered = std::move(attempt.correction.belief);

    sol_.t = record.t;
    sol_.state = record.filtered;
    sol_.records.push_back(std::move(record));
    emit_streaming();
    if (streaming()) {
      sol_.records.erase(sol_.records.begin(), sol_.records.end() - 1);
    }

    if (observer_ && !observer_(sol_.records.back())) {
      return false;
    }
    return true;
  }

  /** @brief Smooth, build the posterior, and apply the final calibration to it and the state. */
  void finish(const Calibration& calibration) {
    if (opt_.smooth && !smooth(ssm_, sol_.records, sol_.smoothed)) {
      log::Warn("pnode: smoother failed on a non-finite backward kernel");
      sol_.smoothed.clear();
      if (sol_.status == SolverStatus::Success) {
        sol_.status = SolverStatus::NaNDetected;
      }
    }

    if (queries_.empty()) {
      const bool use_smoothed = sol_.smoothed.size() == sol_.records.size() && !sol_.smoothed.empty();
      sol_.posterior.reserve(sol_.records.size());
      for (std::size_t k = 0; k < sol_.records.size(); ++k) {
        PosteriorPoint point;
        point.t = sol_.records[k].t;
        point.belief = use_smoothed ? sol_.smoothed[k] : sol_.records[k].filtered;
        point.provenance = use_smoothed ? Provenance::Smoothed : Provenance::Filtered;
        sol_.posterior.push_back(std::move(point));
      }
    } else if (!streaming()) {
      for (; next_query_ < queries_.size(); ++next_query_) {
        PosteriorPoint point;
        if (!posterior_at(ssm_, sol_.records, sol_.smoothed, queries_[next_query_], point)) {
          break;
        }
        sol_.posterior.push_back(std::move(point));
      }
    }

    sol_.output_scale = calibration.output_scale();
    sol_.stats.calibration_statistic = calibration.statistic();
    for (auto& point : sol_.posterior) {
      point.belief = sol_.calibrated(point.belief);
    }
    sol_.state = sol_.calibrated(sol_.state);
  }

 private:
  [[nodiscard]] bool streaming() const { return opt_.streaming && !queries_.empty(); }

  /** @brief Interpolate every pending query the newest record has reached. */
  void emit_streaming() {
    if (!streaming()) {
      return;
    }
    static const std::vector<GaussianBelief> kNoSmoothing{};
    const double t_reached = sol_.records.back().t;
    for (; next_query_ < queries_.size() && queries_[next_query_] <= t_reached; ++next_query_) {
      PosteriorPoint point;
      if (!posterior_at(ssm_, sol_.records, kNoSmoothing, queries_[next_query_], point)) {
        break;
      }
      sol_.posterior.push_back(std::move(point));
    }
  }

  const StateSpaceModel& ssm_;
  const SolverOptions& opt_;
  const std::vector<double>& queries_;
  const StepObserver& observer_;
  Solution& sol_;
  std::size_t next_query_ = 0;
};

/** @brief Adaptive accept/reject loop from the prepared initial belief. */
template <VectorField F>
inline void run_adaptive(F& f,
                         const StateSpaceModel& ssm,
                         const GaussianBelief& init,
                         double t0,
                         double t1,
                         const SolverOptions& opt,
                         const std::vector<double>& query_times,
                         const StepObserver& observer,
                         Solution& sol) {
  const StateLayout& layout = ssm.layout();
  Calibration calibration(opt.calibration, opt.diffusion_model, layout.dim, opt.output_scale, opt.dynamic_weight);
  ForwardPass pass(ssm, opt, query_times, observer, sol);
  pass.start(t0, init, calibration.diffusion());

  double dt = opt.dt_init > 0.0
                  ? std::clamp(opt.dt_init, opt.dt_min, opt.dt_max)
                  : estimate_initial_step(derivative_mean(layout, init, 0), derivative_mean(layout, init, 1), t0, t1, opt);

  StepSizeController controller{opt.safety, opt.fac_min, opt.fac_max, opt.pi_beta};
  const int error_order = ssm.prior().error_order();
  std::size_t next_landing = 0;
  double t = t0;
  GaussianBelief belief = sol.state;

  sol.status = SolverStatus::MaxStepsExceeded;
  for (int step = 0; step < opt.max_steps; ++step) {
    double t_new = t + dt;
    if (t_new >= t1) {
      t_new = t1;
    }
    if (opt.land_on_query_times) {
      while (next_landing < query_times.size() && query_times[next_landing] <= t) {
        ++next_landing;
      }
      if (next_landing < query_times.size() && query_times[next_landing] < t_new) {
        t_new = query_times[next_landing];
      }
    }
    if (!(t_new > t)) {
      log::Warn("pnode: step size underflow at t=", t, " (dt=", dt, " vanishes in floating point)");
      sol.status = SolverStatus::StepSizeUnderflow;
      break;
    }

    StepAttempt attempt;
    sol.stats.attempted_steps += 1;
    if (!attempt_step(f, ssm, calibration, opt, t, t_new, belief, attempt, sol.stats)) {
      log::Warn("pnode: non-finite value in step from t=", t, " to t=", t_new);
      sol.status = SolverStatus::NaNDetected;
      break;
    }
    const double dt_used = attempt.dt;
    const double err_norm = attempt.error_norm;
    sol.stats.last_dt = dt_used;
    sol.stats.last_error_norm = err_norm;

    const double dt_proposed = controller.propose(dt_used, err_norm, error_order);

    if (err_norm <= 1.0) {
      calibration.accept(attempt.diffusion, attempt.local, attempt.correction);
      controller.accept(err_norm);
      belief = attempt.correction.belief;
      t = t_new;
      sol.stats.accepted_steps += 1;
      sol.stats.consecutive_rejections = 0;

      if (!pass.accept(std::move(attempt))) {
        sol.status = SolverStatus::UserStopped;
        break;
      }
      if (t == t1) {
        sol.status = SolverStatus::Success;
        break;
      }
      dt = std::isfinite(dt_proposed) ? std::clamp(dt_proposed, opt.dt_min, opt.dt_max) : opt.dt_min;
      continue;
    }

    sol.stats.rejected_steps += 1;
    sol.stats.consecutive_rejections += 1;
    sol.stats.max_consecutive_rejections =
        std::max(sol.stats.max_consecutive_rejections, sol.stats.consecutive_rejections);
    log::Debug("pnode: rejected step t=", t, " dt=", dt_used, " error_norm=", err_norm);

    if (sol.stats.consecutive_rejections >= opt.max_consecutive_rejections) {
      log::Warn("pnode: ", sol.stats.consecutive_rejections, " consecutive rejections at t=", t);
      sol.status = SolverStatus::StepSizeUnderflow;
      break;
    }
    if (!std::isfinite(dt_proposed) || dt_proposed < opt.dt_min) {
      log::Warn("pnode: step size underflow at t=", t, " (proposed dt=", dt_proposed, ")");
      sol.status = SolverStatus::StepSizeUnderflow;
      break;
    }
    dt = std::min(dt_proposed, opt.dt_max);
  }

  pass.finish(calibration);
}

/** @brief Step exactly on `grid` without error control. */
template <VectorField F>
inline void run_fixed_grid(F& f,
                           const StateSpaceModel& ssm,
                           const GaussianBelief& init,
                           const std::vector<double>& grid,
                           const SolverOptions& opt,
                           const StepObserver& observer,
                           Solution& sol) {
  const StateLayout& layout = ssm.layout();
  Calibration calibration(opt.calibration, opt.diffusion_model, layout.dim, opt.output_scale, opt.dynamic_weight);
  static const std::vector<double> kNoQueries{};
  ForwardPass pass(ssm, opt, kNoQueries, observer, sol);
  pass.start(grid.front(), init, calibration.diffusion());

  GaussianBelief belief = sol.state;
  sol.status = SolverStatus::Success;
  for (std::size_t k = 1; k < grid.size(); ++k) {
    if (static_cast<int>(k) > opt.max_steps) {
      sol.status = SolverStatus::MaxStepsExceeded;
      break;
    }
    StepAttempt attempt;
    sol.stats.attempted_steps += 1;
    if (!attempt_step(f, ssm, calibration, opt, grid[k - 1], grid[k], belief, attempt, sol.stats)) {
      log::Warn("pnode: non-finite value in step from t=", grid[k - 1], " to t=", grid[k]);
      sol.status = SolverStatus::NaNDetected;
      break;
    }
    sol.stats.last_dt = attempt.dt;
    sol.stats.last_error_norm = attempt.error_norm;

    calibration.accept(attempt.diffusion, attempt.local, attempt.correction);
    belief = attempt.correction.belief;
    sol.stats.accepted_steps += 1;
    if (!pass.accept(std::move(attempt))) {
      sol.status = SolverStatus::UserStopped;
      break;
    }
  }

  pass.finish(calibration);
}

/** @brief Validate the configuration and set up the state-space model for dimension `dim`. */
[[nodiscard]] inline SolverStatus prepare(const SolverOptions& opt, int dim, StateSpaceModel& ssm) {
  const SolverStatus status = validate_options(opt);
  if (status != SolverStatus::Success) {
    return status;
  }
  if (dim < 1) {
    return SolverStatus::InvalidInitialCondition;
  }
  if (!StateSpaceModel::from_order(opt.order, dim, ssm)) {
    return SolverStatus::InvalidOrder;
  }
  return SolverStatus::Success;
}

/** @brief Initial belief from `u0`; Taylor-mode when the field accepts jets. */
template <VectorField F>
[[nodiscard]] inline SolverStatus initialize(F& f,
                                             const StateSpaceModel& ssm,
                                             double t0,
                                             const Vector& u0,
                                             GaussianBelief& init,
                                             SolverStats& stats) {
  if (u0.size() == 0 || !u0.allFinite()) {
    return SolverStatus::InvalidInitialCondition;
  }
  if (!taylor::initial_stack(f, t0, u0, ssm.layout(), init, stats.rhs_evals)) {
    log::Warn("pnode: vector field is not finite at the initial condition");
    return SolverStatus::NaNDetected;
  }
  return SolverStatus::Success;
}

}  // namespace detail

/**
 * @brief Solve `u' = f(t, u)`, `u(t0) = u0` on `[t0, t1]`.
 *
 * Without query times the posterior holds the belief at every accepted time (including
 * `t0`); with query times it holds one belief per reached query, interpolated from the
 * records. Fatal statuses keep the records and the last accepted state.
 */
template <class F>
requires VectorField<std::remove_reference_t<F>>
[[nodiscard]] Solution solve(F&& f,
                             const Vector& u0,
                             double t0,
                             double t1,
                             const SolverOptions& opt = {},
                             const std::vector<double>& query_times = {},
                             const StepObserver& observer = {}) {
  Solution sol{};
  sol.t = t0;
  sol.calibration = opt.calibration;

  StateSpaceModel ssm;
  sol.status = detail::prepare(opt, static_cast<int>(u0.size()), ssm);
  if (sol.status != SolverStatus::Success) {
    return sol;
  }
  sol.layout = ssm.layout();
  if (!detail::valid_time_span(t0, t1) || !detail::valid_query_times(query_times, t0, t1)) {
    sol.status = SolverStatus::InvalidTimeSpan;
    return sol;
  }

  GaussianBelief init;
  sol.status = detail::initialize(f, ssm, t0, u0, init, sol.stats);
  if (sol.status != SolverStatus::Success) {
    return sol;
  }
  detail::run_adaptive(f, ssm, init, t0, t1, opt, query_times, observer, sol);
  return sol;
}

/**
 * @brief Solve from a full initial belief over `(u, u', ..., u^(q))`.
 *
 * The mean must have `(order + 1) * d` entries; an empty `cov_sqrt` means zero covariance.
 */
template <class F>
requires VectorField<std::remove_reference_t<F>>
[[nodiscard]] Solution solve(F&& f,
                             const GaussianBelief& initial,
                             double t0,
                             double t1,
                             const SolverOptions& opt = {},
                             const std::vector<double>& query_times = {},
                             const StepObserver& observer = {}) {
  Solution sol{};
  sol.t = t0;
  sol.calibration = opt.calibration;

  const Eigen::Index n = initial.mean.size();
  const Eigen::Index per = static_cast<Eigen::Index>(opt.order) + 1;
  const int dim = (per > 0 && n % per == 0) ? static_cast<int>(n / per) : 0;

  StateSpaceModel ssm;
  sol.status = detail::prepare(opt, dim, ssm);
  if (sol.status != SolverStatus::Success) {
    return sol;
  }
  sol.layout = ssm.layout();
  if (!detail::valid_time_span(t0, t1) || !detail::valid_query_times(query_times, t0, t1)) {
    sol.status = SolverStatus::InvalidTimeSpan;
    return sol;
  }

  GaussianBelief init;
  if (!detail::normalize_initial_belief(ssm.layout(), initial, init)) {
    sol.status = SolverStatus::InvalidInitialCondition;
    return sol;
  }
  detail::run_adaptive(f, ssm, init, t0, t1, opt, query_times, observer, sol);
  return sol;
}

/**
 * @brief Solve on a prescribed grid without step-size control.
 *
 * The grid must be finite, strictly increasing, and hold at least two times. The
 * posterior holds one belief per grid point.
 */
template <class F>
requires VectorField<std::remove_reference_t<F>>
[[nodiscard]] Solution solve_fixed_grid(F&& f,
                                        const Vector& u0,
                                        const std::vector<double>& grid,
                                        const SolverOptions& opt = {},
                                        const StepObserver& observer = {}) {
  Solution sol{};
  sol.calibration = opt.calibration;
  if (!grid.empty()) {
    sol.t = grid.front();
  }

  StateSpaceModel ssm;
  sol.status = detail::prepare(opt, static_cast<int>(u0.size()), ssm);
  if (sol.status != SolverStatus::Success) {
    return sol;
  }
  sol.layout = ssm.layout();
  if (!detail::valid_grid(grid)) {
    sol.status = SolverStatus::InvalidTimeSpan;
    return sol;
  }

  GaussianBelief init;
  sol.status = detail::initialize(f, ssm, grid.front(), u0, init, sol.stats);
  if (sol.status != SolverStatus::Success) {
    return sol;
  }
  detail::run_fixed_grid(f, ssm, init, grid, opt, observer, sol);
  return sol;
}

}  // namespace pnode
