/**
 * @file types.hpp
 * @brief Public API enums, options, status, stats, and linear algebra aliases.
 */
#pragma once

#include <Eigen/Core>

namespace pnode {

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using MatrixRM = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/** @brief Linearization of the ODE residual `u' - f(t, u)` around the predicted mean. */
enum class Linearization {
  ZerothOrder,
  FirstOrder
};

/** @brief Diffusion (output-scale) calibration strategy. */
enum class CalibrationMode {
  None,
  Global,
  Dynamic
};

/** @brief Shape of the diffusion: one scalar for all components, or one per component. */
enum class DiffusionModel {
  Scalar,
  PerDimension
};

/** @brief Solver configuration options. */
struct SolverOptions {
  int order = 4;
  Linearization linearization = Linearization::ZerothOrder;
  CalibrationMode calibration = CalibrationMode::Dynamic;
  DiffusionModel diffusion_model = DiffusionModel::Scalar;

  // Fixed diffusion for CalibrationMode::None; initial estimate for Dynamic.
  double output_scale = 1.0;
  // Weight of the newest local estimate in the dynamic running estimate.
  double dynamic_weight = 1.0;
  double measurement_noise = 0.0;

  double rtol = 1e-6;
  double atol = 1e-8;

  double dt_init = 0.0;
  double dt_min = 1e-12;
  double dt_max = 1e+16;

  double safety = 0.95;
  double fac_min = 0.2;
  double fac_max = 10.0;
  double pi_beta = 0.1;

  int max_consecutive_rejections = 50;
  int max_steps = 100000;

  bool smooth = false;
  bool streaming = false;
  bool land_on_query_times = false;
};

/** @brief Terminal status returned by a solve. */
enum class SolverStatus {
  Success,
  MaxStepsExceeded,
  StepSizeUnderflow,
  InvalidTolerance,
  InvalidStepSize,
  InvalidOrder,
  InvalidTimeSpan,
  InvalidInitialCondition,
  InvalidOptions,
  NaNDetected,
  UserStopped
};

/** @brief Convert SolverStatus to stable string token. */
[[nodiscard]] inline const char* ToString(SolverStatus status) {
  switch (status) {
    case SolverStatus::Success:
      return "success";
    case SolverStatus::MaxStepsExceeded:
      return "max_steps_exceeded";
    case SolverStatus::StepSizeUnderflow:
      return "step_size_underflow";
    case SolverStatus::InvalidTolerance:
      return "invalid_tolerance";
    case SolverStatus::InvalidStepSize:
      return "invalid_step_size";
    case SolverStatus::InvalidOrder:
      return "invalid_order";
    case SolverStatus::InvalidTimeSpan:
      return "invalid_time_span";
    case SolverStatus::InvalidInitialCondition:
      return "invalid_initial_condition";
    case SolverStatus::InvalidOptions:
      return "invalid_options";
    case SolverStatus::NaNDetected:
      return "nan_detected";
    case SolverStatus::UserStopped:
      return "user_stopped";
  }
  return "unknown";
}

[[nodiscard]] inline const char* ToString(CalibrationMode mode) {
  switch (mode) {
    case CalibrationMode::None:
      return "none";
    case CalibrationMode::Global:
      return "global";
    case CalibrationMode::Dynamic:
      return "dynamic";
  }
  return "unknown";
}

[[nodiscard]] inline const char* ToString(Linearization lin) {
  switch (lin) {
    case Linearization::ZerothOrder:
      return "zeroth_order";
    case Linearization::FirstOrder:
      return "first_order";
  }
  return "unknown";
}

/** @brief Runtime counters and last-step telemetry. */
struct SolverStats {
  int attempted_steps = 0;
  int accepted_steps = 0;
  int rejected_steps = 0;
  int consecutive_rejections = 0;
  int max_consecutive_rejections = 0;
  long long rhs_evals = 0;
  long long jacobian_evals = 0;
  double last_dt = 0.0;
  double last_error_norm = 0.0;
  // Mean of z^T S^-1 z / d over accepted steps under the final calibration.
  double calibration_statistic = 0.0;
};

}  // namespace pnode
