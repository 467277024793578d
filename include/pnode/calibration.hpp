/**
 * @file calibration.hpp
 * @brief Online estimation of the diffusion (output scale) of the prior.
 */
#pragma once

#include <cmath>

#include "pnode/correction.hpp"
#include "pnode/types.hpp"

namespace pnode {

/**
 * @brief Diffusion state of one solve.
 *
 * Diffusions are kept as standard-deviation scales `sigma` (one per component) that
 * multiply the process-noise factor. The scalar model keeps all entries equal.
 *
 * - `None`: `sigma = output_scale` throughout.
 * - `Global`: steps run at `sigma = 1`; accepted steps accumulate the whitened squared
 *   residual and the final `sigma^2` is its mean. Only outputs are rescaled.
 * - `Dynamic`: `sigma_k^2 = (1 - w) sigma_{k-1}^2 + w sigma_loc^2`, proposed per attempt
 *   and committed on acceptance.
 */
class Calibration {
 public:
  Calibration() = default;

  Calibration(CalibrationMode mode, DiffusionModel model, int dim, double output_scale, double weight)
      : mode_(mode),
        model_(model),
        weight_(weight),
        diffusion_sq_(Vector::Constant(dim, mode == CalibrationMode::Global ? 1.0 : output_scale * output_scale)),
        sum_(Vector::Zero(dim)) {}

  [[nodiscard]] CalibrationMode mode() const { return mode_; }

  /** @brief Committed diffusion `sigma`. */
  [[nodiscard]] Vector diffusion() const { return diffusion_sq_.cwiseSqrt(); }

  /** @brief Diffusion to use for a step attempt with the given local estimate. */
  [[nodiscard]] Vector candidate(const LocalErrorEstimate& local) const {
    if (mode_ != CalibrationMode::Dynamic) {
      return diffusion();
    }
    Vector next = diffusion_sq_;
    for (Eigen::Index a = 0; a < next.size(); ++a) {
      const double loc = local.diffusion_sq(a);
      if (!std::isfinite(loc) || !(loc > 0.0)) {
        continue;
      }
      next(a) = (1.0 - weight_) * diffusion_sq_(a) + weight_ * loc;
    }
    return next.cwiseSqrt();
  }

  /**
   * @brief Commit an accepted step that ran with diffusion `sigma`.
   *
   * Updates the running estimate and the consistency statistic. The dynamic statistic
   * compares the step's local estimate with the diffusion committed before it.
   */
  void accept(const Vector& sigma, const LocalErrorEstimate& local, const CorrectionResult& correction) {
    if (mode_ == CalibrationMode::Dynamic) {
      for (Eigen::Index a = 0; a < diffusion_sq_.size(); ++a) {
        const double loc = local.diffusion_sq(a);
        const double prev = diffusion_sq_(a);
        if (std::isfinite(loc) && loc > 0.0 && prev > 0.0) {
          log_ratio_sum_ += std::log(loc / prev);
          ++log_ratio_count_;
        }
      }
      diffusion_sq_ = sigma.cwiseProduct(sigma);
    } else {
      const Vector stat = whitened_statistic(correction);
      if (mode_ == CalibrationMode::Global) {
        sum_ += stat;
      }
      statistic_sum_ += stat.sum() / static_cast<double>(stat.size());
    }
    ++count_;
  }

  [[nodiscard]] int count() const { return count_; }

  /**
   * @brief Final per-component scale for output beliefs.
   *
   * Global mode returns `sqrt(sum / count)` (one where degenerate); the other modes return
   * ones since their beliefs already carry the diffusion they were computed with.
   */
  [[nodiscard]] Vector output_rescale() const {
    Vector out = Vector::Ones(sum_.size());
    if (mode_ != CalibrationMode::Global || count_ == 0) {
      return out;
    }
    const Vector sigma_sq = global_sigma_sq();
    for (Eigen::Index a = 0; a < out.size(); ++a) {
      out(a) = std::sqrt(sigma_sq(a));
    }
    return out;
  }

  /** @brief Calibrated diffusion reported with the solution. */
  [[nodiscard]] Vector output_scale() const {
    if (mode_ == CalibrationMode::Global) {
      return output_rescale();
    }
    return diffusion();
  }

  /**
   * @brief Consistency of the residuals with the diffusion; near one when calibrated.
   *
   * - `None`: mean of `z^T S^-1 z / d` at the fixed diffusion.
   * - `Global`: the same mean at unit diffusion, i.e. the squared scale before rescaling.
   * - `Dynamic`: geometric mean of `sigma_loc^2 / sigma_prev^2` over the defined local
   *   estimates; one when there are none.
   */
  [[nodiscard]] double statistic() const {
    if (count_ == 0) {
      return 0.0;
    }
    if (mode_ == CalibrationMode::Dynamic) {
      if (log_ratio_count_ == 0) {
        return 1.0;
      }
      return std::exp(log_ratio_sum_ / static_cast<double>(log_ratio_count_));
    }
    return statistic_sum_ / static_cast<double>(count_);
  }

 private:
  /** @brief Per-component `z^T S^-1 z / d` (scalar model) or `z_a^2 / S_aa` (per-dimension). */
  [[nodiscard]] Vector whitened_statistic(const CorrectionResult& correction) const {
    const Eigen::Index d = correction.residual.size();
    if (model_ == DiffusionModel::Scalar) {
      return Vector::Constant(d, correction.whitened_sq_norm / static_cast<double>(d));
    }
    const Vector s_diag = correction.innovation_sqrt.rowwise().squaredNorm();
    Vector out(d);
    for (Eigen::Index a = 0; a < d; ++a) {
      out(a) = s_diag(a) > 0.0 ? correction.residual(a) * correction.residual(a) / s_diag(a) : 0.0;
    }
    return out;
  }

  [[nodiscard]] Vector global_sigma_sq() const {
    Vector out = sum_ / static_cast<double>(count_);
    for (Eigen::Index a = 0; a < out.size(); ++a) {
      if (!(out(a) > 0.0) || !std::isfinite(out(a))) {
        out(a) = 1.0;
      }
    }
    return out;
  }

  CalibrationMode mode_ = CalibrationMode::None;
  DiffusionModel model_ = DiffusionModel::Scalar;
  double weight_ = 1.0;
  Vector diffusion_sq_{};
  Vector sum_{};
  double statistic_sum_ = 0.0;
  double log_ratio_sum_ = 0.0;
  long long log_ratio_count_ = 0;
  int count_ = 0;
};

}  // namespace pnode
