/**
 * @file markov.hpp
 * @brief Gauss-Markov sequences: discretized priors, posterior sequences, marginals and samples.
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <random>
#include <utility>
#include <vector>

#include "pnode/belief.hpp"
#include "pnode/extrapolation.hpp"
#include "pnode/smoother.hpp"
#include "pnode/solution.hpp"
#include "pnode/state_space.hpp"
#include "pnode/types.hpp"

namespace pnode {

/**
 * @brief Initial belief plus a chain of linear-Gaussian conditionals over a time grid.
 *
 * A forward sequence starts at the first grid point and `conditionals[k]` maps state `k`
 * to state `k + 1`. A reverse sequence starts at the last grid point and
 * `conditionals[k]` maps state `k + 1` back to state `k`.
 */
struct MarkovSequence {
  GaussianBelief init{};
  std::vector<GaussianConditional> conditionals{};
  bool reverse = false;

  /** @brief Number of grid points. */
  [[nodiscard]] std::size_t size() const { return conditionals.size() + 1; }
};

/**
 * @brief The prior on `grid`, started from `init` at `grid.front()`.
 *
 * Transition `k` is `(A(dt_k), 0, Q_sqrt(dt_k) diag(sigma))`. Fails on fewer than two
 * grid points, a grid that is not strictly increasing, or shapes that do not match the model.
 */
[[nodiscard]] inline bool discretize_prior(const StateSpaceModel& ssm,
                                           const std::vector<double>& grid,
                                           const Vector& diffusion,
                                           const GaussianBelief& init,
                                           MarkovSequence& out) {
  const StateLayout& layout = ssm.layout();
  const Eigen::Index n = layout.state_size();
  out = MarkovSequence{};
  if (grid.size() < 2 || diffusion.size() != layout.dim || init.mean.size() != n || init.cov_sqrt.rows() != n) {
    return false;
  }

  out.conditionals.reserve(grid.size() - 1);
  for (std::size_t k = 0; k + 1 < grid.size(); ++k) {
    const double dt = grid[k + 1] - grid[k];
    Transition tr;
    if (!std::isfinite(dt) || !(dt > 0.0) || !ssm.transition(dt, diffusion, tr)) {
      out.conditionals.clear();
      return false;
    }
    GaussianConditional step;
    step.gain = std::move(tr.a);
    step.offset = Vector::Zero(n);
    step.noise_sqrt = std::move(tr.q_sqrt);
    out.conditionals.push_back(std::move(step));
  }
  out.init = init;
  return true;
}

/**
 * @brief Posterior of a finished solve as a reverse sequence over its records.
 *
 * Starts from the last filtered belief and uses the smoother's backward kernels, so its
 * marginals are the smoothed beliefs. Global calibration is applied to the initial
 * factor and to every kernel's noise. Needs the stored records of a non-streaming solve.
 */
[[nodiscard]] inline bool posterior_sequence(const StateSpaceModel& ssm,
                                             const Solution& solution,
                                             MarkovSequence& out) {
  out = MarkovSequence{};
  const std::vector<StepRecord>& records = solution.records;
  if (records.empty()) {
    return false;
  }
  out.reverse = true;
  out.init = solution.calibrated(records.back().filtered);
  out.conditionals.resize(records.size() - 1);
  for (std::size_t k = 0; k + 1 < records.size(); ++k) {
    GaussianConditional& kernel = out.conditionals[k];
    if (!backward_kernel(ssm, records, k, kernel)) {
      out.conditionals.clear();
      return false;
    }
    kernel.noise_sqrt = solution.calibrated(GaussianBelief{kernel.offset, kernel.noise_sqrt}).cov_sqrt;
  }
  return true;
}

/** @brief Marginal belief at every grid point, in time order for either direction. */
[[nodiscard]] inline bool markov_marginals(const MarkovSequence& seq, std::vector<GaussianBelief>& out) {
  const std::size_t count = seq.size();
  out.assign(count, GaussianBelief{});
  if (!seq.reverse) {
    out.front() = seq.init;
    for (std::size_t k = 0; k + 1 < count; ++k) {
      out[k + 1] = marginalize(seq.conditionals[k], out[k]);
    }
  } else {
    out.back() = seq.init;
    for (std::size_t k = count - 1; k-- > 0;) {
      out[k] = marginalize(seq.conditionals[k], out[k + 1]);
    }
  }
  for (const auto& b : out) {
    if (!b.mean.allFinite() || !b.cov_sqrt.allFinite()) {
      out.clear();
      return false;
    }
  }
  return true;
}

namespace detail {

template <class Engine>
[[nodiscard]] Vector standard_normal(Eigen::Index n, Engine& rng) {
  std::normal_distribution<double> randn(0.0, 1.0);
  Vector xi(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    xi(i) = randn(rng);
  }
  return xi;
}

template <class Engine>
[[nodiscard]] Vector draw(const GaussianConditional& c, const Vector& given, Engine& rng) {
  return c.gain * given + c.offset + c.noise_sqrt * standard_normal(c.noise_sqrt.cols(), rng);
}

}  // namespace detail

/**
 * @brief One joint draw by ancestral sampling in the direction of the sequence.
 *
 * `out` is `size() x state_size`; row `k` is the state at grid point `k`.
 */
template <class Engine>
[[nodiscard]] bool markov_sample(const MarkovSequence& seq, Engine& rng, Matrix& out) {
  const std::size_t count = seq.size();
  const Eigen::Index n = seq.init.mean.size();
  out.resize(static_cast<Eigen::Index>(count), n);

  Vector x = seq.init.mean + seq.init.cov_sqrt * detail::standard_normal(seq.init.cov_sqrt.cols(), rng);
  if (!seq.reverse) {
    out.row(0) = x.transpose();
    for (std::size_t k = 0; k + 1 < count; ++k) {
      x = detail::draw(seq.conditionals[k], x, rng);
      out.row(static_cast<Eigen::Index>(k + 1)) = x.transpose();
    }
  } else {
    out.row(static_cast<Eigen::Index>(count - 1)) = x.transpose();
    for (std::size_t k = count - 1; k-- > 0;) {
      x = detail::draw(seq.conditionals[k], x, rng);
      out.row(static_cast<Eigen::Index>(k)) = x.transpose();
    }
  }
  return out.allFinite();
}

/** @brief `count` independent joint draws. */
template <class Engine>
[[nodiscard]] bool markov_sample(const MarkovSequence& seq, int count, Engine& rng, std::vector<Matrix>& out) {
  out.clear();
  if (count < 0) {
    return false;
  }
  out.resize(static_cast<std::size_t>(count));
  for (auto& sample : out) {
    if (!markov_sample(seq, rng, sample)) {
      out.clear();
      return false;
    }
  }
  return true;
}

}  // namespace pnode
