/**
 * @file smoother.hpp
 * @brief Square-root Rauch-Tung-Striebel backward pass over step records.
 */
#pragma once

#include <cstddef>
#include <vector>

#include "pnode/belief.hpp"
#include "pnode/extrapolation.hpp"
#include "pnode/solution.hpp"
#include "pnode/state_space.hpp"

namespace pnode {

/**
 * @brief Backward kernel of the transition into record `k + 1`.
 *
 * Recomputed from the filtered belief of record `k` with the step length and
 * diffusion stored in record `k + 1`.
 */
[[nodiscard]] inline bool backward_kernel(const StateSpaceModel& ssm,
                                          const std::vector<StepRecord>& records,
                                          std::size_t k,
                                          GaussianConditional& kernel) {
  if (k + 1 >= records.size()) {
    return false;
  }
  const StepRecord& next = records[k + 1];
  GaussianBelief predicted;
  return extrapolate_with_backward_kernel(ssm, records[k].filtered, next.dt, next.diffusion, predicted, kernel);
}

/**
 * @brief Smoothed beliefs for every record, last to first.
 *
 * `smoothed[N-1]` is the last filtered belief; earlier ones follow
 * `m_s = G m_s' + b`, `L_s = tria([G L_s', Lambda_sqrt])`. Fails on a non-finite kernel.
 */
[[nodiscard]] inline bool smooth(const StateSpaceModel& ssm,
                                 const std::vector<StepRecord>& records,
                                 std::vector<GaussianBelief>& smoothed) {
  smoothed.clear();
  if (records.empty()) {
    return true;
  }
  smoothed.resize(records.size());
  smoothed.back() = records.back().filtered;

  for (std::size_t k = records.size() - 1; k-- > 0;) {
    GaussianConditional kernel;
    if (!backward_kernel(ssm, records, k, kernel)) {
      smoothed.clear();
      return false;
    }
    smoothed[k] = marginalize(kernel, smoothed[k + 1]);
  }
  return true;
}

}  // namespace pnode
