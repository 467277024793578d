/**
 * @file batch.hpp
 * @brief Batch helpers for solving many independent IVPs with shared settings.
 */
#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include "pnode/jacobian.hpp"
#include "pnode/solution.hpp"
#include "pnode/solver.hpp"
#include "pnode/types.hpp"

namespace pnode {

struct BatchTask {
  double t0 = 0.0;
  double t1 = 0.0;
  Vector u0{};
  std::vector<double> query_times{};
};

struct BatchWorkspace {
  std::vector<Solution> results{};

  void Reserve(std::size_t count) {
    results.reserve(count);
  }
};

/** @brief Solve every task in order into `out_results`; tasks share nothing mutable. */
template <class F>
requires VectorField<std::remove_reference_t<F>>
void solve_batch_inplace(F&& f,
                         const std::vector<BatchTask>& tasks,
                         const SolverOptions& opt,
                         std::vector<Solution>& out_results) {
  auto&& f_ref = f;
  out_results.clear();
  out_results.reserve(tasks.size());
  for (const auto& task : tasks) {
    out_results.push_back(solve(f_ref, task.u0, task.t0, task.t1, opt, task.query_times));
  }
}

template <class F>
requires VectorField<std::remove_reference_t<F>>
[[nodiscard]] std::vector<Solution> solve_batch(F&& f,
                                                const std::vector<BatchTask>& tasks,
                                                const SolverOptions& opt,
                                                BatchWorkspace* workspace = nullptr) {
  if (workspace != nullptr) {
    solve_batch_inplace(std::forward<F>(f), tasks, opt, workspace->results);
    return workspace->results;
  }

  std::vector<Solution> results;
  solve_batch_inplace(std::forward<F>(f), tasks, opt, results);
  return results;
}

}  // namespace pnode
