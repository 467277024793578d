#include <cmath>
#include <vector>

#include "pnode/batch.hpp"
#include "pnode/logging.hpp"

int main() {
  using pnode::Vector;

  auto rhs = [](double, const Vector& u, Vector& du) {
    du.resize(1);
    du(0) = u(0);
  };

  std::vector<pnode::BatchTask> tasks{
      {.t0 = 0.0, .t1 = 1.0, .u0 = Vector::Constant(1, 1.0)},
      {.t0 = 0.0, .t1 = 2.0, .u0 = Vector::Constant(1, 2.0), .query_times = {0.5, 1.0}},
      {.t0 = 1.0, .t1 = 0.0, .u0 = Vector::Constant(1, std::exp(1.0))}};

  pnode::SolverOptions opt;
  opt.order = 5;
  opt.rtol = 1e-10;
  opt.atol = 1e-12;

  pnode::BatchWorkspace ws;
  ws.Reserve(tasks.size());
  const auto results = pnode::solve_batch(rhs, tasks, opt, &ws);
  if (results.size() != tasks.size()) {
    pnode::log::Error("batch results size mismatch");
    return 1;
  }
  if (!results[0].ok() || std::abs(results[0].state.mean(0) - std::exp(1.0)) > 1e-7) {
    pnode::log::Error("batch case 0 mismatch");
    return 1;
  }
  if (!results[1].ok() || results[1].posterior.size() != 2 ||
      std::abs(results[1].posterior[1].belief.mean(0) - 2.0 * std::exp(1.0)) > 1e-7 ||
      std::abs(results[1].state.mean(0) - 2.0 * std::exp(2.0)) > 1e-6) {
    pnode::log::Error("batch case 1 mismatch");
    return 1;
  }
  if (results[2].status != pnode::SolverStatus::InvalidTimeSpan) {
    pnode::log::Error("batch case 2 must reject a reversed time span");
    return 1;
  }

  // Tasks share nothing: a batch entry equals the corresponding single solve.
  const auto single = pnode::solve(rhs, tasks[1].u0, tasks[1].t0, tasks[1].t1, opt, tasks[1].query_times);
  for (std::size_t i = 0; i < single.posterior.size(); ++i) {
    if ((single.posterior[i].belief.mean - results[1].posterior[i].belief.mean).norm() != 0.0) {
      pnode::log::Error("batch entry differs from the single solve");
      return 1;
    }
  }

  std::vector<pnode::Solution> out;
  pnode::solve_batch_inplace(rhs, tasks, opt, out);
  if (out.size() != tasks.size() || out[0].stats.accepted_steps != results[0].stats.accepted_steps) {
    pnode::log::Error("batch inplace mismatch");
    return 1;
  }

  return 0;
}
