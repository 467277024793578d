#include <cstddef>
#include <vector>

#include <Eigen/Core>

#include "pnode/logging.hpp"
#include "pnode/pnode.hpp"

namespace {

// Predator-prey model; generic in the scalar so the solver can differentiate it.
struct LotkaVolterra {
  template <class Scalar>
  void operator()(const Scalar& /*t*/, const Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& u,
                  Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& du) const {
    constexpr double kPreyGrowth = 0.5;
    constexpr double kPredation = 0.05;
    constexpr double kPredatorDeath = 0.5;
    constexpr double kConversion = 0.05;
    du.resize(2);
    du(0) = kPreyGrowth * u(0) - kPredation * u(0) * u(1);
    du(1) = -kPredatorDeath * u(1) + kConversion * u(0) * u(1);
  }
};

}  // namespace

int main() {
  pnode::Vector u0(2);
  u0 << 20.0, 20.0;

  pnode::SolverOptions opt;
  opt.order = 4;
  opt.linearization = pnode::Linearization::FirstOrder;
  opt.calibration = pnode::CalibrationMode::Dynamic;
  opt.rtol = 1e-6;
  opt.atol = 1e-8;
  opt.smooth = true;

  std::vector<double> ts;
  for (int i = 0; i <= 10; ++i) {
    ts.push_back(5.0 * i);
  }

  const auto sol = pnode::solve(LotkaVolterra{}, u0, 0.0, 50.0, opt, ts);
  if (!sol.ok()) {
    pnode::log::Error("solve failed, status=", pnode::ToString(sol.status));
    return 1;
  }

  const auto means = sol.u();
  const auto stds = sol.marginal_std();
  for (std::size_t i = 0; i < sol.posterior.size(); ++i) {
    pnode::log::Info("t=", sol.posterior[i].t,
                     " prey=", means[i](0), " +/- ", stds[i](0),
                     " predator=", means[i](1), " +/- ", stds[i](1),
                     " (", pnode::ToString(sol.posterior[i].provenance), ")");
  }
  pnode::log::Info("accepted steps = ", sol.stats.accepted_steps, " rejected = ", sol.stats.rejected_steps,
                   " rhs evals = ", sol.stats.rhs_evals, " jacobians = ", sol.stats.jacobian_evals);
  pnode::log::Info("calibration statistic = ", sol.stats.calibration_statistic);

  return 0;
}
