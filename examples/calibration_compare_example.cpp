#include <cmath>

#include <Eigen/Core>

#include "pnode/logging.hpp"
#include "pnode/pnode.hpp"

namespace {

// Van der Pol oscillator with a moderate stiffness parameter.
struct VanDerPol {
  double mu = 5.0;

  template <class Scalar>
  void operator()(const Scalar& /*t*/, const Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& u,
                  Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& du) const {
    du.resize(2);
    du(0) = u(1);
    du(1) = mu * (1.0 - u(0) * u(0)) * u(1) - u(0);
  }
};

void Report(const char* label, const pnode::Solution& sol) {
  if (!sol.ok()) {
    pnode::log::Warn(label, ": status=", pnode::ToString(sol.status));
    return;
  }
  const pnode::Vector u = pnode::derivative_mean(sol.layout, sol.state, 0);
  const pnode::Vector s = pnode::derivative_std(sol.layout, sol.state, 0);
  pnode::log::Info(label, ": u(t1) = [", u(0), ", ", u(1), "] std = [", s(0), ", ", s(1), "]",
                   " steps=", sol.stats.accepted_steps,
                   " statistic=", sol.stats.calibration_statistic,
                   " output_scale=", sol.output_scale.transpose());
}

}  // namespace

int main() {
  pnode::Vector u0(2);
  u0 << 2.0, 0.0;
  constexpr double kT1 = 10.0;

  pnode::SolverOptions opt;
  opt.order = 4;
  opt.linearization = pnode::Linearization::FirstOrder;
  opt.rtol = 1e-6;
  opt.atol = 1e-8;

  // A fixed scale far from the data leaves the uncertainty miscalibrated.
  opt.calibration = pnode::CalibrationMode::None;
  opt.output_scale = 1e-3;
  Report("fixed (1e-3)", pnode::solve(VanDerPol{}, u0, 0.0, kT1, opt));
  opt.output_scale = 1e3;
  Report("fixed (1e+3)", pnode::solve(VanDerPol{}, u0, 0.0, kT1, opt));

  opt.output_scale = 1.0;
  opt.calibration = pnode::CalibrationMode::Global;
  Report("global", pnode::solve(VanDerPol{}, u0, 0.0, kT1, opt));

  opt.calibration = pnode::CalibrationMode::Dynamic;
  Report("dynamic", pnode::solve(VanDerPol{}, u0, 0.0, kT1, opt));

  opt.diffusion_model = pnode::DiffusionModel::PerDimension;
  Report("dynamic per-dimension", pnode::solve(VanDerPol{}, u0, 0.0, kT1, opt));

  return 0;
}
