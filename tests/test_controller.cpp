#include <cmath>
#include <limits>

#include "pnode/controller.hpp"
#include "pnode/error_norm.hpp"
#include "pnode/logging.hpp"
#include "pnode/types.hpp"

int main() {
  pnode::StepSizeController controller{0.9, 0.2, 5.0, 0.1};

  // Integral term is neutral while e_prev == e.
  {
    controller.error_prev = 0.5;
    const double dt = controller.propose(0.1, 0.5, 5);
    const double expected = 0.1 * 0.9 * std::pow(0.5, -1.0 / 5.0);
    if (std::abs(dt - expected) > 1e-15) {
      pnode::log::Error("PI proposal mismatch: ", dt, " vs ", expected);
      return 1;
    }
  }

  // Full PI law.
  {
    controller.error_prev = 1.0;
    const double e = 0.3;
    const double dt = controller.propose(0.2, e, 4);
    const double expected = 0.2 * 0.9 * std::pow(e, -0.25) * std::pow(1.0 / e, 0.1);
    if (std::abs(dt - expected) > 1e-15) {
      pnode::log::Error("PI proposal with integral term mismatch");
      return 1;
    }
  }

  // Clipping to [fac_min, fac_max].
  {
    controller.error_prev = 1.0;
    if (std::abs(controller.propose(1.0, 1e12, 3) - 0.2) > 1e-15) {
      pnode::log::Error("huge error must shrink by fac_min");
      return 1;
    }
    if (std::abs(controller.propose(1.0, 1e-12, 3) - 5.0) > 1e-15) {
      pnode::log::Error("tiny error must grow by fac_max");
      return 1;
    }
    if (std::abs(controller.propose(1.0, 0.0, 3) - 5.0) > 1e-15) {
      pnode::log::Error("zero error must grow by fac_max");
      return 1;
    }
    if (std::abs(controller.propose(1.0, std::numeric_limits<double>::infinity(), 3) - 0.2) > 1e-15) {
      pnode::log::Error("infinite error must shrink by fac_min");
      return 1;
    }
  }

  // Accepted errors feed the integral term, floored for zero errors.
  {
    controller.accept(0.25);
    if (controller.error_prev != 0.25) {
      pnode::log::Error("accept must record the error");
      return 1;
    }
    controller.accept(0.0);
    if (!(controller.error_prev > 0.0)) {
      pnode::log::Error("accept must keep e_prev positive");
      return 1;
    }
  }

  // Weighted RMS norm.
  {
    pnode::Vector err(2);
    pnode::Vector u_prev(2);
    pnode::Vector u_new(2);
    err << 1e-6, 2e-6;
    u_prev << 1.0, -3.0;
    u_new << 2.0, 1.0;
    const double atol = 1e-6;
    const double rtol = 1e-3;
    const double s0 = atol + rtol * 2.0;
    const double s1 = atol + rtol * 3.0;
    const double expected = std::sqrt(0.5 * ((1e-6 / s0) * (1e-6 / s0) + (2e-6 / s1) * (2e-6 / s1)));
    const double got = pnode::weighted_rms_error(err, u_prev, u_new, atol, rtol);
    if (std::abs(got - expected) > 1e-15) {
      pnode::log::Error("weighted RMS mismatch");
      return 1;
    }
  }

  return 0;
}
