#include <algorithm>
#include <cmath>

#include <Eigen/Core>
#include <Eigen/Eigenvalues>

#include "pnode/belief.hpp"
#include "pnode/extrapolation.hpp"
#include "pnode/logging.hpp"
#include "pnode/sqrtm.hpp"
#include "pnode/state_space.hpp"

namespace {

using pnode::GaussianBelief;
using pnode::Matrix;
using pnode::Vector;

double RelDiff(const Matrix& a, const Matrix& b) {
  return (a - b).norm() / std::max(1.0, b.norm());
}

bool IsPsd(const Matrix& cov) {
  if ((cov - cov.transpose()).norm() > 1e-12 * std::max(1.0, cov.norm())) {
    return false;
  }
  const Eigen::SelfAdjointEigenSolver<Matrix> es(cov);
  return es.eigenvalues().minCoeff() >= -1e-12 * std::max(1.0, cov.norm());
}

GaussianBelief MakeBelief(const pnode::StateLayout& layout) {
  const Eigen::Index n = layout.state_size();
  GaussianBelief b;
  b.mean.resize(n);
  Matrix m(n, n);
  for (Eigen::Index i = 0; i < n; ++i) {
    b.mean(i) = std::cos(0.3 * static_cast<double>(i));
    for (Eigen::Index j = 0; j < n; ++j) {
      m(i, j) = 0.1 * std::sin(1.0 + 0.9 * i + 0.4 * j) + (i == j ? 0.5 : 0.0);
    }
  }
  b.cov_sqrt = pnode::sqrtm::triangularize(m);
  return b;
}

int TestMatchesDenseFormulas() {
  pnode::StateSpaceModel ssm;
  if (!pnode::StateSpaceModel::from_order(3, 2, ssm)) {
    pnode::log::Error("model construction failed");
    return 1;
  }
  const GaussianBelief b = MakeBelief(ssm.layout());
  Vector sigma(2);
  sigma << 0.7, 1.9;
  const double dt = 0.42;

  GaussianBelief pred;
  if (!pnode::extrapolate(ssm, b, dt, sigma, pred)) {
    pnode::log::Error("extrapolate failed");
    return 1;
  }
  pnode::Transition tr;
  if (!ssm.transition(dt, sigma, tr)) {
    pnode::log::Error("transition failed");
    return 1;
  }
  const Vector m_ref = tr.a * b.mean;
  const Matrix cov_ref = tr.a * b.covariance() * tr.a.transpose() + tr.q_sqrt * tr.q_sqrt.transpose();

  if (RelDiff(pred.mean, m_ref) > 1e-13) {
    pnode::log::Error("extrapolated mean mismatch");
    return 1;
  }
  if (RelDiff(pred.covariance(), cov_ref) > 1e-12) {
    pnode::log::Error("extrapolated covariance mismatch");
    return 1;
  }
  if (!IsPsd(pred.covariance())) {
    pnode::log::Error("extrapolated covariance is not PSD");
    return 1;
  }
  for (Eigen::Index i = 0; i < pred.cov_sqrt.rows(); ++i) {
    for (Eigen::Index j = i + 1; j < pred.cov_sqrt.cols(); ++j) {
      if (pred.cov_sqrt(i, j) != 0.0) {
        pnode::log::Error("extrapolated factor is not lower triangular");
        return 1;
      }
    }
  }
  return 0;
}

int TestBackwardKernel() {
  pnode::StateSpaceModel ssm;
  if (!pnode::StateSpaceModel::from_order(2, 2, ssm)) {
    return 1;
  }
  const GaussianBelief b = MakeBelief(ssm.layout());
  const Vector sigma = Vector::Constant(2, 1.3);
  const double dt = 0.25;

  GaussianBelief pred;
  pnode::GaussianConditional kernel;
  if (!pnode::extrapolate_with_backward_kernel(ssm, b, dt, sigma, pred, kernel)) {
    pnode::log::Error("extrapolate_with_backward_kernel failed");
    return 1;
  }

  GaussianBelief pred_plain;
  if (!pnode::extrapolate(ssm, b, dt, sigma, pred_plain)) {
    return 1;
  }
  if (RelDiff(pred.mean, pred_plain.mean) > 1e-13 || RelDiff(pred.covariance(), pred_plain.covariance()) > 1e-12) {
    pnode::log::Error("kernel prediction differs from plain prediction");
    return 1;
  }

  // Pushing the forward marginal back through the reverted kernel recovers the start.
  const GaussianBelief back = pnode::marginalize(kernel, pred);
  if (RelDiff(back.mean, b.mean) > 1e-10) {
    pnode::log::Error("backward kernel does not recover the mean");
    return 1;
  }
  if (RelDiff(back.covariance(), b.covariance()) > 1e-10) {
    pnode::log::Error("backward kernel does not recover the covariance");
    return 1;
  }
  if (!IsPsd(kernel.noise_sqrt * kernel.noise_sqrt.transpose())) {
    pnode::log::Error("backward noise is not PSD");
    return 1;
  }
  return 0;
}

int TestInvalidStep() {
  pnode::StateSpaceModel ssm;
  if (!pnode::StateSpaceModel::from_order(2, 1, ssm)) {
    return 1;
  }
  const GaussianBelief b = MakeBelief(ssm.layout());
  GaussianBelief out;
  if (pnode::extrapolate(ssm, b, 0.0, Vector::Ones(1), out)) {
    pnode::log::Error("zero step must fail");
    return 1;
  }
  return 0;
}

}  // namespace

int main() {
  if (TestMatchesDenseFormulas() != 0) {
    return 1;
  }
  if (TestBackwardKernel() != 0) {
    return 1;
  }
  if (TestInvalidStep() != 0) {
    return 1;
  }
  return 0;
}
