#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

#include <Eigen/Core>

#include "pnode/logging.hpp"
#include "pnode/markov.hpp"
#include "pnode/solver.hpp"

namespace {

using pnode::GaussianBelief;
using pnode::Matrix;
using pnode::MarkovSequence;
using pnode::Vector;

struct Logistic {
  template <class Scalar>
  void operator()(const Scalar&, const Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& u,
                  Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& du) const {
    du.resize(1);
    du(0) = 3.0 * u(0) * (1.0 - u(0));
  }
};

pnode::Solution SmoothedSolve(pnode::CalibrationMode mode) {
  pnode::SolverOptions opt;
  opt.order = 2;
  opt.smooth = true;
  opt.calibration = mode;
  opt.rtol = 1e-3;
  opt.atol = 1e-5;
  return pnode::solve(Logistic{}, Vector::Constant(1, 0.1), 0.0, 2.0, opt);
}

bool CloseCovariance(const GaussianBelief& a, const GaussianBelief& b, double rel) {
  const Matrix ca = a.covariance();
  const Matrix cb = b.covariance();
  return (ca - cb).norm() <= rel * std::max(1e-300, cb.norm());
}

int TestPriorMarginals() {
  pnode::StateSpaceModel ssm;
  if (!pnode::StateSpaceModel::from_order(2, 2, ssm)) {
    return 1;
  }
  const auto& layout = ssm.layout();
  Vector u0(2);
  u0 << 1.0, -2.0;
  Vector du0(2);
  du0 << 0.5, 3.0;
  GaussianBelief init;
  if (!pnode::initial_belief(layout, {u0, du0}, init)) {
    return 1;
  }
  Vector sigma(2);
  sigma << 1.0, 2.0;

  MarkovSequence prior;
  if (!pnode::discretize_prior(ssm, {0.0, 0.3, 1.0}, sigma, init, prior) || prior.size() != 3 || prior.reverse) {
    pnode::log::Error("prior discretization failed");
    return 1;
  }
  std::vector<GaussianBelief> margs;
  if (!pnode::markov_marginals(prior, margs) || margs.size() != 3) {
    pnode::log::Error("prior marginals failed");
    return 1;
  }
  if ((margs[0].mean - init.mean).norm() != 0.0) {
    pnode::log::Error("first prior marginal must be the initial belief");
    return 1;
  }

  // Two steps from a point mass agree with one transition over the whole span.
  pnode::Transition whole;
  if (!ssm.transition(1.0, sigma, whole)) {
    return 1;
  }
  const Vector mean = whole.a * init.mean;
  const Matrix cov = whole.q_sqrt * whole.q_sqrt.transpose();
  if ((margs[2].mean - mean).norm() > 1e-12 * mean.norm() ||
      (margs[2].covariance() - cov).norm() > 1e-10 * cov.norm()) {
    pnode::log::Error("prior marginal does not match the closed-form transition");
    return 1;
  }
  // The polynomial mean keeps u'' = 0.
  if (pnode::derivative_mean(layout, margs[2], 2).norm() != 0.0) {
    pnode::log::Error("prior mean must keep the zero highest derivative");
    return 1;
  }

  MarkovSequence bad;
  if (pnode::discretize_prior(ssm, {0.0, 0.0}, sigma, init, bad) ||
      pnode::discretize_prior(ssm, {0.0}, sigma, init, bad) ||
      pnode::discretize_prior(ssm, {0.0, 1.0}, Vector::Ones(3), init, bad)) {
    pnode::log::Error("invalid prior grids must be rejected");
    return 1;
  }
  return 0;
}

int TestPosteriorMarginals() {
  const auto sol = SmoothedSolve(pnode::CalibrationMode::Dynamic);
  pnode::StateSpaceModel ssm;
  if (!sol.ok() || !pnode::StateSpaceModel::from_order(sol.layout.order, sol.layout.dim, ssm)) {
    pnode::log::Error("smoothed logistic solve failed: ", pnode::ToString(sol.status));
    return 1;
  }
  MarkovSequence post;
  std::vector<GaussianBelief> margs;
  if (!pnode::posterior_sequence(ssm, sol, post) || !post.reverse || !pnode::markov_marginals(post, margs) ||
      margs.size() != sol.smoothed.size()) {
    pnode::log::Error("posterior marginals failed");
    return 1;
  }
  for (std::size_t k = 0; k < margs.size(); ++k) {
    if ((margs[k].mean - sol.smoothed[k].mean).norm() != 0.0 ||
        (margs[k].cov_sqrt - sol.smoothed[k].cov_sqrt).norm() != 0.0) {
      pnode::log::Error("posterior marginal differs from the smoother at record ", k);
      return 1;
    }
  }

  const auto global = SmoothedSolve(pnode::CalibrationMode::Global);
  if (!global.ok() || !pnode::posterior_sequence(ssm, global, post) || !pnode::markov_marginals(post, margs) ||
      margs.size() != global.posterior.size()) {
    pnode::log::Error("globally calibrated posterior marginals failed");
    return 1;
  }
  for (std::size_t k = 0; k < margs.size(); ++k) {
    const GaussianBelief& point = global.posterior[k].belief;
    if ((margs[k].mean - point.mean).norm() > 1e-12 * std::max(1.0, point.mean.norm()) ||
        !CloseCovariance(margs[k], point, 1e-10)) {
      pnode::log::Error("calibrated posterior marginal differs from the posterior at record ", k);
      return 1;
    }
  }
  return 0;
}

int TestSampleShapes() {
  const auto sol = SmoothedSolve(pnode::CalibrationMode::Dynamic);
  pnode::StateSpaceModel ssm;
  MarkovSequence post;
  if (!sol.ok() || !pnode::StateSpaceModel::from_order(sol.layout.order, sol.layout.dim, ssm) ||
      !pnode::posterior_sequence(ssm, sol, post)) {
    return 1;
  }
  std::mt19937 rng(15);
  const auto rows = static_cast<Eigen::Index>(sol.records.size());
  const Eigen::Index cols = sol.layout.state_size();

  Matrix one;
  if (!pnode::markov_sample(post, rng, one) || one.rows() != rows || one.cols() != cols) {
    pnode::log::Error("single sample has the wrong shape");
    return 1;
  }
  std::vector<Matrix> many;
  if (!pnode::markov_sample(post, 3, rng, many) || many.size() != 3) {
    pnode::log::Error("expected three samples");
    return 1;
  }
  for (const auto& sample : many) {
    if (sample.rows() != rows || sample.cols() != cols) {
      pnode::log::Error("sample has the wrong shape");
      return 1;
    }
  }
  if ((many[0] - many[1]).norm() == 0.0) {
    pnode::log::Error("independent samples must differ");
    return 1;
  }

  // The initial value carries no uncertainty, so every sample starts at u0.
  if (std::abs(one(0, 0) - 0.1) > 1e-8) {
    pnode::log::Error("sample must start at the initial value, got ", one(0, 0));
    return 1;
  }
  return 0;
}

int TestSampleMoments() {
  const auto sol = SmoothedSolve(pnode::CalibrationMode::Dynamic);
  pnode::StateSpaceModel ssm;
  MarkovSequence post;
  if (!sol.ok() || !pnode::StateSpaceModel::from_order(sol.layout.order, sol.layout.dim, ssm) ||
      !pnode::posterior_sequence(ssm, sol, post)) {
    return 1;
  }
  constexpr int kSamples = 4000;
  std::mt19937 rng(7);
  std::vector<Matrix> samples;
  if (!pnode::markov_sample(post, kSamples, rng, samples)) {
    pnode::log::Error("sampling failed");
    return 1;
  }

  const std::size_t count = sol.records.size();
  std::size_t widest = 0;
  double widest_var = -1.0;
  for (std::size_t k = 0; k < count; ++k) {
    const double m = sol.smoothed[k].mean(0);
    const double var = sol.smoothed[k].covariance()(0, 0);
    double sum = 0.0;
    for (const auto& s : samples) {
      sum += s(static_cast<Eigen::Index>(k), 0);
    }
    const double mean_hat = sum / kSamples;
    if (std::abs(mean_hat - m) > 5.0 * std::sqrt(var / kSamples) + 1e-12 * (1.0 + std::abs(m))) {
      pnode::log::Error("sample mean ", mean_hat, " differs from the smoothed mean ", m, " at record ", k);
      return 1;
    }
    if (var > widest_var) {
      widest_var = var;
      widest = k;
    }
  }
  if (!(widest_var > 0.0)) {
    pnode::log::Error("expected a record with positive smoothed variance");
    return 1;
  }

  const double m = sol.smoothed[widest].mean(0);
  double sq = 0.0;
  for (const auto& s : samples) {
    const double dev = s(static_cast<Eigen::Index>(widest), 0) - m;
    sq += dev * dev;
  }
  const double var_hat = sq / kSamples;
  if (std::abs(var_hat - widest_var) > 0.15 * widest_var) {
    pnode::log::Error("sample variance ", var_hat, " differs from the smoothed variance ", widest_var);
    return 1;
  }
  return 0;
}

}  // namespace

int main() {
  if (TestPriorMarginals() != 0) {
    return 1;
  }
  if (TestPosteriorMarginals() != 0) {
    return 1;
  }
  if (TestSampleShapes() != 0) {
    return 1;
  }
  if (TestSampleMoments() != 0) {
    return 1;
  }
  return 0;
}
