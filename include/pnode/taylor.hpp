/**
 * @file taylor.hpp
 * @brief Taylor-mode initialization of the derivative stack with truncated power series.
 *
 * A Jet carries the normalized Taylor coefficients `c_k = x^(k)(t0) / k!` of a scalar
 * function of time. Evaluating a scalar-generic vector field on jets and integrating
 * the result (`c_{k+1} = f_k / (k+1)`) yields the exact derivatives of the ODE solution
 * at `t0`, one order per pass.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include "pnode/belief.hpp"
#include "pnode/jacobian.hpp"
#include "pnode/types.hpp"

namespace pnode::taylor {

/** @brief Truncated Taylor polynomial. A constant is a jet with a single coefficient. */
class Jet {
 public:
  Jet() : c_(1, 0.0) {}
  Jet(double value) : c_(1, value) {}  // NOLINT(google-explicit-constructor)
  explicit Jet(std::vector<double> coefficients) : c_(std::move(coefficients)) {
    if (c_.empty()) {
      c_.push_back(0.0);
    }
  }

  [[nodiscard]] std::size_t size() const { return c_.size(); }
  [[nodiscard]] double value() const { return c_[0]; }
  [[nodiscard]] const std::vector<double>& coefficients() const { return c_; }

  /** @brief Coefficient `k`; zero beyond the stored length. */
  [[nodiscard]] double operator[](std::size_t k) const {
    return k < c_.size() ? c_[k] : 0.0;
  }

  Jet& operator+=(const Jet& o) {
    grow(o.size());
    for (std::size_t k = 0; k < o.size(); ++k) {
      c_[k] += o.c_[k];
    }
    return *this;
  }
  Jet& operator-=(const Jet& o) {
    grow(o.size());
    for (std::size_t k = 0; k < o.size(); ++k) {
      c_[k] -= o.c_[k];
    }
    return *this;
  }
  Jet& operator*=(const Jet& o) {
    *this = *this * o;
    return *this;
  }
  Jet& operator/=(const Jet& o) {
    *this = *this / o;
    return *this;
  }

  friend Jet operator+(Jet a, const Jet& b) { return a += b; }
  friend Jet operator-(Jet a, const Jet& b) { return a -= b; }
  friend Jet operator-(Jet a) {
    for (double& c : a.c_) {
      c = -c;
    }
    return a;
  }
  friend Jet operator+(const Jet& a) { return a; }

  /** @brief Cauchy product truncated to the longer operand. */
  friend Jet operator*(const Jet& a, const Jet& b) {
    const std::size_t n = std::max(a.size(), b.size());
    std::vector<double> out(n, 0.0);
    for (std::size_t k = 0; k < n; ++k) {
      double acc = 0.0;
      for (std::size_t i = 0; i <= k; ++i) {
        acc += a[i] * b[k - i];
      }
      out[k] = acc;
    }
    return Jet(std::move(out));
  }

  friend Jet operator/(const Jet& a, const Jet& b) {
    const std::size_t n = std::max(a.size(), b.size());
    std::vector<double> q(n, 0.0);
    for (std::size_t k = 0; k < n; ++k) {
      double acc = a[k];
      for (std::size_t i = 1; i <= k; ++i) {
        acc -= b[i] * q[k - i];
      }
      q[k] = acc / b[0];
    }
    return Jet(std::move(q));
  }

  friend bool operator<(const Jet& a, const Jet& b) { return a.value() < b.value(); }
  friend bool operator>(const Jet& a, const Jet& b) { return a.value() > b.value(); }
  friend bool operator<=(const Jet& a, const Jet& b) { return a.value() <= b.value(); }
  friend bool operator>=(const Jet& a, const Jet& b) { return a.value() >= b.value(); }

  friend Jet exp(const Jet& a) {
    const std::size_t n = a.size();
    std::vector<double> e(n, 0.0);
    e[0] = std::exp(a[0]);
    for (std::size_t k = 1; k < n; ++k) {
      double acc = 0.0;
      for (std::size_t i = 1; i <= k; ++i) {
        acc += static_cast<double>(i) * a[i] * e[k - i];
      }
      e[k] = acc / static_cast<double>(k);
    }
    return Jet(std::move(e));
  }

  friend Jet log(const Jet& a) {
    const std::size_t n = a.size();
    std::vector<double> l(n, 0.0);
    l[0] = std::log(a[0]);
    for (std::size_t k = 1; k < n; ++k) {
      double acc = 0.0;
      for (std::size_t i = 1; i < k; ++i) {
        acc += static_cast<double>(i) * l[i] * a[k - i];
      }
      l[k] = (a[k] - acc / static_cast<double>(k)) / a[0];
    }
    return Jet(std::move(l));
  }

  friend Jet sin(const Jet& a) { return sincos(a).first; }
  friend Jet cos(const Jet& a) { return sincos(a).second; }

  friend Jet sqrt(const Jet& a) {
    const std::size_t n = a.size();
    std::vector<double> r(n, 0.0);
    r[0] = std::sqrt(a[0]);
    for (std::size_t k = 1; k < n; ++k) {
      double acc = a[k];
      for (std::size_t i = 1; i < k; ++i) {
        acc -= r[i] * r[k - i];
      }
      r[k] = acc / (2.0 * r[0]);
    }
    return Jet(std::move(r));
  }

  /** @brief `a^p` for a real exponent; requires `a.value() != 0` beyond order zero. */
  friend Jet pow(const Jet& a, double p) {
    const std::size_t n = a.size();
    std::vector<double> y(n, 0.0);
    y[0] = std::pow(a[0], p);
    for (std::size_t k = 1; k < n; ++k) {
      double acc = 0.0;
      for (std::size_t i = 1; i <= k; ++i) {
        acc += (p * static_cast<double>(i) - static_cast<double>(k - i)) * a[i] * y[k - i];
      }
      y[k] = acc / (static_cast<double>(k) * a[0]);
    }
    return Jet(std::move(y));
  }

 private:
  void grow(std::size_t n) {
    if (c_.size() < n) {
      c_.resize(n, 0.0);
    }
  }

  [[nodiscard]] static std::pair<Jet, Jet> sincos(const Jet& a) {
    const std::size_t n = a.size();
    std::vector<double> s(n, 0.0);
    std::vector<double> c(n, 0.0);
    s[0] = std::sin(a[0]);
    c[0] = std::cos(a[0]);
    for (std::size_t k = 1; k < n; ++k) {
      double acc_s = 0.0;
      double acc_c = 0.0;
      for (std::size_t i = 1; i <= k; ++i) {
        const double w = static_cast<double>(i) * a[i];
        acc_s += w * c[k - i];
        acc_c -= w * s[k - i];
      }
      s[k] = acc_s / static_cast<double>(k);
      c[k] = acc_c / static_cast<double>(k);
    }
    return {Jet(std::move(s)), Jet(std::move(c))};
  }

  std::vector<double> c_;
};

}  // namespace pnode::taylor

namespace Eigen {

template <>
struct NumTraits<pnode::taylor::Jet> : NumTraits<double> {
  using Real = pnode::taylor::Jet;
  using NonInteger = pnode::taylor::Jet;
  using Nested = pnode::taylor::Jet;
  using Literal = double;

  enum {
    IsComplex = 0,
    IsInteger = 0,
    IsSigned = 1,
    RequireInitialization = 1,
    ReadCost = 1,
    AddCost = 3,
    MulCost = 3
  };
};

template <typename BinaryOp>
struct ScalarBinaryOpTraits<pnode::taylor::Jet, double, BinaryOp> {
  using ReturnType = pnode::taylor::Jet;
};

template <typename BinaryOp>
struct ScalarBinaryOpTraits<double, pnode::taylor::Jet, BinaryOp> {
  using ReturnType = pnode::taylor::Jet;
};

}  // namespace Eigen

namespace pnode::taylor {

using JetVector = Eigen::Matrix<Jet, Eigen::Dynamic, 1>;

/** @brief Vector field that accepts jets in time and state. */
template <class F>
concept JetVectorField = requires(F& f, const Jet& t, const JetVector& u, JetVector& du) {
  f(t, u, du);
};

/**
 * @brief Derivatives `(u(t0), u'(t0), ..., u^(num-1)(t0))` of the ODE solution.
 *
 * Runs `num - 1` jet evaluations of `f`; pass `k` sees jets of length `k + 1`.
 * Fails on `num < 1`, an empty or non-finite `u0`, or a vector field that returns the
 * wrong size or non-finite coefficients.
 */
template <class F>
requires JetVectorField<F>
[[nodiscard]] inline bool taylor_coefficients(F& f,
                                              double t0,
                                              const Vector& u0,
                                              int num,
                                              std::vector<Vector>& out,
                                              long long* rhs_evals = nullptr) {
  const Eigen::Index d = u0.size();
  if (num < 1 || d == 0 || !u0.allFinite() || !std::isfinite(t0)) {
    return false;
  }

  std::vector<Vector> coeffs;
  coeffs.reserve(static_cast<std::size_t>(num));
  coeffs.push_back(u0);

  for (int k = 0; k + 1 < num; ++k) {
    const std::size_t len = static_cast<std::size_t>(k) + 1;

    JetVector u_jet(d);
    for (Eigen::Index a = 0; a < d; ++a) {
      std::vector<double> c(len, 0.0);
      for (std::size_t i = 0; i < len; ++i) {
        c[i] = coeffs[i](a);
      }
      u_jet(a) = Jet(std::move(c));
    }
    std::vector<double> tc(len, 0.0);
    tc[0] = t0;
    if (len > 1) {
      tc[1] = 1.0;
    }
    const Jet t_jet(std::move(tc));

    JetVector du(d);
    f(t_jet, u_jet, du);
    if (rhs_evals != nullptr) {
      *rhs_evals += 1;
    }
    if (du.size() != d) {
      return false;
    }

    Vector next(d);
    for (Eigen::Index a = 0; a < d; ++a) {
      next(a) = du(a)[static_cast<std::size_t>(k)] / static_cast<double>(k + 1);
    }
    if (!next.allFinite()) {
      return false;
    }
    coeffs.push_back(std::move(next));
  }

  out.clear();
  out.reserve(coeffs.size());
  double factorial = 1.0;
  for (std::size_t k = 0; k < coeffs.size(); ++k) {
    if (k > 0) {
      factorial *= static_cast<double>(k);
    }
    out.push_back(coeffs[k] * factorial);
  }
  return true;
}

/**
 * @brief Initial belief for the solver: Taylor-mode derivatives when `f` accepts jets,
 * `(u0, f(t0, u0), 0, ...)` otherwise. Covariance is zero either way.
 */
template <VectorField F>
[[nodiscard]] inline bool initial_stack(F& f,
                                        double t0,
                                        const Vector& u0,
                                        const StateLayout& layout,
                                        GaussianBelief& out,
                                        long long& rhs_evals) {
  std::vector<Vector> derivatives;
  if constexpr (JetVectorField<F>) {
    if (!taylor_coefficients(f, t0, u0, layout.num_derivatives(), derivatives, &rhs_evals)) {
      return false;
    }
  } else {
    Vector du;
    rhs_evals += 1;
    if (!evaluate(f, t0, u0, du)) {
      return false;
    }
    derivatives.push_back(u0);
    if (layout.num_derivatives() > 1) {
      derivatives.push_back(du);
    }
  }
  return initial_belief(layout, derivatives, out);
}

}  // namespace pnode::taylor
