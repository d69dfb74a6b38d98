/**
 * @file eigen_api.hpp
 * @brief Eigen-first wrappers: Matrix2d/Vector2d integration, classification, and exact flow.
 */
#pragma once

#include <cmath>

#if __has_include(<Eigen/Core>)
#include <Eigen/Core>
#include <unsupported/Eigen/MatrixFunctions>
#else
#error "Eigen headers not found. Install Eigen 3 and make it visible to find_package(Eigen3)."
#endif

#include "phaseflow/algebra.hpp"
#include "phaseflow/classifier.hpp"
#include "phaseflow/drivers.hpp"
#include "phaseflow/rk_stepper.hpp"
#include "phaseflow/types.hpp"

namespace phaseflow {

/** @brief Algebra adapter for fixed-size Eigen column vectors. */
template <class T>
struct EigenVectorAlgebra;

template <class Scalar, int Rows, int Options, int MaxRows, int MaxCols>
struct EigenVectorAlgebra<Eigen::Matrix<Scalar, Rows, 1, Options, MaxRows, MaxCols>> {
  using State = Eigen::Matrix<Scalar, Rows, 1, Options, MaxRows, MaxCols>;
  static_assert(Rows != Eigen::Dynamic, "EigenVectorAlgebra needs a fixed-size state");

  static void assign(State& dst, const State& src) { dst = src; }
  static void set_zero(State& x) { x.setZero(); }

  static void axpy(double a, const State& x, State& y) {
    y += static_cast<Scalar>(a) * x;
  }

  static bool finite(const State& x) {
    for (int i = 0; i < x.size(); ++i) {
      if (!std::isfinite(static_cast<double>(x(i)))) {
        return false;
      }
    }
    return true;
  }

  static double max_abs(const State& x) {
    return static_cast<double>(x.cwiseAbs().maxCoeff());
  }
};

namespace eigen {

using Vector = Eigen::Vector2d;
using Matrix = Eigen::Matrix2d;

[[nodiscard]] inline Matrix2x2 from_eigen(const Matrix& m) {
  return {m(0, 0), m(0, 1), m(1, 0), m(1, 1)};
}

[[nodiscard]] inline Matrix to_eigen(const Matrix2x2& m) {
  Matrix out;
  out << m.a, m.b, m.c, m.d;
  return out;
}

[[nodiscard]] inline Vector to_eigen(const Point& p) {
  return Vector(p.x, p.y);
}

[[nodiscard]] inline Point to_point(const Vector& v) {
  return {v(0), v(1)};
}

/** @brief RK4 integration of x' = Mx on Eigen states, same cutoff semantics as the plane API. */
[[nodiscard]] inline IntegratorResult<Vector> integrate(const Matrix& m,
                                                        const Vector& y0,
                                                        const IntegratorOptions& opt,
                                                        const Observer<Vector>& obs = {}) {
  auto rhs = [&m](double, const Vector& y, Vector& dydt) {
    dydt.noalias() = m * y;
  };
  const double h = opt.forward ? opt.step_size : -opt.step_size;
  return integrate_steps<TableauRK4, Vector, decltype(rhs)&, EigenVectorAlgebra<Vector>>(
      rhs, y0, opt.steps, h, opt.divergence_limit, obs);
}

[[nodiscard]] inline EquilibriumAnalysis classify(const Matrix& m) {
  return phaseflow::classify(from_eigen(m));
}

/** @brief Exact solution exp(Mt) y0, for accuracy checks against the RK samples. */
[[nodiscard]] inline Vector exact_flow(const Matrix& m, const Vector& y0, double t) {
  const Matrix phi = (m * t).exp();
  return phi * y0;
}

}  // namespace eigen
}  // namespace phaseflow
