/**
 * @file algebra.hpp
 * @brief State algebra adapter and concept for the RK engine.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>

#include "phaseflow/types.hpp"

namespace phaseflow {

/** @brief Algebra for the two-component plane state. */
struct PlanarAlgebra {
  using State = Point;

  static void assign(State& dst, const State& src) { dst = src; }

  static void set_zero(State& x) {
    x.x = 0.0;
    x.y = 0.0;
  }

  static void axpy(double a, const State& x, State& y) {
    y.x += a * x.x;
    y.y += a * x.y;
  }

  static bool finite(const State& x) {
    return std::isfinite(x.x) && std::isfinite(x.y);
  }

  static double max_abs(const State& x) {
    return std::max(std::abs(x.x), std::abs(x.y));
  }
};

/** @brief Concept describing the algebra operations required by the RK engine. */
template <class Algebra, class State>
concept AlgebraFor = requires(State a, const State b, double s) {
  { Algebra::assign(a, b) };
  { Algebra::set_zero(a) };
  { Algebra::axpy(s, b, a) };
  { Algebra::finite(b) } -> std::convertible_to<bool>;
  { Algebra::max_abs(b) } -> std::convertible_to<double>;
};

}  // namespace phaseflow
