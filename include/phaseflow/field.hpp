/**
 * @file field.hpp
 * @brief Linear vector field f(p) = Mp and sampled direction field.
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

#include "phaseflow/types.hpp"

namespace phaseflow {

[[nodiscard]] inline Point apply(const Matrix2x2& m, const Point& p) {
  return {m.a * p.x + m.b * p.y, m.c * p.x + m.d * p.y};
}

/** @brief Autonomous RHS functor for the RK engine. */
struct LinearField {
  Matrix2x2 m{};

  void operator()(double, const Point& p, Point& dpdt) const {
    dpdt = apply(m, p);
  }
};

/** @brief One arrow of the direction field. */
struct DirectionSample {
  double x = 0.0;
  double y = 0.0;
  double dx = 0.0;  // unit direction, zero where the field vanishes
  double dy = 0.0;
  double angle = 0.0;
  double length = 0.0;
};

/**
 * @brief Sample f on the square grid [-range, range]^2 with `divisions` cells per axis.
 *
 * Produces (divisions + 1)^2 samples, x outer and y inner.
 */
[[nodiscard]] inline std::vector<DirectionSample> sample_direction_field(const Matrix2x2& m,
                                                                        double range = 5.0,
                                                                        int divisions = 15) {
  std::vector<DirectionSample> out;
  if (divisions <= 0) {
    return out;
  }
  const double spacing = (2.0 * range) / static_cast<double>(divisions);
  out.reserve(static_cast<std::size_t>((divisions + 1) * (divisions + 1)));

  for (int i = 0; i <= divisions; ++i) {
    for (int j = 0; j <= divisions; ++j) {
      DirectionSample s{};
      s.x = -range + i * spacing;
      s.y = -range + j * spacing;
      const Point f = apply(m, {s.x, s.y});
      const double mag = std::sqrt(f.x * f.x + f.y * f.y);
      s.dx = (mag == 0.0) ? 0.0 : f.x / mag;
      s.dy = (mag == 0.0) ? 0.0 : f.y / mag;
      s.angle = std::atan2(f.y, f.x);
      s.length = mag;
      out.push_back(s);
    }
  }
  return out;
}

}  // namespace phaseflow
