/**
 * @file integrator.hpp
 * @brief Trajectory integration entry points for v' = Mv.
 */
#pragma once

#include <vector>

#include "phaseflow/algebra.hpp"
#include "phaseflow/drivers.hpp"
#include "phaseflow/field.hpp"
#include "phaseflow/types.hpp"

namespace phaseflow {

/** @brief Integrate from `initial` with RK4 and report status and stats alongside the samples. */
[[nodiscard]] inline TrajectoryResult integrate(const Matrix2x2& matrix,
                                                const Point& initial,
                                                const IntegratorOptions& opt,
                                                const Observer<Point>& obs = {}) {
  const double h = opt.forward ? opt.step_size : -opt.step_size;
  return integrate_steps<TableauRK4, Point, LinearField, PlanarAlgebra>(
      LinearField{matrix}, initial, opt.steps, h, opt.divergence_limit, obs);
}

/**
 * @brief Sample the solution through `initial` for up to `steps` RK4 steps.
 *
 * The first element is always `initial`; the run ends early, without the
 * offending point, once a coordinate exceeds 20 in magnitude.
 */
[[nodiscard]] inline std::vector<Point> integrate(const Matrix2x2& matrix,
                                                  const Point& initial,
                                                  int steps = 200,
                                                  double step_size = 0.05,
                                                  bool forward = true) {
  IntegratorOptions opt;
  opt.steps = steps;
  opt.step_size = step_size;
  opt.forward = forward;
  return integrate(matrix, initial, opt).points;
}

}  // namespace phaseflow
