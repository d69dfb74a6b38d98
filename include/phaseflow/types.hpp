/**
 * @file types.hpp
 * @brief Plane value types, integrator options, status, stats, and result containers.
 */
#pragma once

#include <functional>
#include <vector>

namespace phaseflow {

/** @brief Real 2x2 matrix [a b; c d] defining the linear field v' = Mv. */
struct Matrix2x2 {
  double a = 0.0;
  double b = 0.0;
  double c = 0.0;
  double d = 0.0;
};

/** @brief Point in the plane; also used as a velocity or direction. */
struct Point {
  double x = 0.0;
  double y = 0.0;
};

using Vector = Point;

struct ComplexNumber {
  double re = 0.0;
  double im = 0.0;
};

/** @brief 2-vector over the complex field. */
struct ComplexVector {
  ComplexNumber x{};
  ComplexNumber y{};
};

[[nodiscard]] inline bool operator==(const Matrix2x2& l, const Matrix2x2& r) {
  return l.a == r.a && l.b == r.b && l.c == r.c && l.d == r.d;
}

[[nodiscard]] inline bool operator==(const Point& l, const Point& r) {
  return l.x == r.x && l.y == r.y;
}

/** @brief Fixed-step trajectory integration options. */
struct IntegratorOptions {
  int steps = 200;
  double step_size = 0.05;
  bool forward = true;

  // Integration stops before appending a point with |x| or |y| above this.
  double divergence_limit = 20.0;
};

/** @brief Terminal status returned by an integration run. */
enum class IntegratorStatus {
  Success,
  Diverged,
  NaNDetected,
  UserStopped
};

/** @brief Convert IntegratorStatus to stable string token. */
[[nodiscard]] inline const char* ToString(IntegratorStatus status) {
  switch (status) {
    case IntegratorStatus::Success:
      return "success";
    case IntegratorStatus::Diverged:
      return "diverged";
    case IntegratorStatus::NaNDetected:
      return "nan_detected";
    case IntegratorStatus::UserStopped:
      return "user_stopped";
  }
  return "unknown";
}

/** @brief Runtime counters and last-step telemetry. */
struct IntegratorStats {
  int attempted_steps = 0;
  int accepted_steps = 0;
  long long rhs_evals = 0;
  double last_h = 0.0;
};

/** @brief Sampled trajectory: every accepted state, starting with the initial one. */
template <class State>
struct IntegratorResult {
  IntegratorStatus status = IntegratorStatus::Success;
  std::vector<State> points{};
  IntegratorStats stats{};
};

using TrajectoryResult = IntegratorResult<Point>;

/** @brief Optional callback invoked after each accepted step; return false to stop. */
template <class State>
using Observer = std::function<bool(double, const State&)>;

}  // namespace phaseflow
