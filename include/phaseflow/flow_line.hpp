/**
 * @file flow_line.hpp
 * @brief Bidirectional flow lines through a point and trajectory records.
 */
#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "phaseflow/integrator.hpp"
#include "phaseflow/types.hpp"

namespace phaseflow {

/** @brief HSL display color; hue in degrees, saturation and lightness in percent. */
struct Color {
  double hue = 0.0;
  double saturation = 65.0;
  double lightness = 45.0;
};

/** @brief Time-ordered flow line through `initial`, built for one matrix. */
struct Trajectory {
  std::uint64_t id = 0;
  std::vector<Point> points{};
  Point initial{};
  Color color{};
};

/**
 * @brief Time-ordered path through `initial`: reversed backward run followed by the forward run.
 *
 * `opt.forward` is ignored. The shared initial point appears once, so the
 * path holds at most 2 * steps + 1 points.
 */
[[nodiscard]] inline std::vector<Point> trace_flow_line(const Matrix2x2& matrix,
                                                        const Point& initial,
                                                        IntegratorOptions opt) {
  opt.forward = true;
  const auto fwd = integrate(matrix, initial, opt);
  opt.forward = false;
  const auto bwd = integrate(matrix, initial, opt);

  std::vector<Point> path;
  path.reserve(bwd.points.size() + fwd.points.size() - 1);
  path.insert(path.end(), bwd.points.rbegin(), std::prev(bwd.points.rend()));
  path.insert(path.end(), fwd.points.begin(), fwd.points.end());
  return path;
}

[[nodiscard]] inline Trajectory make_trajectory(std::uint64_t id,
                                                const Matrix2x2& matrix,
                                                const Point& initial,
                                                const IntegratorOptions& opt,
                                                const Color& color = {}) {
  Trajectory out{};
  out.id = id;
  out.points = trace_flow_line(matrix, initial, opt);
  out.initial = initial;
  out.color = color;
  return out;
}

/** @brief Direction marker placed on a path. */
struct ArrowAnchor {
  Point at{};
  double angle = 0.0;  // radians, plane coordinates
};

/**
 * @brief Markers at 25%, 50% and 75% of the path, each pointing 5 samples ahead.
 *
 * Paths shorter than 10 points get no markers.
 */
[[nodiscard]] inline std::vector<ArrowAnchor> arrow_anchors(const std::vector<Point>& points) {
  constexpr std::size_t kMinPoints = 10;
  constexpr std::size_t kLookahead = 5;
  constexpr std::array<double, 3> kFractions = {0.25, 0.5, 0.75};

  std::vector<ArrowAnchor> out;
  const std::size_t n = points.size();
  if (n < kMinPoints) {
    return out;
  }
  for (const double q : kFractions) {
    const auto idx = static_cast<std::size_t>(std::floor(static_cast<double>(n) * q));
    const Point& p1 = points[idx];
    const Point& p2 = points[std::min(idx + kLookahead, n - 1)];
    out.push_back({p1, std::atan2(p2.y - p1.y, p2.x - p1.x)});
  }
  return out;
}

}  // namespace phaseflow
