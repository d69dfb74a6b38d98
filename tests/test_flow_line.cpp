#include <cmath>
#include <vector>

#include "phaseflow/field.hpp"
#include "phaseflow/flow_line.hpp"
#include "phaseflow/logging.hpp"
#include "phaseflow/presets.hpp"

namespace {

using phaseflow::IntegratorOptions;
using phaseflow::Matrix2x2;
using phaseflow::Point;

int TestComposition() {
  const Matrix2x2 m{0.0, -2.0, 2.0, 0.0};
  const Point p0{1.0, 0.5};
  IntegratorOptions opt;
  opt.steps = 100;
  opt.step_size = 0.05;

  const auto path = phaseflow::trace_flow_line(m, p0, opt);
  const auto fwd = phaseflow::integrate(m, p0, opt.steps, opt.step_size, true);
  const auto bwd = phaseflow::integrate(m, p0, opt.steps, opt.step_size, false);

  if (path.size() != 2 * static_cast<std::size_t>(opt.steps) + 1) {
    phaseflow::log::Error("uncut flow line should hold 2*steps+1 samples, got ", path.size());
    return 1;
  }
  const std::size_t mid = static_cast<std::size_t>(opt.steps);
  if (!(path[mid] == p0)) {
    phaseflow::log::Error("initial point must sit between the two runs");
    return 1;
  }
  for (std::size_t i = 0; i < mid; ++i) {
    if (!(path[i] == bwd[mid - i])) {
      phaseflow::log::Error("backward half is not the reversed backward run at ", i);
      return 1;
    }
  }
  for (std::size_t i = 0; i < fwd.size(); ++i) {
    if (!(path[mid + i] == fwd[i])) {
      phaseflow::log::Error("forward half mismatch at ", i);
      return 1;
    }
  }
  return 0;
}

int TestForwardFlagIgnored() {
  const Matrix2x2 m{-1.0, -2.0, 2.0, -1.0};
  IntegratorOptions a;
  a.forward = true;
  IntegratorOptions b = a;
  b.forward = false;
  const auto pa = phaseflow::trace_flow_line(m, Point{1.0, 1.0}, a);
  const auto pb = phaseflow::trace_flow_line(m, Point{1.0, 1.0}, b);
  if (pa.size() != pb.size()) {
    phaseflow::log::Error("flow line must not depend on the forward flag");
    return 1;
  }
  for (std::size_t i = 0; i < pa.size(); ++i) {
    if (!(pa[i] == pb[i])) {
      phaseflow::log::Error("flow line must not depend on the forward flag");
      return 1;
    }
  }
  return 0;
}

int TestCutoffShortensPath() {
  // Saddle: backward run escapes along y, forward run escapes along x.
  const Matrix2x2 m{1.0, 0.0, 0.0, -1.0};
  const Point p0{1.0, 1.0};
  const auto opt = phaseflow::TraceOptions();
  const auto path = phaseflow::trace_flow_line(m, p0, opt);
  const auto fwd = phaseflow::integrate(m, p0, opt.steps, opt.step_size, true);
  const auto bwd = phaseflow::integrate(m, p0, opt.steps, opt.step_size, false);

  if (path.size() != fwd.size() + bwd.size() - 1) {
    phaseflow::log::Error("flow line length must be fwd + bwd - 1");
    return 1;
  }
  if (!(path.size() < 2 * static_cast<std::size_t>(opt.steps) + 1)) {
    phaseflow::log::Error("saddle flow line should be cut off in both directions");
    return 1;
  }
  if (!(path.front().y > 10.0) || !(path.back().x > 10.0)) {
    phaseflow::log::Error("saddle flow line should run from the stable to the unstable axis");
    return 1;
  }
  return 0;
}

int TestTrajectoryRecord() {
  const Matrix2x2 m{-2.0, 0.0, 0.0, -1.0};
  const Point p0{2.0, -1.0};
  phaseflow::Color color{200.0, 65.0, 45.0};
  const auto traj = phaseflow::make_trajectory(7, m, p0, phaseflow::TraceOptions(), color);
  if (traj.id != 7 || !(traj.initial == p0) || traj.color.hue != 200.0) {
    phaseflow::log::Error("trajectory record fields mismatch");
    return 1;
  }
  const auto expected = phaseflow::trace_flow_line(m, p0, phaseflow::TraceOptions());
  if (traj.points.size() != expected.size()) {
    phaseflow::log::Error("trajectory points must be the traced flow line");
    return 1;
  }
  return 0;
}

int TestArrowAnchors() {
  std::vector<Point> short_path(9, Point{1.0, 1.0});
  if (!phaseflow::arrow_anchors(short_path).empty()) {
    phaseflow::log::Error("paths under 10 samples get no arrows");
    return 1;
  }

  std::vector<Point> line;
  for (int i = 0; i < 20; ++i) {
    line.push_back({static_cast<double>(i), 0.0});
  }
  const auto anchors = phaseflow::arrow_anchors(line);
  if (anchors.size() != 3 || anchors[0].at.x != 5.0 || anchors[1].at.x != 10.0 || anchors[2].at.x != 15.0) {
    phaseflow::log::Error("arrow anchors must sit at 25/50/75 percent");
    return 1;
  }
  for (const auto& a : anchors) {
    if (std::abs(a.angle) > 1e-15) {
      phaseflow::log::Error("arrow along +x must have angle 0, got ", a.angle);
      return 1;
    }
  }

  // Arrows on a traced center orbit follow the field direction.
  const Matrix2x2 m{0.0, -2.0, 2.0, 0.0};
  const auto orbit = phaseflow::trace_flow_line(m, Point{2.0, 0.0}, phaseflow::TraceOptions());
  for (const auto& a : phaseflow::arrow_anchors(orbit)) {
    const Point f = phaseflow::apply(m, a.at);
    const double dot = f.x * std::cos(a.angle) + f.y * std::sin(a.angle);
    if (!(dot > 0.0)) {
      phaseflow::log::Error("arrow points against the flow");
      return 1;
    }
  }
  return 0;
}

}  // namespace

int main() {
  int failures = 0;
  failures += TestComposition();
  failures += TestForwardFlagIgnored();
  failures += TestCutoffShortensPath();
  failures += TestTrajectoryRecord();
  failures += TestArrowAnchors();
  return failures == 0 ? 0 : 1;
}
