#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <iostream>

#include "phaseflow/integrator.hpp"

namespace {

// x' = x, y' = -2y from (1, 1) to t = 1.
[[nodiscard]] double run_fixed(const int steps) {
  const phaseflow::Matrix2x2 m{1.0, 0.0, 0.0, -2.0};
  const double h = 1.0 / static_cast<double>(steps);
  const auto pts = phaseflow::integrate(m, phaseflow::Point{1.0, 1.0}, steps, h, true);
  if (pts.size() != static_cast<std::size_t>(steps + 1)) {
    std::cerr << "fixed integration stopped early\n";
    std::exit(1);
  }
  const double ex = std::abs(pts.back().x - std::exp(1.0));
  const double ey = std::abs(pts.back().y - std::exp(-2.0));
  return std::max(ex, ey);
}

[[nodiscard]] double estimate_order(const double e_h, const double e_h2) {
  return std::log2(e_h / e_h2);
}

void expect_range(const char* label, const double value, const double lo, const double hi) {
  if (!(value > lo && value < hi)) {
    std::cerr << label << " out of range: " << value << " expected in (" << lo << ", " << hi << ")\n";
    std::exit(1);
  }
}

}  // namespace

int main() {
  {
    const double e1 = run_fixed(5);
    const double e2 = run_fixed(10);
    expect_range("RK4 order (h=0.2/0.1)", estimate_order(e1, e2), 3.7, 4.3);
  }
  {
    const double e1 = run_fixed(10);
    const double e2 = run_fixed(20);
    expect_range("RK4 order (h=0.1/0.05)", estimate_order(e1, e2), 3.8, 4.2);
  }
  return 0;
}
