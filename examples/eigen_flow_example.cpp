#include <Eigen/Core>

#include "phaseflow/eigen_api.hpp"
#include "phaseflow/format.hpp"
#include "phaseflow/logging.hpp"

int main() {
  using Vec = phaseflow::eigen::Vector;
  using Mat = phaseflow::eigen::Matrix;

  Mat m;
  m << -0.5, -3.0, 1.5, -0.5;
  const Vec y0(2.0, 0.0);

  const auto analysis = phaseflow::eigen::classify(m);
  phaseflow::log::Info(phaseflow::FormatAnalysis(analysis));

  phaseflow::IntegratorOptions opt;
  opt.steps = 100;
  opt.step_size = 0.02;
  const auto res = phaseflow::eigen::integrate(m, y0, opt);
  if (res.status != phaseflow::IntegratorStatus::Success) {
    phaseflow::log::Error("integration failed, status=", phaseflow::ToString(res.status));
    return 1;
  }

  const double t = opt.steps * opt.step_size;
  const Vec exact = phaseflow::eigen::exact_flow(m, y0, t);
  phaseflow::log::Info("RK4 at t=", t, ": [", res.points.back()(0), ", ", res.points.back()(1), "]");
  phaseflow::log::Info("exp(Mt) y0:   [", exact(0), ", ", exact(1), "]");
  phaseflow::log::Info("error = ", (res.points.back() - exact).norm());
  return 0;
}
