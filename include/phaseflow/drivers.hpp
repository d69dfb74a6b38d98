/**
 * @file drivers.hpp
 * @brief Fixed-step, fixed-count integration driver with divergence cutoff.
 */
#pragma once

#include <algorithm>
#include <cstddef>

#include "phaseflow/rk_stepper.hpp"
#include "phaseflow/types.hpp"

namespace phaseflow {

namespace detail {

template <class State>
[[nodiscard]] inline bool call_observer(const Observer<State>& obs, double t, const State& y) {
  if (!obs) {
    return true;
  }
  return obs(t, y);
}

}  // namespace detail

template <class Tableau, class State, class RHS, class Algebra>
requires AlgebraFor<Algebra, State>
/**
 * @brief Take up to `steps` steps of signed size h from y0, recording every accepted state.
 *
 * The recorded sequence always starts with y0. A step whose result has a
 * component above `divergence_limit` in magnitude ends the run without being
 * recorded.
 */
[[nodiscard]] IntegratorResult<State> integrate_steps(RHS&& rhs,
                                                      const State& y0,
                                                      int steps,
                                                      double h,
                                                      double divergence_limit,
                                                      const Observer<State>& obs = {}) {
  // The cutoff, not `steps`, bounds how many samples a diverging run keeps.
  constexpr std::size_t kMaxReserve = 1024;
  IntegratorResult<State> out{};
  const std::size_t requested = steps > 0 ? static_cast<std::size_t>(steps) + 1 : 1;
  out.points.reserve(std::min(requested, kMaxReserve));
  out.points.push_back(y0);

  ExplicitRKStepper<Tableau, State, Algebra> stepper;
  State y = y0;
  State y_next = y0;
  double t = 0.0;

  for (int step = 0; step < steps; ++step) {
    out.stats.attempted_steps += 1;
    const bool ok = stepper.step(rhs, t, y, h, y_next);
    out.stats.rhs_evals += Tableau::stages;
    out.stats.last_h = h;

    if (!ok) {
      out.status = IntegratorStatus::NaNDetected;
      return out;
    }
    if (Algebra::max_abs(y_next) > divergence_limit) {
      out.status = IntegratorStatus::Diverged;
      return out;
    }

    t += h;
    Algebra::assign(y, y_next);
    out.points.push_back(y);
    out.stats.accepted_steps += 1;

    if (!detail::call_observer(obs, t, y)) {
      out.status = IntegratorStatus::UserStopped;
      return out;
    }
  }

  out.status = IntegratorStatus::Success;
  return out;
}

}  // namespace phaseflow
