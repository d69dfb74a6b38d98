/**
 * @file rk_stepper.hpp
 * @brief Explicit Runge-Kutta single-step engine driven by a tableau.
 */
#pragma once

#include <array>
#include <cstddef>

#include "phaseflow/algebra.hpp"

namespace phaseflow {

/**
 * @brief Classical RK4 tableau.
 *
 * Weights are stored as integers over a common denominator so the update reads
 * y + h/6 * (k1 + 2 k2 + 2 k3 + k4).
 */
struct TableauRK4 {
  static constexpr int stages = 4;
  static constexpr int order = 4;

  static constexpr std::array<double, stages> c = {0.0, 0.5, 0.5, 1.0};

  static constexpr std::array<std::array<double, stages>, stages> a = {{
      {{0.0, 0.0, 0.0, 0.0}},
      {{0.5, 0.0, 0.0, 0.0}},
      {{0.0, 0.5, 0.0, 0.0}},
      {{0.0, 0.0, 1.0, 0.0}},
  }};

  static constexpr std::array<double, stages> b_weight = {1.0, 2.0, 2.0, 1.0};
  static constexpr double b_denominator = 6.0;
};

template <class Tableau, class State, class Algebra>
requires AlgebraFor<Algebra, State>
class ExplicitRKStepper {
 public:
  ExplicitRKStepper() {
    for (auto& stage : k_) {
      Algebra::set_zero(stage);
    }
    Algebra::set_zero(y_tmp_);
    Algebra::set_zero(k_sum_);
  }

  template <class RHS>
  /**
   * @brief Execute one RK step from (t, y) with signed step h.
   * @return false if a stage derivative or the result is non-finite.
   */
  [[nodiscard]] bool step(RHS&& rhs, double t, const State& y, double h, State& y_next) {
    for (int i = 0; i < Tableau::stages; ++i) {
      const auto si = static_cast<std::size_t>(i);
      Algebra::assign(y_tmp_, y);
      for (int j = 0; j < i; ++j) {
        const double aij = Tableau::a[si][static_cast<std::size_t>(j)];
        if (aij != 0.0) {
          Algebra::axpy(h * aij, k_[static_cast<std::size_t>(j)], y_tmp_);
        }
      }

      rhs(t + Tableau::c[si] * h, y_tmp_, k_[si]);

      if (!Algebra::finite(k_[si])) {
        return false;
      }
    }

    Algebra::set_zero(k_sum_);
    for (int i = 0; i < Tableau::stages; ++i) {
      const auto si = static_cast<std::size_t>(i);
      Algebra::axpy(Tableau::b_weight[si], k_[si], k_sum_);
    }

    Algebra::assign(y_next, y);
    Algebra::axpy(h / Tableau::b_denominator, k_sum_, y_next);
    return Algebra::finite(y_next);
  }

 private:
  std::array<State, Tableau::stages> k_{};
  State y_tmp_{};
  State k_sum_{};
};

}  // namespace phaseflow
