/**
 * @file presets.hpp
 * @brief Named example systems and default run configuration.
 */
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

#include "phaseflow/types.hpp"

namespace phaseflow {

struct Preset {
  std::string_view name;
  Matrix2x2 matrix;
};

/** @brief Matrix shown before any coefficient is edited. */
[[nodiscard]] inline constexpr Matrix2x2 DefaultMatrix() {
  return {1.0, -2.0, 3.0, -4.0};
}

[[nodiscard]] inline constexpr std::array<Preset, 4> Presets() {
  return {{
      {"Saddle", {1.0, 0.0, 0.0, -1.0}},
      {"Spiral Sink", {-1.0, -2.0, 2.0, -1.0}},
      {"Stable Node", {-2.0, 0.0, 0.0, -1.0}},
      {"Center", {0.0, -2.0, 2.0, 0.0}},
  }};
}

[[nodiscard]] inline std::optional<Matrix2x2> FindPreset(std::string_view name) {
  for (const auto& p : Presets()) {
    if (p.name == name) {
      return p.matrix;
    }
  }
  return std::nullopt;
}

/** @brief Options used to trace a flow line through a picked point. */
[[nodiscard]] inline IntegratorOptions TraceOptions() {
  IntegratorOptions opt;
  opt.steps = 300;
  opt.step_size = 0.03;
  return opt;
}

/** @brief Phase portrait view and trajectory-set configuration. */
struct PortraitOptions {
  double range = 5.0;
  int field_divisions = 15;
  // Minimum effective cap is 1: the most recently added line is always kept.
  std::size_t max_trajectories = 10;
  IntegratorOptions trace = TraceOptions();
};

}  // namespace phaseflow
