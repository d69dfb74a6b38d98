/**
 * @file portrait.hpp
 * @brief Phase portrait session: one matrix, its analysis, and a bounded set of flow lines.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "phaseflow/classifier.hpp"
#include "phaseflow/field.hpp"
#include "phaseflow/flow_line.hpp"
#include "phaseflow/presets.hpp"
#include "phaseflow/types.hpp"

namespace phaseflow {

class PhasePortrait {
 public:
  explicit PhasePortrait(const Matrix2x2& matrix = DefaultMatrix(), PortraitOptions opt = {})
      : matrix_(matrix), analysis_(classify(matrix)), opt_(opt) {}

  [[nodiscard]] const Matrix2x2& matrix() const { return matrix_; }
  [[nodiscard]] const EquilibriumAnalysis& analysis() const { return analysis_; }
  [[nodiscard]] const PortraitOptions& options() const { return opt_; }
  [[nodiscard]] const std::deque<Trajectory>& trajectories() const { return trajectories_; }

  /** @brief Switch to a new system. Existing trajectories belong to the old one and are dropped. */
  void set_matrix(const Matrix2x2& matrix) {
    matrix_ = matrix;
    analysis_ = classify(matrix);
    trajectories_.clear();
  }

  /**
   * @brief Trace the flow line through `initial`; evicts the oldest line beyond the cap.
   *
   * The new line is always kept, so a cap of 0 behaves like a cap of 1.
   */
  const Trajectory& add_trajectory(const Point& initial) {
    trajectories_.push_back(make_trajectory(next_id_, matrix_, initial, opt_.trace, color_for(next_id_)));
    next_id_ += 1;
    const std::size_t cap = std::max<std::size_t>(opt_.max_trajectories, 1);
    while (trajectories_.size() > cap) {
      trajectories_.pop_front();
    }
    return trajectories_.back();
  }

  void clear() { trajectories_.clear(); }

  [[nodiscard]] std::vector<DirectionSample> direction_field() const {
    return sample_direction_field(matrix_, opt_.range, opt_.field_divisions);
  }

  [[nodiscard]] std::vector<Segment> eigenlines() const {
    return eigenline_segments(analysis_, opt_.range);
  }

  /** @brief Golden-angle hue sequence; consecutive lines get well separated hues. */
  [[nodiscard]] static Color color_for(std::uint64_t id) {
    constexpr double kGoldenAngleDeg = 137.50776405003785;
    Color c{};
    c.hue = std::fmod(static_cast<double>(id) * kGoldenAngleDeg, 360.0);
    return c;
  }

 private:
  Matrix2x2 matrix_{};
  EquilibriumAnalysis analysis_{};
  PortraitOptions opt_{};
  std::deque<Trajectory> trajectories_{};
  std::uint64_t next_id_ = 0;
};

}  // namespace phaseflow
