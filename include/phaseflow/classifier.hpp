/**
 * @file classifier.hpp
 * @brief Eigen-analysis and qualitative classification of the equilibrium at the origin.
 */
#pragma once

#include <array>
#include <cmath>
#include <optional>
#include <vector>

#include "phaseflow/types.hpp"

namespace phaseflow {

/** @brief Row-degeneracy and center tolerance. Sign branches on det/disc are exact. */
inline constexpr double kClassifyEps = 1e-9;

/** @brief Qualitative type of the origin. */
enum class EquilibriumClass {
  SaddlePoint,
  Node,
  Center,
  SpiralPoint,
  ProperImproperNode,
  Degenerate
};

enum class Stability {
  Unstable,
  UnstableSource,
  StableSink,
  NeutrallyStable,
  UnstableSpiralSource,
  StableSpiralSink,
  Stable,
  MarginallyStable
};

[[nodiscard]] inline const char* ToString(EquilibriumClass cls) {
  switch (cls) {
    case EquilibriumClass::SaddlePoint:
      return "Saddle Point";
    case EquilibriumClass::Node:
      return "Node";
    case EquilibriumClass::Center:
      return "Center";
    case EquilibriumClass::SpiralPoint:
      return "Spiral Point";
    case EquilibriumClass::ProperImproperNode:
      return "Proper/Improper Node";
    case EquilibriumClass::Degenerate:
      return "Degenerate (Non-isolated)";
  }
  return "unknown";
}

[[nodiscard]] inline const char* ToString(Stability stability) {
  switch (stability) {
    case Stability::Unstable:
      return "Unstable";
    case Stability::UnstableSource:
      return "Unstable (Source)";
    case Stability::StableSink:
      return "Stable (Sink)";
    case Stability::NeutrallyStable:
      return "Neutrally Stable";
    case Stability::UnstableSpiralSource:
      return "Unstable (Spiral Source)";
    case Stability::StableSpiralSink:
      return "Stable (Spiral Sink)";
    case Stability::Stable:
      return "Stable";
    case Stability::MarginallyStable:
      return "Marginally Stable";
  }
  return "unknown";
}

/** @brief True for every stability label that reports growth away from the origin. */
[[nodiscard]] inline bool is_unstable(Stability stability) {
  switch (stability) {
    case Stability::Unstable:
    case Stability::UnstableSource:
    case Stability::UnstableSpiralSource:
      return true;
    case Stability::StableSink:
    case Stability::NeutrallyStable:
    case Stability::StableSpiralSink:
    case Stability::Stable:
    case Stability::MarginallyStable:
      return false;
  }
  return false;
}

struct EquilibriumAnalysis {
  double trace = 0.0;
  double determinant = 0.0;
  double discriminant = 0.0;
  std::array<ComplexNumber, 2> eigenvalues{};
  // Present iff discriminant >= 0.
  std::optional<std::array<ComplexVector, 2>> eigenvectors{};
  EquilibriumClass classification = EquilibriumClass::Degenerate;
  Stability stability = Stability::MarginallyStable;
};

namespace detail {

[[nodiscard]] inline ComplexVector real_vector(double x, double y) {
  return {{x, 0.0}, {y, 0.0}};
}

}  // namespace detail

/**
 * @brief Unit real solution of (M - lambda I) v = 0.
 *
 * Uses the first row when it is non-degenerate, then the second row, and
 * falls back to (1, 0) when M - lambda I vanishes.
 */
[[nodiscard]] inline ComplexVector eigenvector_for(const Matrix2x2& m, double lambda) {
  const double row_a = m.a - lambda;
  const double row_b = m.b;

  if (std::abs(row_b) > kClassifyEps) {
    const double mag = std::sqrt(row_b * row_b + row_a * row_a);
    return detail::real_vector(-row_b / mag, row_a / mag);
  }
  if (std::abs(row_a) > kClassifyEps) {
    return detail::real_vector(0.0, 1.0);
  }

  const double row_c = m.c;
  const double row_d = m.d - lambda;
  if (std::abs(row_c) > kClassifyEps) {
    const double x = -row_d / row_c;
    const double mag = std::sqrt(x * x + 1.0);
    return detail::real_vector(x / mag, 1.0 / mag);
  }
  return detail::real_vector(1.0, 0.0);
}

/** @brief Compute invariants, spectrum, real eigenvectors, and the class of the origin. */
[[nodiscard]] inline EquilibriumAnalysis classify(const Matrix2x2& m) {
  EquilibriumAnalysis out{};
  const double tr = m.a + m.d;
  const double det = m.a * m.d - m.b * m.c;
  const double disc = tr * tr - 4.0 * det;
  out.trace = tr;
  out.determinant = det;
  out.discriminant = disc;

  if (disc >= 0.0) {
    const double root = std::sqrt(disc);
    const double r1 = (tr + root) / 2.0;
    const double r2 = (tr - root) / 2.0;
    out.eigenvalues = {ComplexNumber{r1, 0.0}, ComplexNumber{r2, 0.0}};
    out.eigenvectors = std::array<ComplexVector, 2>{eigenvector_for(m, r1), eigenvector_for(m, r2)};
  } else {
    const double re = tr / 2.0;
    const double im = std::sqrt(-disc) / 2.0;
    out.eigenvalues = {ComplexNumber{re, im}, ComplexNumber{re, -im}};
  }

  if (det < 0.0) {
    out.classification = EquilibriumClass::SaddlePoint;
    out.stability = Stability::Unstable;
  } else if (det > 0.0) {
    if (disc > 0.0) {
      out.classification = EquilibriumClass::Node;
      out.stability = tr > 0.0 ? Stability::UnstableSource : Stability::StableSink;
    } else if (disc < 0.0) {
      if (std::abs(tr) < kClassifyEps) {
        out.classification = EquilibriumClass::Center;
        out.stability = Stability::NeutrallyStable;
      } else {
        out.classification = EquilibriumClass::SpiralPoint;
        out.stability = tr > 0.0 ? Stability::UnstableSpiralSource : Stability::StableSpiralSink;
      }
    } else {
      out.classification = EquilibriumClass::ProperImproperNode;
      out.stability = tr > 0.0 ? Stability::Unstable : Stability::Stable;
    }
  } else {
    out.classification = EquilibriumClass::Degenerate;
    out.stability = Stability::MarginallyStable;
  }
  return out;
}

/** @brief Line segment through the origin along a real eigenvector. */
struct Segment {
  Point from{};
  Point to{};
};

/**
 * @brief Eigenlines for drawing over a [-range, range]^2 view.
 *
 * Each segment spans twice the view half-width on both sides so it crosses
 * the whole view. Empty when the eigenvalues are complex.
 */
[[nodiscard]] inline std::vector<Segment> eigenline_segments(const EquilibriumAnalysis& analysis,
                                                            double range = 5.0) {
  std::vector<Segment> out;
  if (!analysis.eigenvectors) {
    return out;
  }
  const double extent = 2.0 * range;
  for (const auto& v : *analysis.eigenvectors) {
    out.push_back({{-extent * v.x.re, -extent * v.y.re}, {extent * v.x.re, extent * v.y.re}});
  }
  return out;
}

}  // namespace phaseflow
