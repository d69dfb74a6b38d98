/**
 * @file format.hpp
 * @brief Human-readable text for systems, eigenvalues, and eigenvectors.
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>

#include "phaseflow/classifier.hpp"
#include "phaseflow/types.hpp"

namespace phaseflow {

namespace detail {

inline void append_term(std::ostringstream& oss, double coeff, const char* variable, bool first) {
  if (first) {
    if (coeff < 0.0) {
      oss << '-';
    }
  } else {
    oss << (coeff > 0.0 ? " + " : " - ");
  }
  const double mag = std::abs(coeff);
  if (mag != 1.0) {
    oss << std::setprecision(12) << mag;
  }
  oss << variable;
}

[[nodiscard]] inline std::string format_row(const char* lhs, double cx, double cy) {
  std::ostringstream oss;
  oss << lhs << " = ";
  bool first = true;
  if (cx != 0.0) {
    append_term(oss, cx, "x", first);
    first = false;
  }
  if (cy != 0.0) {
    append_term(oss, cy, "y", first);
    first = false;
  }
  if (first) {
    oss << '0';
  }
  return oss.str();
}

}  // namespace detail

/** @brief Two-line rendering of the system, e.g. "x' = x - 2y\ny' = 3x - 4y". */
[[nodiscard]] inline std::string FormatSystem(const Matrix2x2& m) {
  return detail::format_row("x'", m.a, m.b) + "\n" + detail::format_row("y'", m.c, m.d);
}

[[nodiscard]] inline std::string FormatEigenvalue(const ComplexNumber& z) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << z.re;
  if (z.im != 0.0) {
    oss << " ± " << std::abs(z.im) << 'i';
  }
  return oss.str();
}

[[nodiscard]] inline std::string FormatEigenvector(const ComplexVector& v) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << '[' << v.x.re << ", " << v.y.re << ']';
  return oss.str();
}

/** @brief One-line summary: class, stability and the spectrum. */
[[nodiscard]] inline std::string FormatAnalysis(const EquilibriumAnalysis& a) {
  std::ostringstream oss;
  oss << ToString(a.classification) << " (" << ToString(a.stability) << ")";
  for (std::size_t i = 0; i < a.eigenvalues.size(); ++i) {
    oss << ", l" << (i + 1) << " = " << FormatEigenvalue(a.eigenvalues[i]);
    if (a.eigenvectors) {
      oss << " v" << (i + 1) << " = " << FormatEigenvector((*a.eigenvectors)[i]);
    }
  }
  return oss.str();
}

}  // namespace phaseflow
