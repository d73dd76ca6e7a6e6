#pragma once
#include <cmath>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <clifford/core/blades.hpp>
#include <clifford/core/metric.hpp>
#include <clifford/core/multivector.hpp>
#include <clifford/core/tolerance.hpp>

namespace clifford::io {

using core::BladeMask;
using core::Multivector;

/**
 * \brief One `coefficient * blade` term, or nothing when it rounds to zero.
 *
 * A coefficient of one is left implicit (`"xy"`); anything else prints with
 * three decimals (`"3.254xy"`, `"-1.000"`).
 */
inline std::optional<std::string> format_term(double coefficient,
                                              const std::string &blade) {
  if (std::abs(coefficient) < core::kFormatEpsilon) {
    return std::nullopt;
  }
  if (std::abs(coefficient - 1.0) < core::kFormatEpsilon && !blade.empty()) {
    return blade;
  }
  return fmt::format("{:.3f}{}", coefficient, blade);
}

/// \brief Non-zero terms joined with `" + "`; `"0"` when nothing remains.
inline std::string format_term_list(
    std::span<const std::pair<double, std::string>> terms) {
  std::vector<std::string> parts;
  for (const auto &[coefficient, blade] : terms) {
    if (auto term = format_term(coefficient, blade)) {
      parts.push_back(std::move(*term));
    }
  }
  if (parts.empty()) {
    return "0";
  }
  return fmt::format("{}", fmt::join(parts, " + "));
}

/**
 * \brief Render `mv` as a linear combination of labelled blades.
 *
 * Terms appear in grade order (see `core::blades_by_grade`), e.g.
 * `"2.000x + 3.000y + o"`.
 * \param labels One label per basis vector.
 */
inline std::string to_string(const Multivector &mv,
                             std::span<const std::string> labels) {
  std::vector<std::pair<double, std::string>> terms;
  for (BladeMask mask : core::blades_by_grade(static_cast<int>(labels.size()))) {
    const double coeff = mv[mask];
    if (coeff != 0.0) {
      terms.emplace_back(coeff, core::blade_label(mask, labels));
    }
  }
  return format_term_list(terms);
}

/// \brief Render `mv` with the labels of `metric`.
inline std::string to_string(const Multivector &mv, const core::Metric &metric) {
  return to_string(mv, metric.labels());
}

} // namespace clifford::io
