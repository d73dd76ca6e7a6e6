#pragma once

#include <cstdlib>

namespace clifford::core {

/// \brief Pruning tolerance used when `CLIFFORD_EPSILON` is unset.
constexpr double kDefaultEpsilon = 1e-12;

/// \brief Threshold below which formatted coefficients print as zero.
constexpr double kFormatEpsilon = 1e-15;

/**
 * \brief Pruning tolerance from `CLIFFORD_EPSILON`.
 *
 * Non-numeric or negative values fall back to `kDefaultEpsilon`.
 * \return Tolerance applied to product and basis-change results.
 */
inline double epsilon_from_env() {
  const char *raw = std::getenv("CLIFFORD_EPSILON");
  if (raw == nullptr) {
    return kDefaultEpsilon;
  }

  char *end = nullptr;
  const double parsed = std::strtod(raw, &end);
  if (end == raw || parsed < 0.0) {
    return kDefaultEpsilon;
  }
  return parsed;
}

} // namespace clifford::core
