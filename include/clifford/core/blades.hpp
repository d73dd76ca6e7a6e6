#pragma once
#include <algorithm>
#include <bit>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <clifford/core/signature.hpp>

namespace clifford::core {

/// \brief Canonical blade identifier: bit `i` set iff basis vector `i` is a
/// factor.
using BladeMask = std::uint32_t;

/// \brief Number of basis vectors in `mask`.
constexpr int grade(BladeMask mask) { return std::popcount(mask); }

/// \brief Sign picked up by reversing the factors of a grade-`k` blade.
constexpr int reverse_sign(int k) { return ((k * (k - 1) / 2) % 2 == 0) ? 1 : -1; }

/// \brief Sign of the grade involution on a grade-`k` blade.
constexpr int involution_sign(int k) { return (k % 2 == 0) ? 1 : -1; }

/// \brief Clifford conjugation sign (reverse composed with involution).
constexpr int conjugation_sign(int k) { return reverse_sign(k) * involution_sign(k); }

/**
 * \brief Sign of `e_a ^ e_b` relative to the canonical blade `e_(a|b)`.
 * \return `0` when the blades share a factor, else the reordering parity.
 */
constexpr int wedge_sign(BladeMask a, BladeMask b) {
  if ((a & b) != 0) {
    return 0;
  }
  return reordering_sign(a, b);
}

namespace detail {

inline void choose_masks(int k, std::span<const BladeMask> choices,
                         BladeMask prefix, std::vector<BladeMask> &out) {
  if (k == 0) {
    out.push_back(prefix);
    return;
  }
  for (size_t i = 0; i < choices.size(); ++i) {
    choose_masks(k - 1, choices.subspan(i + 1), prefix | choices[i], out);
  }
}

} // namespace detail

/**
 * \brief Every blade of a `dimension`-dimensional algebra.
 *
 * Ordered by grade, then lexicographically by the sorted factor indices, so
 * for 3D: `1, e1, e2, e3, e12, e13, e23, e123`.
 * \param dimension Number of basis vectors.
 * \return `2^dimension` masks.
 */
inline std::vector<BladeMask> blades_by_grade(int dimension) {
  std::vector<BladeMask> vectors;
  vectors.reserve(static_cast<size_t>(dimension));
  for (int i = 0; i < dimension; ++i) {
    vectors.push_back(BladeMask{1} << i);
  }

  std::vector<BladeMask> out;
  out.reserve(size_t{1} << dimension);
  for (int k = 0; k <= dimension; ++k) {
    detail::choose_masks(k, vectors, 0, out);
  }
  return out;
}

/**
 * \brief Concatenated labels of the factors of `mask` in ascending order.
 * \param mask Blade to label.
 * \param labels One label per basis vector; indices past the end are skipped.
 * \return e.g. `"xz"` for `0b101` with labels `x, y, z`; `""` for scalars.
 */
inline std::string blade_label(BladeMask mask,
                               std::span<const std::string> labels) {
  std::string out;
  const size_t n = std::min<size_t>(labels.size(), 32);
  for (size_t i = 0; i < n; ++i) {
    if ((mask >> i) & 1u) {
      out += labels[i];
    }
  }
  return out;
}

} // namespace clifford::core
