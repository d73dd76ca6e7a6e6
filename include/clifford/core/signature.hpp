#pragma once
#include <bit>
#include <concepts>
#include <cstddef>

namespace clifford::core {

// ========================================================================
// 1. SIGNATURE
// ========================================================================

// Represents Cl(p, q, r): p vectors squaring to +1, then q squaring to -1,
// then r null vectors.
template <int P, int Q, int R = 0>
  requires(P >= 0) && (Q >= 0) && (R >= 0)
struct Signature {
  static constexpr int p = P;
  static constexpr int q = Q;
  static constexpr int r = R;
  static constexpr int dim = P + Q + R;
  static constexpr size_t size = 1ULL << dim;

  static_assert(dim <= 8, "Only up to 8 basis vectors are supported.");
};

// Common Signatures
using Euclidean2D = Signature<2, 0>;
using Euclidean3D = Signature<3, 0>;
using PGA2D = Signature<2, 0, 1>;
using PGA3D = Signature<3, 0, 1>;
// x, y, p | n
using CGA2D = Signature<3, 1>;
// x, y, z, p | n
using CGA3D = Signature<4, 1>;

// Concept to ensure valid signature
template <typename T>
concept IsSignature = requires {
  { T::p } -> std::convertible_to<int>;
  { T::q } -> std::convertible_to<int>;
  { T::r } -> std::convertible_to<int>;
  { T::dim } -> std::convertible_to<int>;
};

// Metric Helper
template <IsSignature Sig> constexpr int get_basis_metric(int index) {
  if (index < Sig::p)
    return 1;
  if (index < Sig::p + Sig::q)
    return -1;
  return 0;
}

// Parity of the swaps needed to bring the factors of a * b into ascending
// order. Returns 1 or -1.
constexpr int reordering_sign(unsigned int a, unsigned int b) {
  // If 'a' has bit i and 'b' has bit j with i > j, that's a swap.
  unsigned int a_temp = a >> 1;
  int swaps = 0;
  while (a_temp != 0) {
    swaps += std::popcount(a_temp & b);
    a_temp >>= 1;
  }
  return (swaps % 2) != 0 ? -1 : 1;
}

// Computes the sign/metric for basis blade multiplication a * b
// Returns: 1, -1, or 0 (if a collapsed vector is null)
template <IsSignature Sig>
constexpr int geometric_product_sign(unsigned int a, unsigned int b) {
  int sign = reordering_sign(a, b);

  // Bits present in BOTH a and b are squared.
  unsigned int intersection = a & b;
  while (intersection != 0) {
    int i = std::countr_zero(intersection);
    sign *= get_basis_metric<Sig>(i);
    intersection &= intersection - 1;
  }
  return sign;
}

} // namespace clifford::core
