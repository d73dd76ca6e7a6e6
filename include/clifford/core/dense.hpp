#pragma once
#include <array>
#include <cstddef>
#include <utility>

// Portable SIMD Intrinsics (NEON/AVX/SSE)
#include <xsimd/xsimd.hpp>

#include <clifford/core/blades.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/multivector.hpp>
#include <clifford/core/signature.hpp>

namespace clifford::core {

// ========================================================================
// 1. DENSE MULTIVECTOR
// ========================================================================
// All 2^dim coefficients of a compile-time signature, indexed by blade mask.
// The sparse `Multivector` is the general value type; this one exists for hot
// loops where the signature is fixed and every lane of a SIMD batch is an
// independent multivector.

template <typename Field, IsSignature Sig> struct DenseMultivector {
  static constexpr size_t Size = Sig::size;

  alignas(xsimd::default_arch::alignment()) std::array<Field, Sig::size> data{};

  // Factory: DenseMultivector::from_blade(3, 2.5) -> 2.5 * e12
  static constexpr DenseMultivector from_blade(unsigned int bitmap, Field scale) {
    DenseMultivector mv;
    if (bitmap < Sig::size)
      mv.data[bitmap] = scale;
    return mv;
  }

  // --- Accessors ---
  constexpr Field operator[](size_t i) const { return data[i]; }
  constexpr Field &operator[](size_t i) { return data[i]; }

private:
  // Unified Accumulator for Geometric (*) and Wedge (^) products
  template <bool IsWedge, size_t TargetK, size_t I>
  constexpr void accumulate_product(Field &accumulator,
                                    const DenseMultivector &other) const {
    constexpr size_t J = I ^ TargetK;

    // Wedge: blades sharing a vector contribute nothing. The compiler
    // deletes this branch.
    if constexpr (IsWedge && (I & J) != 0) {
      return;
    } else {
      constexpr int sign = geometric_product_sign<Sig>(I, J);

      if constexpr (sign == 1) {
        accumulator += data[I] * other.data[J];
      } else if constexpr (sign == -1) {
        accumulator -= data[I] * other.data[J];
      }
    }
  }

  // Unrolls the sum for a single target component
  template <bool IsWedge, size_t TargetK, size_t... Is>
  constexpr void compute_component(DenseMultivector &result,
                                   const DenseMultivector &other,
                                   std::index_sequence<Is...>) const {
    Field sum = Field(0);
    (accumulate_product<IsWedge, TargetK, Is>(sum, other), ...);
    result.data[TargetK] = sum;
  }

  // Unrolls the loop over all target components
  template <bool IsWedge, size_t... Ks>
  constexpr DenseMultivector unroll_targets(const DenseMultivector &other,
                                            std::index_sequence<Ks...>) const {
    DenseMultivector result;
    (compute_component<IsWedge, Ks>(result, other,
                                    std::make_index_sequence<Size>{}),
     ...);
    return result;
  }

public:
  // Geometric Product (*)
  constexpr DenseMultivector operator*(const DenseMultivector &other) const {
    return unroll_targets<false>(other, std::make_index_sequence<Size>{});
  }

  // Outer Product (^)
  constexpr DenseMultivector operator^(const DenseMultivector &other) const {
    return unroll_targets<true>(other, std::make_index_sequence<Size>{});
  }

  // --- Basic Arithmetic ---
  constexpr DenseMultivector operator+(const DenseMultivector &other) const {
    DenseMultivector result;
    for (size_t i = 0; i < Size; ++i)
      result.data[i] = data[i] + other.data[i];
    return result;
  }

  constexpr DenseMultivector operator-(const DenseMultivector &other) const {
    DenseMultivector result;
    for (size_t i = 0; i < Size; ++i)
      result.data[i] = data[i] - other.data[i];
    return result;
  }

  constexpr DenseMultivector operator*(const Field &s) const {
    DenseMultivector result;
    for (size_t i = 0; i < Size; ++i)
      result.data[i] = data[i] * s;
    return result;
  }

  constexpr DenseMultivector reverse() const {
    DenseMultivector result;
    for (size_t i = 0; i < Size; ++i) {
      if (reverse_sign(grade(static_cast<BladeMask>(i))) < 0)
        result.data[i] = -data[i];
      else
        result.data[i] = data[i];
    }
    return result;
  }

  // v x reverse(v)
  constexpr DenseMultivector sandwich(const DenseMultivector &x) const {
    return (*this * x) * reverse();
  }
};

// ========================================================================
// 2. SPARSE <-> DENSE
// ========================================================================

/// \throws OutOfRangeBlade when `mv` has a blade outside `Sig`.
template <IsSignature Sig>
DenseMultivector<double, Sig> to_dense(const Multivector &mv) {
  DenseMultivector<double, Sig> out;
  for (const auto &[mask, coeff] : mv) {
    if (mask >= Sig::size) {
      throw OutOfRangeBlade("blade does not belong to the dense signature");
    }
    out.data[mask] = coeff;
  }
  return out;
}

template <IsSignature Sig>
Multivector to_sparse(const DenseMultivector<double, Sig> &mv) {
  Multivector out;
  for (size_t i = 0; i < Sig::size; ++i) {
    out.set(static_cast<BladeMask>(i), mv.data[i]);
  }
  return out;
}

// ========================================================================
// 3. WIDE TYPES (Structure of Arrays)
// ========================================================================

// Auto-detect the best SIMD batch size (NEON on Mac, AVX on Intel)
using Packet = xsimd::batch<double>;

// Each SIMD lane holds an independent multivector
template <IsSignature Sig> using WideMultivector = DenseMultivector<Packet, Sig>;

// Copies `mv` into every lane.
template <IsSignature Sig>
WideMultivector<Sig> broadcast(const DenseMultivector<double, Sig> &mv) {
  WideMultivector<Sig> out;
  for (size_t i = 0; i < Sig::size; ++i)
    out.data[i] = Packet(mv.data[i]);
  return out;
}

} // namespace clifford::core
