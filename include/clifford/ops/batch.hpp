#pragma once
#include <algorithm>
#include <array>
#include <exception>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <Eigen/Dense>
#include <xsimd/xsimd.hpp>

#include <clifford/cga/layout.hpp>
#include <clifford/core/algebra.hpp>
#include <clifford/core/blades.hpp>
#include <clifford/core/dense.hpp>
#include <clifford/core/multivector.hpp>
#include <clifford/core/parallel.hpp>
#include <clifford/core/signature.hpp>

namespace clifford::ops {

using core::Algebra;
using core::BladeMask;
using core::Multivector;

// ==============================================================================
// 1. PRODUCT SELECTION
// ==============================================================================

enum class ProductKind {
  Geometric,
  Wedge,
  Dot,
  LeftContraction,
  RightContraction,
  Regressive,
  Commutator,
  Anticommutator
};

/// Parse the CLI spelling of a product (`gp`, `wedge`, `dot`, `lc`, `rc`,
/// `vee`, `commutator`, `anticommutator`).
inline std::optional<ProductKind> product_kind_from_string(std::string_view name) {
  if (name == "gp" || name == "geometric")
    return ProductKind::Geometric;
  if (name == "wedge")
    return ProductKind::Wedge;
  if (name == "dot")
    return ProductKind::Dot;
  if (name == "lc" || name == "left_contraction")
    return ProductKind::LeftContraction;
  if (name == "rc" || name == "right_contraction")
    return ProductKind::RightContraction;
  if (name == "vee" || name == "regressive")
    return ProductKind::Regressive;
  if (name == "commutator")
    return ProductKind::Commutator;
  if (name == "anticommutator")
    return ProductKind::Anticommutator;
  return std::nullopt;
}

inline Multivector apply_product(const Algebra &algebra, ProductKind kind,
                                 const Multivector &a, const Multivector &b) {
  switch (kind) {
  case ProductKind::Geometric:
    return algebra.geometric(a, b);
  case ProductKind::Wedge:
    return algebra.wedge(a, b);
  case ProductKind::Dot:
    return algebra.dot(a, b);
  case ProductKind::LeftContraction:
    return algebra.left_contraction(a, b);
  case ProductKind::RightContraction:
    return algebra.right_contraction(a, b);
  case ProductKind::Regressive:
    return algebra.regressive(a, b);
  case ProductKind::Commutator:
    return algebra.commutator(a, b);
  case ProductKind::Anticommutator:
    return algebra.anticommutator(a, b);
  }
  throw std::invalid_argument("unknown product kind");
}

// ==============================================================================
// 2. MULTIPLICATION TABLES
// ==============================================================================

struct MultiplicationTable {
  /// Row and column blades, in `core::blades_by_grade` order.
  std::vector<BladeMask> blades;
  /// Row-major `blades.size() x blades.size()` products.
  std::vector<Multivector> entries;

  [[nodiscard]] const Multivector &at(size_t row, size_t col) const {
    return entries[row * blades.size() + col];
  }
};

/// Product of every pair of unit basis blades, computed in parallel.
inline MultiplicationTable multiplication_table(const Algebra &algebra,
                                                ProductKind kind) {
  MultiplicationTable table;
  table.blades = core::blades_by_grade(algebra.dimension());
  const int n = static_cast<int>(table.blades.size());
  table.entries.resize(static_cast<size_t>(n) * static_cast<size_t>(n));

  core::parallel_for_index(0, n * n, [&](int idx) {
    const auto a = Multivector::from_blade(table.blades[static_cast<size_t>(idx / n)], 1.0);
    const auto b = Multivector::from_blade(table.blades[static_cast<size_t>(idx % n)], 1.0);
    table.entries[static_cast<size_t>(idx)] = apply_product(algebra, kind, a, b);
  });
  return table;
}

// ==============================================================================
// 3. BATCH SANDWICH
// ==============================================================================

/**
 * \brief `algebra.sandwich(versor, x)` for every operand, in parallel.
 * \throws core::OutOfRangeBlade when an operand has a blade outside the
 * algebra; the first failing operand (by index) is reported.
 */
inline std::vector<Multivector> sandwich_all(const Algebra &algebra,
                                             const Multivector &versor,
                                             std::span<const Multivector> operands) {
  const int n = static_cast<int>(operands.size());
  const Multivector reversed = versor.reverse();
  std::vector<Multivector> out(operands.size());
  std::vector<std::exception_ptr> errors(operands.size());

  core::parallel_for_index(0, n, [&](int i) {
    const auto idx = static_cast<size_t>(i);
    try {
      out[idx] = algebra.geometric(algebra.geometric(versor, operands[idx]), reversed);
    } catch (...) {
      errors[idx] = std::current_exception();
    }
  });

  for (const auto &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
  return out;
}

/**
 * \brief Move Euclidean points through a conformal versor with SIMD lanes.
 *
 * Each point is embedded as `x + |x|^2/2 inf + o`, sandwiched as
 * `V X reverse(V)` with the dense kernel of `Sig`, and projected back by
 * normalizing the `o` coefficient. Points the versor sends to infinity come
 * back non-finite.
 * \tparam Sig Dense signature matching `layout` (`CGA2D` or `CGA3D`).
 * \throws std::invalid_argument when `Sig` does not match `layout`.
 */
template <core::IsSignature Sig>
std::vector<Eigen::Vector3d> transform_points(const cga::ConformalLayout &layout,
                                              const Multivector &versor,
                                              std::span<const Eigen::Vector3d> points) {
  if (Sig::p != layout.real_dims + 1 || Sig::q != 1 || Sig::r != 0) {
    throw std::invalid_argument("dense signature does not match the conformal layout");
  }

  using core::Packet;
  using Wide = core::WideMultivector<Sig>;
  constexpr size_t kLanes = Packet::size;

  const auto dense = core::to_dense<Sig>(versor);
  const Wide v = core::broadcast(dense);
  const Wide v_rev = core::broadcast(dense.reverse());

  const int dims = layout.real_dims;
  const BladeMask p_mask = BladeMask{1} << layout.plus_index();
  const BladeMask n_mask = BladeMask{1} << layout.minus_index();

  const size_t count = points.size();
  const int chunks = static_cast<int>((count + kLanes - 1) / kLanes);
  std::vector<Eigen::Vector3d> out(count, Eigen::Vector3d::Zero());

  core::parallel_for_index(0, chunks, [&](int chunk) {
    const size_t first = static_cast<size_t>(chunk) * kLanes;
    const size_t valid = std::min(kLanes, count - first);

    // Gather lanes; padding lanes hold the origin.
    std::array<std::array<double, kLanes>, 3> coords{};
    std::array<double, kLanes> norm_sq{};
    for (size_t lane = 0; lane < valid; ++lane) {
      const Eigen::Vector3d &pt = points[first + lane];
      for (int d = 0; d < dims; ++d) {
        coords[static_cast<size_t>(d)][lane] = pt[d];
      }
      norm_sq[lane] = pt.head(dims).squaredNorm();
    }

    // up(x): p = (|x|^2 - 1)/2, n = (|x|^2 + 1)/2
    Wide x;
    for (int d = 0; d < dims; ++d) {
      x.data[BladeMask{1} << d] = Packet::load_unaligned(coords[static_cast<size_t>(d)].data());
    }
    const Packet r2 = Packet::load_unaligned(norm_sq.data());
    x.data[p_mask] = (r2 - Packet(1.0)) * Packet(0.5);
    x.data[n_mask] = (r2 + Packet(1.0)) * Packet(0.5);

    const Wide y = (v * x) * v_rev;

    // down(y): divide by the o coefficient n - p
    const Packet o = y.data[n_mask] - y.data[p_mask];
    for (int d = 0; d < dims; ++d) {
      const Packet loc = y.data[BladeMask{1} << d] / o;
      loc.store_unaligned(coords[static_cast<size_t>(d)].data());
    }
    for (size_t lane = 0; lane < valid; ++lane) {
      Eigen::Vector3d &dst = out[first + lane];
      for (int d = 0; d < dims; ++d) {
        dst[d] = coords[static_cast<size_t>(d)][lane];
      }
    }
  }, 4);
  return out;
}

} // namespace clifford::ops
