#pragma once
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include <clifford/core/blades.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/metric.hpp>
#include <clifford/core/multivector.hpp>
#include <clifford/core/tolerance.hpp>

namespace clifford::core {

/**
 * \brief Product engine over one metric.
 *
 * Every product is a bilinear expansion over the nonzero terms of both
 * operands; each blade pair is combined with the metric's sign table and the
 * accumulated result is pruned at `epsilon()`. The object is immutable and
 * can be shared across threads.
 */
class Algebra {
public:
  /**
   * \param metric Signature of the algebra.
   * \param epsilon Pruning tolerance for products (`CLIFFORD_EPSILON`).
   */
  explicit Algebra(Metric metric, double epsilon = epsilon_from_env())
      : metric_(std::move(metric)), epsilon_(epsilon) {}

  [[nodiscard]] const Metric &metric() const { return metric_; }
  [[nodiscard]] double epsilon() const { return epsilon_; }
  [[nodiscard]] int dimension() const { return metric_.dimension(); }

  // ========================================================================
  // CONSTRUCTION
  // ========================================================================

  /// \throws OutOfRangeBlade when `index` is not a basis vector.
  [[nodiscard]] Multivector basis_vector(int index) const {
    (void)metric_.square(index);
    return Multivector::from_blade(BladeMask{1} << index, 1.0);
  }

  [[nodiscard]] Multivector scalar(double value) const {
    return Multivector::scalar(value);
  }

  /// \throws OutOfRangeBlade when `mask` is not a blade of this algebra.
  [[nodiscard]] Multivector blade(BladeMask mask, double coefficient = 1.0) const {
    metric_.check_blade(mask);
    return Multivector::from_blade(mask, coefficient);
  }

  [[nodiscard]] Multivector pseudoscalar() const {
    return Multivector::from_blade(metric_.pseudoscalar_mask(), 1.0);
  }

  // ========================================================================
  // PRODUCTS
  // ========================================================================

  [[nodiscard]] Multivector geometric(const Multivector &a, const Multivector &b) const {
    return expand(a, b, [](BladeMask, BladeMask) { return true; });
  }

  /// Outer product: only blade pairs without a shared factor contribute.
  [[nodiscard]] Multivector wedge(const Multivector &a, const Multivector &b) const {
    return expand(a, b, [](BladeMask x, BladeMask y) { return (x & y) == 0; });
  }

  /// Inner product: terms of grade `|grade(A) - grade(B)|`.
  [[nodiscard]] Multivector dot(const Multivector &a, const Multivector &b) const {
    return expand(a, b, [](BladeMask x, BladeMask y) {
      return grade(x ^ y) == std::abs(grade(x) - grade(y));
    });
  }

  [[nodiscard]] Multivector left_contraction(const Multivector &a,
                                             const Multivector &b) const {
    return expand(a, b, [](BladeMask x, BladeMask y) {
      return grade(x) <= grade(y) && grade(x ^ y) == grade(y) - grade(x);
    });
  }

  [[nodiscard]] Multivector right_contraction(const Multivector &a,
                                              const Multivector &b) const {
    return expand(a, b, [](BladeMask x, BladeMask y) {
      return grade(x) >= grade(y) && grade(x ^ y) == grade(x) - grade(y);
    });
  }

  [[nodiscard]] double scalar_product(const Multivector &a, const Multivector &b) const {
    return expand(a, b, [](BladeMask x, BladeMask y) { return x == y; }).scalar_part();
  }

  /// `(AB - BA) / 2`
  [[nodiscard]] Multivector commutator(const Multivector &a, const Multivector &b) const {
    return ((geometric(a, b) - geometric(b, a)) * 0.5).pruned(epsilon_);
  }

  /// `(AB + BA) / 2`
  [[nodiscard]] Multivector anticommutator(const Multivector &a,
                                           const Multivector &b) const {
    return ((geometric(a, b) + geometric(b, a)) * 0.5).pruned(epsilon_);
  }

  /**
   * \brief Apply versor `v` to `x` as `v x reverse(v)`.
   *
   * Reflections, rotations, translations and sphere inversions all take this
   * form. No normalization is applied, so non-unit versors scale the result.
   */
  [[nodiscard]] Multivector sandwich(const Multivector &v, const Multivector &x) const {
    return geometric(geometric(v, x), v.reverse());
  }

  /// `v x v^-1`; unlike `sandwich` this is independent of the scale of `v`.
  [[nodiscard]] Multivector transform(const Multivector &v, const Multivector &x) const {
    return geometric(geometric(v, x), inverse(v));
  }

  /// Scalar part of `x reverse(x)`.
  [[nodiscard]] double norm_squared(const Multivector &x) const {
    return scalar_product(x, x.reverse());
  }

  /**
   * \brief Versor inverse `reverse(v) / (v reverse(v))`.
   * \throws std::invalid_argument when `v reverse(v)` is not a nonzero scalar
   * (null versors and general multivectors).
   */
  [[nodiscard]] Multivector inverse(const Multivector &v) const {
    const Multivector vv = geometric(v, v.reverse());
    if (!vv.is_homogeneous(0) || vv.is_zero()) {
      throw std::invalid_argument("multivector is not an invertible versor");
    }
    return v.reverse() / vv.scalar_part();
  }

  // ========================================================================
  // DUALITY
  // ========================================================================
  // Right complement: e_A -> s e_C with e_A ^ (s e_C) = I. Metric-free, so it
  // is well defined for degenerate signatures too.

  [[nodiscard]] Multivector dual(const Multivector &x) const {
    const BladeMask full = metric_.pseudoscalar_mask();
    Multivector out;
    for (const auto &[mask, coeff] : x) {
      metric_.check_blade(mask);
      const BladeMask complement = full ^ mask;
      out.add_term(complement, wedge_sign(mask, complement) * coeff);
    }
    return out;
  }

  [[nodiscard]] Multivector undual(const Multivector &x) const {
    const BladeMask full = metric_.pseudoscalar_mask();
    Multivector out;
    for (const auto &[mask, coeff] : x) {
      metric_.check_blade(mask);
      const BladeMask original = full ^ mask;
      out.add_term(original, wedge_sign(original, mask) * coeff);
    }
    return out;
  }

  /// Regressive (vee) product: `undual(dual(a) ^ dual(b))`.
  [[nodiscard]] Multivector regressive(const Multivector &a, const Multivector &b) const {
    return undual(wedge(dual(a), dual(b)));
  }

private:
  template <typename Filter>
  Multivector expand(const Multivector &a, const Multivector &b, Filter keep) const {
    Multivector result;
    for (const auto &[mask_a, coeff_a] : a) {
      for (const auto &[mask_b, coeff_b] : b) {
        if (!keep(mask_a, mask_b)) {
          continue;
        }
        const int sign = metric_.product_sign(mask_a, mask_b);
        if (sign == 0) {
          continue;
        }
        result.add_term(mask_a ^ mask_b, sign * coeff_a * coeff_b);
      }
    }
    return result.pruned(epsilon_);
  }

  Metric metric_;
  double epsilon_;
};

} // namespace clifford::core
