#pragma once
#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <utility>

#include <clifford/core/blades.hpp>

namespace clifford::core {

// ========================================================================
// SPARSE MULTIVECTOR
// ========================================================================
// Blade mask -> coefficient. Masks that are absent have coefficient zero and
// no entry with an exactly-zero coefficient is ever stored. Products live on
// `Algebra`, since they need a metric.

class Multivector {
public:
  using Terms = std::map<BladeMask, double>;
  using const_iterator = Terms::const_iterator;

  // --- Constructors ---
  Multivector() = default;

  // Factory: Multivector::from_blade(0b11, 2.5) -> 2.5 * e12
  static Multivector from_blade(BladeMask mask, double coefficient) {
    Multivector mv;
    mv.set(mask, coefficient);
    return mv;
  }

  static Multivector scalar(double value) { return from_blade(0, value); }

  // --- Accessors ---
  [[nodiscard]] double operator[](BladeMask mask) const {
    auto it = terms_.find(mask);
    return it == terms_.end() ? 0.0 : it->second;
  }

  [[nodiscard]] double scalar_part() const { return (*this)[0]; }

  /// Overwrite one coefficient. Setting zero removes the entry.
  void set(BladeMask mask, double coefficient) {
    if (coefficient == 0.0) {
      terms_.erase(mask);
    } else {
      terms_[mask] = coefficient;
    }
  }

  /// Accumulate into one coefficient, dropping it if it cancels exactly.
  void add_term(BladeMask mask, double coefficient) {
    if (coefficient == 0.0) {
      return;
    }
    auto [it, inserted] = terms_.try_emplace(mask, coefficient);
    if (!inserted) {
      it->second += coefficient;
      if (it->second == 0.0) {
        terms_.erase(it);
      }
    }
  }

  [[nodiscard]] bool is_zero() const { return terms_.empty(); }
  [[nodiscard]] size_t size() const { return terms_.size(); }
  [[nodiscard]] const Terms &terms() const { return terms_; }
  [[nodiscard]] const_iterator begin() const { return terms_.begin(); }
  [[nodiscard]] const_iterator end() const { return terms_.end(); }

  /// Bitset of the grades present (bit k set iff a grade-k term exists).
  [[nodiscard]] unsigned grades() const {
    unsigned out = 0;
    for (const auto &[mask, coeff] : terms_) {
      out |= 1u << grade(mask);
    }
    return out;
  }

  /// True when every term has grade `k` (the zero multivector qualifies).
  [[nodiscard]] bool is_homogeneous(int k) const {
    if (k < 0 || k >= std::numeric_limits<unsigned>::digits) {
      return is_zero();
    }
    return (grades() & ~(1u << k)) == 0;
  }

  // --- Unary operations ---

  /// Keep only the grade-`k` terms.
  [[nodiscard]] Multivector grade_projection(int k) const {
    Multivector out;
    for (const auto &[mask, coeff] : terms_) {
      if (grade(mask) == k) {
        out.terms_.emplace_hint(out.terms_.end(), mask, coeff);
      }
    }
    return out;
  }

  /// Reverse the factor order of every blade.
  [[nodiscard]] Multivector reverse() const {
    return map_signs([](int k) { return reverse_sign(k); });
  }

  /// Negate the odd grades.
  [[nodiscard]] Multivector grade_involution() const {
    return map_signs([](int k) { return involution_sign(k); });
  }

  [[nodiscard]] Multivector conjugate() const {
    return map_signs([](int k) { return conjugation_sign(k); });
  }

  /// Drop terms with magnitude at or below `epsilon`.
  [[nodiscard]] Multivector pruned(double epsilon) const {
    Multivector out;
    for (const auto &[mask, coeff] : terms_) {
      if (std::abs(coeff) > epsilon) {
        out.terms_.emplace_hint(out.terms_.end(), mask, coeff);
      }
    }
    return out;
  }

  // --- Basic Arithmetic ---
  Multivector operator+(const Multivector &other) const {
    Multivector result = *this;
    for (const auto &[mask, coeff] : other.terms_) {
      result.add_term(mask, coeff);
    }
    return result;
  }

  Multivector operator-(const Multivector &other) const {
    Multivector result = *this;
    for (const auto &[mask, coeff] : other.terms_) {
      result.add_term(mask, -coeff);
    }
    return result;
  }

  Multivector operator-() const { return *this * -1.0; }

  Multivector operator*(double s) const {
    Multivector result;
    if (s == 0.0) {
      return result;
    }
    for (const auto &[mask, coeff] : terms_) {
      // Underflow can still produce zero.
      result.set(mask, coeff * s);
    }
    return result;
  }

  Multivector operator/(double s) const { return *this * (1.0 / s); }

  Multivector &operator+=(const Multivector &other) { return *this = *this + other; }
  Multivector &operator-=(const Multivector &other) { return *this = *this - other; }
  Multivector &operator*=(double s) { return *this = *this * s; }

  /// Exact, coefficient-for-coefficient equality.
  bool operator==(const Multivector &other) const = default;

private:
  template <typename SignFn> Multivector map_signs(SignFn sign_of) const {
    Multivector out;
    for (const auto &[mask, coeff] : terms_) {
      out.terms_.emplace_hint(out.terms_.end(), mask, sign_of(grade(mask)) * coeff);
    }
    return out;
  }

  Terms terms_;
};

inline Multivector operator*(double s, const Multivector &mv) { return mv * s; }

/// Scaling by `s`, as a free function.
inline Multivector scale(const Multivector &mv, double s) { return mv * s; }

/// Grade projection, as a free function.
inline Multivector grade(const Multivector &mv, int k) { return mv.grade_projection(k); }

/**
 * \brief Compare coefficients up to an absolute tolerance.
 * \param a First multivector.
 * \param b Second multivector.
 * \param epsilon Largest accepted per-blade difference.
 */
inline bool approx_equal(const Multivector &a, const Multivector &b,
                         double epsilon) {
  const Multivector diff = a - b;
  for (const auto &[mask, coeff] : diff) {
    if (std::abs(coeff) > epsilon) {
      return false;
    }
  }
  return true;
}

} // namespace clifford::core
