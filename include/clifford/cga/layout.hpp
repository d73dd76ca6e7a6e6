#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <fmt/core.h>

#include <clifford/core/blades.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/metric.hpp>
#include <clifford/core/multivector.hpp>
#include <clifford/core/outermorphism.hpp>

namespace clifford::cga {

using core::BladeMask;
using core::Multivector;

/**
 * \brief Where the real and auxiliary basis vectors of a conformal algebra sit.
 *
 * Low-level basis: `real_dims` Euclidean vectors, then `p` (`p^2 = +1`) and
 * `n` (`n^2 = -1`). High-level basis: the same real vectors, with the slot of
 * `p` holding `inf = n + p` and the slot of `n` holding `o = (n - p) / 2`.
 * High-level blades are outer products of their factors.
 */
struct ConformalLayout {
  int real_dims = 3;

  static ConformalLayout cga2d() { return {2}; }
  static ConformalLayout cga3d() { return {3}; }

  [[nodiscard]] int dimension() const { return real_dims + 2; }
  [[nodiscard]] int plus_index() const { return real_dims; }
  [[nodiscard]] int minus_index() const { return real_dims + 1; }

  /// Mask of `inf` in the high-level basis (the slot of `p`).
  [[nodiscard]] BladeMask infinity_mask() const { return BladeMask{1} << plus_index(); }
  /// Mask of `o` in the high-level basis (the slot of `n`).
  [[nodiscard]] BladeMask origin_mask() const { return BladeMask{1} << minus_index(); }

  [[nodiscard]] BladeMask real_mask() const {
    return (BladeMask{1} << real_dims) - 1;
  }

  /// Squares `(+1, ..., +1, +1, -1)` with labels `x y z p n`.
  [[nodiscard]] core::Metric metric() const {
    std::vector<int> squares(static_cast<size_t>(real_dims), 1);
    squares.push_back(1);
    squares.push_back(-1);
    return core::Metric(std::move(squares), low_level_labels());
  }

  [[nodiscard]] std::vector<std::string> low_level_labels() const {
    std::vector<std::string> labels = real_labels();
    labels.emplace_back("p");
    labels.emplace_back("n");
    return labels;
  }

  [[nodiscard]] std::vector<std::string> high_level_labels() const {
    std::vector<std::string> labels = real_labels();
    labels.emplace_back("∞");
    labels.emplace_back("o");
    return labels;
  }

  // ========================================================================
  // BASIS CHANGE
  // ========================================================================

  /// Column `j`: low-level basis vector `j` in high-level coordinates.
  /// `p = inf/2 - o`, `n = inf/2 + o`.
  [[nodiscard]] Eigen::MatrixXd high_from_low() const {
    Eigen::MatrixXd m = Eigen::MatrixXd::Identity(dimension(), dimension());
    const int p = plus_index();
    const int n = minus_index();
    m(p, p) = 0.5;
    m(n, p) = -1.0;
    m(p, n) = 0.5;
    m(n, n) = 1.0;
    return m;
  }

  /// Column `j`: high-level basis vector `j` in low-level coordinates.
  /// `inf = n + p`, `o = (n - p) / 2`.
  [[nodiscard]] Eigen::MatrixXd low_from_high() const {
    Eigen::MatrixXd m = Eigen::MatrixXd::Identity(dimension(), dimension());
    const int p = plus_index();
    const int n = minus_index();
    m(p, p) = 1.0;
    m(n, p) = 1.0;
    m(p, n) = -0.5;
    m(n, n) = 0.5;
    return m;
  }

  /// Rewrite a low-level multivector over `x.. inf o`. Exact.
  [[nodiscard]] Multivector to_high_level(const Multivector &low) const {
    return core::apply_outermorphism(low, high_from_low());
  }

  /// Rewrite a high-level multivector over `x.. p n`. Exact.
  [[nodiscard]] Multivector to_low_level(const Multivector &high) const {
    return core::apply_outermorphism(high, low_from_high());
  }

  /// `inf = n + p` in the low-level basis.
  [[nodiscard]] Multivector infinity() const {
    return to_low_level(Multivector::from_blade(infinity_mask(), 1.0));
  }

  /// `o = (n - p) / 2` in the low-level basis.
  [[nodiscard]] Multivector origin() const {
    return to_low_level(Multivector::from_blade(origin_mask(), 1.0));
  }

  bool operator==(const ConformalLayout &) const = default;

private:
  [[nodiscard]] std::vector<std::string> real_labels() const {
    static const char *kNames[] = {"x", "y", "z", "w"};
    std::vector<std::string> labels;
    for (int i = 0; i < real_dims; ++i) {
      labels.emplace_back(i < 4 ? kNames[i] : fmt::format("e{}", i + 1));
    }
    return labels;
  }
};

} // namespace clifford::cga
