#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <clifford/core/blades.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/signature.hpp>

namespace clifford::core {

/// \brief Largest number of basis vectors a `Metric` accepts.
constexpr int kMaxDimension = 8;

/**
 * \brief Ordered square values of the basis vectors of an algebra.
 *
 * Immutable after construction. The constructor precomputes the sign of every
 * basis blade product (the Cayley table), so one instance can be shared
 * read-only by any number of concurrent computations.
 */
class Metric {
public:
  /**
   * \brief Build a metric from explicit squares.
   * \param squares One entry per basis vector, each `+1`, `-1` or `0`.
   * \param labels Optional display labels, one per basis vector.
   */
  explicit Metric(std::vector<int> squares, std::vector<std::string> labels = {})
      : squares_(std::move(squares)), labels_(std::move(labels)) {
    if (squares_.size() > static_cast<size_t>(kMaxDimension)) {
      throw std::invalid_argument(
          fmt::format("Only up to {} dimensions are supported", kMaxDimension));
    }
    for (int s : squares_) {
      if (s != 1 && s != -1 && s != 0) {
        throw std::invalid_argument(
            fmt::format("basis vector square must be +1, -1 or 0, got {}", s));
      }
    }
    if (labels_.empty()) {
      for (size_t i = 0; i < squares_.size(); ++i) {
        labels_.push_back(fmt::format("e{}", i + 1));
      }
    } else if (labels_.size() != squares_.size()) {
      throw std::invalid_argument("metric needs exactly one label per basis vector");
    }
    build_table();
  }

  /// \brief Metric of a compile-time `Signature` (positive, negative, null).
  template <IsSignature Sig>
  static Metric from_signature(std::vector<std::string> labels = {}) {
    std::vector<int> squares;
    squares.reserve(Sig::dim);
    for (int i = 0; i < Sig::dim; ++i) {
      squares.push_back(get_basis_metric<Sig>(i));
    }
    return Metric(std::move(squares), std::move(labels));
  }

  [[nodiscard]] int dimension() const { return static_cast<int>(squares_.size()); }

  /// \brief Number of basis blades, `2^dimension`.
  [[nodiscard]] size_t size() const { return size_t{1} << squares_.size(); }

  /// \brief Mask with every basis vector set.
  [[nodiscard]] BladeMask pseudoscalar_mask() const {
    return static_cast<BladeMask>(size() - 1);
  }

  [[nodiscard]] bool contains(BladeMask mask) const { return mask < size(); }

  /**
   * \brief Square of basis vector `index`.
   * \throws OutOfRangeBlade when `index` is not a basis vector of this metric.
   */
  [[nodiscard]] int square(int index) const {
    if (index < 0 || index >= dimension()) {
      throw OutOfRangeBlade(fmt::format("basis index {} outside [0, {})", index,
                                        dimension()));
    }
    return squares_[static_cast<size_t>(index)];
  }

  /// \throws OutOfRangeBlade when `mask` has a bit outside this metric.
  void check_blade(BladeMask mask) const {
    if (!contains(mask)) {
      throw OutOfRangeBlade(fmt::format("blade mask {:#b} outside a {}-dimensional metric",
                                        mask, dimension()));
    }
  }

  /**
   * \brief Table lookup of the sign of `e_a * e_b`.
   * \return `1`, `-1`, or `0` when a collapsed factor is null.
   */
  [[nodiscard]] int product_sign(BladeMask a, BladeMask b) const {
    check_blade(a);
    check_blade(b);
    return table_[a * size() + b];
  }

  [[nodiscard]] const std::vector<int> &squares() const { return squares_; }
  [[nodiscard]] const std::vector<std::string> &labels() const { return labels_; }

  bool operator==(const Metric &other) const { return squares_ == other.squares_; }

private:
  void build_table();

  std::vector<int> squares_;
  std::vector<std::string> labels_;
  /// \brief Row-major `size() x size()` product signs.
  std::vector<std::int8_t> table_;
};

/// \brief Result of multiplying two basis blades.
struct BladeProduct {
  BladeMask mask = 0;
  int sign = 1;

  bool operator==(const BladeProduct &) const = default;
};

/**
 * \brief Product of basis blades `e_a * e_b` under `metric`.
 *
 * The factors of `a` then `b` are swapped into ascending order (negating on
 * every swap) and each adjacent equal pair collapses to the metric square of
 * its index. A null square makes the whole factor `0`.
 * \throws OutOfRangeBlade when either mask has a bit outside `metric`.
 */
inline BladeProduct blade_product(BladeMask a, BladeMask b, const Metric &metric) {
  metric.check_blade(a);
  metric.check_blade(b);

  int sign = reordering_sign(a, b);
  BladeMask intersection = a & b;
  while (intersection != 0 && sign != 0) {
    const int i = std::countr_zero(intersection);
    sign *= metric.square(i);
    intersection &= intersection - 1;
  }
  return {a ^ b, sign};
}

inline void Metric::build_table() {
  const size_t n = size();
  table_.assign(n * n, 0);
  for (BladeMask i = 0; i < n; ++i) {
    for (BladeMask j = 0; j < n; ++j) {
      table_[i * n + j] = static_cast<std::int8_t>(blade_product(i, j, *this).sign);
    }
  }
}

} // namespace clifford::core
