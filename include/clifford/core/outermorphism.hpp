#pragma once
#include <bit>

#include <Eigen/Dense>

#include <clifford/core/blades.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/multivector.hpp>

namespace clifford::core {

/**
 * \brief Extend a linear map on vectors to all blades.
 *
 * Column `j` of `linear` is the image of basis vector `j`. Each blade is sent
 * to the outer product of the images of its factors, taken in ascending
 * order. Only exact cancellations are dropped, so maps with dyadic entries
 * compose without round-off.
 * \throws OutOfRangeBlade when `mv` has a blade outside the map's dimension.
 */
inline Multivector apply_outermorphism(const Multivector &mv,
                                       const Eigen::MatrixXd &linear) {
  const int dim = static_cast<int>(linear.cols());
  const BladeMask limit = BladeMask{1} << dim;

  Multivector result;
  for (const auto &[mask, coeff] : mv) {
    if (mask >= limit) {
      throw OutOfRangeBlade("blade outside the domain of the linear map");
    }

    // Wedge the factor images one at a time: image = f(e_i1) ^ f(e_i2) ^ ...
    Multivector image = Multivector::scalar(1.0);
    for (BladeMask rest = mask; rest != 0; rest &= rest - 1) {
      const int col = std::countr_zero(rest);
      Multivector next;
      for (const auto &[partial, value] : image) {
        for (int row = 0; row < linear.rows(); ++row) {
          const double entry = linear(row, col);
          if (entry == 0.0) {
            continue;
          }
          const BladeMask factor = BladeMask{1} << row;
          const int sign = wedge_sign(partial, factor);
          if (sign != 0) {
            next.add_term(partial | factor, sign * value * entry);
          }
        }
      }
      image = std::move(next);
    }

    for (const auto &[blade, value] : image) {
      result.add_term(blade, coeff * value);
    }
  }
  return result;
}

} // namespace clifford::core
