#pragma once
#include <algorithm>
#include <cmath>
#include <variant>

#include <Eigen/Dense>
#include <fmt/core.h>

#include <clifford/cga/layout.hpp>
#include <clifford/cga/objects.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/multivector.hpp>

namespace clifford::cga {

using core::DegenerateObjectError;

namespace detail {

// High-level vector `real + inf_coeff * inf + o_coeff * o`, in the low-level
// basis.
inline Multivector compose(const ConformalLayout &layout,
                           const Eigen::Vector3d &real, double inf_coeff,
                           double o_coeff) {
  Multivector high;
  for (int i = 0; i < 3; ++i) {
    if (real[i] == 0.0) {
      continue;
    }
    if (i >= layout.real_dims) {
      throw core::OutOfRangeBlade(fmt::format(
          "component {} set on a {}-dimensional conformal layout", i, layout.real_dims));
    }
    high.set(BladeMask{1} << i, real[i]);
  }
  high.set(layout.infinity_mask(), inf_coeff);
  high.set(layout.origin_mask(), o_coeff);
  return layout.to_low_level(high);
}

// Grade-1 high-level view of `mv`. `scale` is the largest coefficient
// magnitude; every classification threshold is `epsilon` relative to it.
struct Components {
  Eigen::Vector3d real = Eigen::Vector3d::Zero();
  double inf = 0.0;
  double o = 0.0;
  double scale = 0.0;
};

// Terms outside grade 1 that are within `epsilon * scale` are product residue
// and are dropped; anything larger is rejected.
inline Components split(const ConformalLayout &layout, const Multivector &mv,
                        double epsilon) {
  const Multivector high = layout.to_high_level(mv);
  Components out;
  for (const auto &[mask, coeff] : high) {
    out.scale = std::max(out.scale, std::abs(coeff));
  }
  for (const auto &[mask, coeff] : high) {
    if (core::grade(mask) != 1 && std::abs(coeff) > epsilon * out.scale) {
      throw DegenerateObjectError("only grade-1 conformal vectors encode geometric objects");
    }
  }
  for (int i = 0; i < layout.real_dims && i < 3; ++i) {
    out.real[i] = high[BladeMask{1} << i];
  }
  out.inf = high[layout.infinity_mask()];
  out.o = high[layout.origin_mask()];
  return out;
}

inline bool has_origin_weight(const Components &c, double epsilon) {
  return std::abs(c.o) > epsilon * c.scale;
}

// Center and radius once `o` is normalized to 1. In the low-level basis `o`
// is the difference of two coefficients the size of `inf`, so the rounding
// error of `o^2 r^2 = |real|^2 - 2 inf o` grows with `scale^2`.
inline Sphere sphere_from(const Components &c, double epsilon) {
  double weighted_r2 = c.real.squaredNorm() - 2.0 * c.inf * c.o;
  if (std::abs(weighted_r2) <= epsilon * c.scale * c.scale) {
    weighted_r2 = 0.0;
  }
  return Sphere::from_radius_squared(c.real / c.o, weighted_r2 / (c.o * c.o));
}

} // namespace detail

// ========================================================================
// ENCODE
// ========================================================================

/// `center + (|center|^2 - r^2)/2 inf + o`, with `r^2 < 0` when imaginary.
inline Multivector encode_sphere(const ConformalLayout &layout, const Sphere &sphere) {
  const double weight =
      0.5 * (sphere.center.squaredNorm() - sphere.radius_squared());
  return detail::compose(layout, sphere.center, weight, 1.0);
}

inline Multivector encode_sphere(const ConformalLayout &layout,
                                 const Eigen::Vector3d &center, double radius) {
  return encode_sphere(layout, Sphere{center, radius, false});
}

/// `normal + distance inf`
inline Multivector encode_plane(const ConformalLayout &layout, const Plane &plane) {
  return detail::compose(layout, plane.normal, plane.distance, 0.0);
}

inline Multivector encode_plane(const ConformalLayout &layout,
                                const Eigen::Vector3d &normal, double distance) {
  return encode_plane(layout, Plane{normal, distance});
}

/// `x + |x|^2/2 inf + o`
inline Multivector up(const ConformalLayout &layout, const Eigen::Vector3d &x) {
  return detail::compose(layout, x, 0.5 * x.squaredNorm(), 1.0);
}

inline Multivector encode(const ConformalLayout &layout, const GeometricObject &object) {
  struct Encoder {
    const ConformalLayout &layout;

    Multivector operator()(const OriginPoint &) const { return layout.origin(); }
    Multivector operator()(const PointAtInfinity &) const { return layout.infinity(); }
    Multivector operator()(const Point &p) const { return up(layout, p.location); }
    Multivector operator()(const Sphere &s) const { return encode_sphere(layout, s); }
    Multivector operator()(const Plane &p) const { return encode_plane(layout, p); }
  };
  return std::visit(Encoder{layout}, object);
}

// ========================================================================
// DECODE
// ========================================================================

/**
 * \brief Read center and radius after normalizing the `o` coefficient to 1.
 *
 * A negative `r^2` is reported as an imaginary sphere. A radius-0 sphere comes
 * back as a `Sphere` with `radius == 0`; `decode` classifies it as a point.
 * \throws DegenerateObjectError when the `o` coefficient is zero (a plane or
 * the point at infinity) or `mv` is not a vector.
 */
inline Sphere decode_sphere(const ConformalLayout &layout, const Multivector &mv,
                            double epsilon) {
  const auto c = detail::split(layout, mv, epsilon);
  if (!detail::has_origin_weight(c, epsilon)) {
    throw DegenerateObjectError(
        "o coefficient is zero; decode as a plane or the point at infinity");
  }
  return detail::sphere_from(c, epsilon);
}

/**
 * \brief Read a plane, rescaled to a unit normal.
 * \throws DegenerateObjectError when `mv` has an `o` component (a sphere or
 * point) or a zero normal (the point at infinity).
 */
inline Plane decode_plane(const ConformalLayout &layout, const Multivector &mv,
                          double epsilon) {
  const auto c = detail::split(layout, mv, epsilon);
  if (detail::has_origin_weight(c, epsilon)) {
    throw DegenerateObjectError("o coefficient is nonzero; decode as a sphere or point");
  }
  const double length = c.real.norm();
  if (length <= epsilon * c.scale) {
    throw DegenerateObjectError("plane normal is zero; decode as the point at infinity");
  }
  return Plane{Eigen::Vector3d(c.real / length), c.inf / length};
}

/// \brief Euclidean location of a point, after normalizing `o` to 1.
/// \throws DegenerateObjectError when the `o` coefficient is zero.
inline Eigen::Vector3d down(const ConformalLayout &layout, const Multivector &mv,
                            double epsilon) {
  const auto c = detail::split(layout, mv, epsilon);
  if (!detail::has_origin_weight(c, epsilon)) {
    throw DegenerateObjectError("o coefficient is zero; point lies at infinity");
  }
  return c.real / c.o;
}

/**
 * \brief Classify and decode any conformal vector.
 *
 * Nonzero `o`: origin, point (zero radius) or sphere. Zero `o`: plane when a
 * normal is present, else the point at infinity. "Zero" is relative to the
 * largest coefficient of `mv`, so any nonzero rescaling decodes the same way.
 * \throws DegenerateObjectError for the zero multivector or non-vectors.
 */
inline GeometricObject decode(const ConformalLayout &layout, const Multivector &mv,
                              double epsilon) {
  const auto c = detail::split(layout, mv, epsilon);
  if (detail::has_origin_weight(c, epsilon)) {
    const Sphere sphere = detail::sphere_from(c, epsilon);
    if (sphere.radius != 0.0) {
      return sphere;
    }
    if (sphere.center.norm() <= epsilon) {
      return OriginPoint{};
    }
    return Point{sphere.center};
  }
  if (c.real.norm() > epsilon * c.scale) {
    return decode_plane(layout, mv, epsilon);
  }
  if (c.inf != 0.0) {
    return PointAtInfinity{};
  }
  throw DegenerateObjectError("zero multivector encodes no geometric object");
}

} // namespace clifford::cga
