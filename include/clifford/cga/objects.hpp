#pragma once
#include <cmath>
#include <variant>

#include <Eigen/Dense>

namespace clifford::cga {

/// The null vector `o`.
struct OriginPoint {
  bool operator==(const OriginPoint &) const = default;
};

/// The null vector `inf`.
struct PointAtInfinity {
  bool operator==(const PointAtInfinity &) const = default;
};

struct Point {
  Eigen::Vector3d location = Eigen::Vector3d::Zero();

  bool operator==(const Point &other) const { return location == other.location; }
};

/**
 * \brief Sphere (circle in 2D) with a real or imaginary radius.
 *
 * An imaginary sphere of magnitude `r` has `radius_squared() == -r^2`. It has
 * no real points but is a valid operand for products and sandwiches.
 */
struct Sphere {
  Eigen::Vector3d center = Eigen::Vector3d::Zero();
  double radius = 0.0;
  bool imaginary = false;

  /// Signed square of the radius, negative for imaginary spheres.
  [[nodiscard]] double radius_squared() const {
    return imaginary ? -radius * radius : radius * radius;
  }

  static Sphere from_radius_squared(const Eigen::Vector3d &center, double r2) {
    return {center, std::sqrt(std::abs(r2)), r2 < 0.0};
  }

  bool operator==(const Sphere &other) const {
    return center == other.center && radius == other.radius &&
           imaginary == other.imaginary;
  }
};

/// Plane (line in 2D) `{x : normal . x = distance}`.
struct Plane {
  Eigen::Vector3d normal = Eigen::Vector3d::UnitZ();
  double distance = 0.0;

  bool operator==(const Plane &other) const {
    return normal == other.normal && distance == other.distance;
  }
};

/// Closed set of shapes a conformal vector can encode.
using GeometricObject =
    std::variant<OriginPoint, PointAtInfinity, Point, Sphere, Plane>;

} // namespace clifford::cga
