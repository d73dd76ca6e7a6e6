#pragma once
#include <string>

#include <Eigen/Dense>

#include <clifford/cga/codec.hpp>
#include <clifford/cga/layout.hpp>
#include <clifford/cga/objects.hpp>
#include <clifford/core/algebra.hpp>
#include <clifford/core/tolerance.hpp>
#include <clifford/io/format.hpp>

namespace clifford::cga {

/**
 * \brief Conformal geometric algebra in 2D or 3D.
 *
 * Bundles a `ConformalLayout` with the product engine over its low-level
 * metric. All multivectors passed in and returned are low-level unless the
 * method name says otherwise.
 */
class Conformal {
public:
  explicit Conformal(ConformalLayout layout,
                     double epsilon = core::epsilon_from_env())
      : layout_(layout), algebra_(layout.metric(), epsilon) {}

  static Conformal cga2d() { return Conformal(ConformalLayout::cga2d()); }
  static Conformal cga3d() { return Conformal(ConformalLayout::cga3d()); }

  [[nodiscard]] const ConformalLayout &layout() const { return layout_; }
  [[nodiscard]] const core::Algebra &algebra() const { return algebra_; }
  [[nodiscard]] double epsilon() const { return algebra_.epsilon(); }

  // --- Construction ---
  [[nodiscard]] Multivector basis_vector(int index) const {
    return algebra_.basis_vector(index);
  }
  [[nodiscard]] Multivector scalar(double value) const { return algebra_.scalar(value); }
  [[nodiscard]] Multivector infinity() const { return layout_.infinity(); }
  [[nodiscard]] Multivector origin() const { return layout_.origin(); }

  [[nodiscard]] Multivector encode_sphere(const Eigen::Vector3d &center,
                                          double radius) const {
    return cga::encode_sphere(layout_, center, radius);
  }
  [[nodiscard]] Multivector encode_sphere(const Sphere &sphere) const {
    return cga::encode_sphere(layout_, sphere);
  }
  [[nodiscard]] Multivector encode_plane(const Eigen::Vector3d &normal,
                                         double distance) const {
    return cga::encode_plane(layout_, normal, distance);
  }
  [[nodiscard]] Multivector encode(const GeometricObject &object) const {
    return cga::encode(layout_, object);
  }
  [[nodiscard]] Multivector up(const Eigen::Vector3d &x) const {
    return cga::up(layout_, x);
  }

  // --- Products ---
  [[nodiscard]] Multivector geometric(const Multivector &a, const Multivector &b) const {
    return algebra_.geometric(a, b);
  }
  [[nodiscard]] Multivector wedge(const Multivector &a, const Multivector &b) const {
    return algebra_.wedge(a, b);
  }
  [[nodiscard]] Multivector dot(const Multivector &a, const Multivector &b) const {
    return algebra_.dot(a, b);
  }
  [[nodiscard]] Multivector sandwich(const Multivector &v, const Multivector &x) const {
    return algebra_.sandwich(v, x);
  }

  // --- Basis conversion ---
  [[nodiscard]] Multivector to_high_level(const Multivector &low) const {
    return layout_.to_high_level(low);
  }
  [[nodiscard]] Multivector to_low_level(const Multivector &high) const {
    return layout_.to_low_level(high);
  }

  // --- Decoding ---
  [[nodiscard]] Sphere decode_sphere(const Multivector &mv) const {
    return cga::decode_sphere(layout_, mv, epsilon());
  }
  [[nodiscard]] Plane decode_plane(const Multivector &mv) const {
    return cga::decode_plane(layout_, mv, epsilon());
  }
  [[nodiscard]] GeometricObject decode(const Multivector &mv) const {
    return cga::decode(layout_, mv, epsilon());
  }
  [[nodiscard]] Eigen::Vector3d down(const Multivector &mv) const {
    return cga::down(layout_, mv, epsilon());
  }
  [[nodiscard]] Multivector grade(const Multivector &mv, int k) const {
    return mv.grade_projection(k);
  }

  // --- Display ---
  [[nodiscard]] std::string format(const Multivector &low) const {
    return io::to_string(low, layout_.low_level_labels());
  }
  [[nodiscard]] std::string format_high_level(const Multivector &low) const {
    return io::to_string(to_high_level(low), layout_.high_level_labels());
  }

private:
  ConformalLayout layout_;
  core::Algebra algebra_;
};

} // namespace clifford::cga
