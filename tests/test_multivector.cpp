#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <clifford/core/multivector.hpp>

#include "support/tolerances.hpp"

using clifford::core::approx_equal;
using clifford::core::Multivector;

TEST_CASE("Sparse storage never keeps zero coefficients") {
  auto mv = Multivector::from_blade(0b11, 2.5);
  CHECK(mv[0b11] == doctest::Approx(2.5));
  CHECK(mv[0b01] == 0.0);
  CHECK(mv.size() == 1);

  mv.set(0b11, 0.0);
  CHECK(mv.is_zero());

  mv.add_term(0b1, 1.5);
  mv.add_term(0b1, -1.5);
  CHECK(mv.is_zero());

  CHECK(Multivector::from_blade(0b1, 0.0).is_zero());
  CHECK((Multivector::from_blade(0b1, 3.0) * 0.0).is_zero());
}

TEST_CASE("Linear arithmetic") {
  const auto a = Multivector::scalar(1.0) + Multivector::from_blade(0b1, 2.0);
  const auto b = Multivector::from_blade(0b1, -2.0) + Multivector::from_blade(0b110, 4.0);

  const auto sum = a + b;
  CHECK(sum.size() == 2);
  CHECK(sum.scalar_part() == doctest::Approx(1.0));
  CHECK(sum[0b110] == doctest::Approx(4.0));

  CHECK((a - a).is_zero());
  CHECK((-a)[0b1] == doctest::Approx(-2.0));
  CHECK((2.0 * b)[0b110] == doctest::Approx(8.0));
  CHECK((b / 4.0)[0b110] == doctest::Approx(1.0));
  CHECK(clifford::core::scale(a, 3.0) == a * 3.0);

  auto acc = a;
  acc += b;
  CHECK(acc == sum);
  acc -= b;
  CHECK(acc == a);
  acc *= 2.0;
  CHECK(acc.scalar_part() == doctest::Approx(2.0));
}

TEST_CASE("Grade queries and projection") {
  const auto mv = Multivector::scalar(1.0) + Multivector::from_blade(0b1, 1.0) +
                  Multivector::from_blade(0b11, 1.0);
  CHECK(mv.grades() == 0b111u);
  CHECK_FALSE(mv.is_homogeneous(1));

  const auto bivector = mv.grade_projection(2);
  CHECK(bivector == Multivector::from_blade(0b11, 1.0));
  CHECK(bivector.is_homogeneous(2));
  CHECK(clifford::core::grade(mv, 0) == Multivector::scalar(1.0));
  CHECK(mv.grade_projection(3).is_zero());

  CHECK(Multivector().is_homogeneous(1));
  CHECK(Multivector().is_homogeneous(4));

  // Grades no blade can have.
  CHECK_FALSE(mv.is_homogeneous(-1));
  CHECK_FALSE(mv.is_homogeneous(32));
  CHECK_FALSE(bivector.is_homogeneous(40));
  CHECK(Multivector().is_homogeneous(-1));
  CHECK(Multivector().is_homogeneous(64));
}

TEST_CASE("Reverse, involution and conjugation act per grade") {
  const auto e1 = Multivector::from_blade(0b1, 1.0);
  const auto e12 = Multivector::from_blade(0b11, 1.0);
  const auto e123 = Multivector::from_blade(0b111, 1.0);

  CHECK(e1.reverse() == e1);
  CHECK(e12.reverse() == -e12);
  CHECK(e123.reverse() == -e123);

  CHECK(e1.grade_involution() == -e1);
  CHECK(e12.grade_involution() == e12);

  CHECK(e1.conjugate() == -e1);
  CHECK(e12.conjugate() == -e12);
  CHECK(e123.conjugate() == e123);

  const auto mixed = Multivector::scalar(2.0) + e1 + e12 + e123;
  CHECK(mixed.reverse().reverse() == mixed);
}

TEST_CASE("Pruning and approximate comparison") {
  const auto mv = Multivector::from_blade(0b1, 1.0) + Multivector::from_blade(0b10, 1e-13);
  CHECK(mv.size() == 2);
  CHECK(mv.pruned(clifford::test_support::kTolTight).size() == 1);

  const auto nudged = Multivector::from_blade(0b1, 1.0 + 1e-10);
  CHECK(approx_equal(mv, nudged, clifford::test_support::kTolMedium));
  CHECK_FALSE(approx_equal(mv, nudged, 1e-11));
  CHECK_FALSE(mv == nudged);
}
