#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <numbers>
#include <stdexcept>

#include <clifford/core/algebra.hpp>
#include <clifford/core/signature.hpp>

#include "support/test_env.hpp"
#include "support/tolerances.hpp"

using namespace clifford;
using core::Algebra;
using core::approx_equal;
using core::BladeMask;
using core::Metric;
using core::Multivector;

static Algebra make_algebra(Metric metric) {
  test_support::configure_deterministic_test_env();
  return Algebra(std::move(metric));
}

// ============================================================================
// TEST SUITE 1: Euclidean 3D (Cl(3, 0, 0))
// ============================================================================
TEST_CASE("Euclidean 3D geometric algebra") {
  const auto alg = make_algebra(Metric::from_signature<core::Euclidean3D>());
  const auto e1 = alg.basis_vector(0);
  const auto e2 = alg.basis_vector(1);
  const auto e3 = alg.basis_vector(2);

  SUBCASE("Generators square to +1") {
    CHECK(alg.geometric(e1, e1) == alg.scalar(1.0));
    CHECK(alg.geometric(e3, e3) == alg.scalar(1.0));
  }

  SUBCASE("Anti-commutativity (e1 e2 = -e2 e1)") {
    const auto e12 = alg.geometric(e1, e2);
    CHECK(e12[0b11] == doctest::Approx(1.0));
    CHECK(alg.geometric(e2, e1)[0b11] == doctest::Approx(-1.0));
    CHECK((e12 + alg.geometric(e2, e1)).is_zero());
  }

  SUBCASE("The pseudoscalar squares to -1") {
    const auto I = alg.geometric(alg.geometric(e1, e2), e3);
    CHECK(I == alg.pseudoscalar());
    CHECK(alg.geometric(I, I) == alg.scalar(-1.0));
  }

  SUBCASE("Vector product splits into inner and outer parts") {
    const auto a = e1 * 1.5 + e2 * -2.0 + e3 * 0.25;
    const auto b = e1 * 0.5 + e2 * 3.0 - e3;
    const auto gp = alg.geometric(a, b);
    CHECK(approx_equal(gp, alg.dot(a, b) + alg.wedge(a, b), test_support::kTolTight));
    CHECK(alg.dot(a, b).scalar_part() == doctest::Approx(0.75 - 6.0 - 0.25));
    CHECK(alg.wedge(a, a).is_zero());
  }

  SUBCASE("Reflection and rotation") {
    CHECK(alg.sandwich(e1, e2) == -e2);

    const double half = std::numbers::pi / 4.0;
    const auto rotor = alg.scalar(std::cos(half)) - alg.blade(0b11, std::sin(half));
    CHECK(approx_equal(alg.sandwich(rotor, e1), e2, test_support::kTolTight));
    CHECK(approx_equal(alg.sandwich(rotor, e3), e3, test_support::kTolTight));
  }
}

// ============================================================================
// TEST SUITE 2: Spacetime Algebra (Cl(1, 3, 0))
// ============================================================================
TEST_CASE("Spacetime algebra") {
  const auto alg = make_algebra(Metric::from_signature<core::Signature<1, 3>>());
  const auto t = alg.basis_vector(0);
  const auto x = alg.basis_vector(1);

  CHECK(alg.geometric(t, t) == alg.scalar(1.0));
  CHECK(alg.geometric(x, x) == alg.scalar(-1.0));

  // A boost generator squares to +1.
  const auto tx = alg.geometric(t, x);
  CHECK(alg.geometric(tx, tx) == alg.scalar(1.0));
}

// ============================================================================
// TEST SUITE 3: Projective GA (Cl(3, 0, 1))
// ============================================================================
TEST_CASE("Projective algebra with a null vector") {
  const auto alg = make_algebra(Metric::from_signature<core::PGA3D>());
  const auto e0 = alg.basis_vector(3);
  CHECK(alg.geometric(e0, e0).is_zero());

  const auto e10 = alg.geometric(alg.basis_vector(0), e0);
  CHECK(alg.geometric(e10, e10).is_zero());
  CHECK_THROWS_AS((void)alg.inverse(e0), std::invalid_argument);
}

// ============================================================================
// TEST SUITE 4: Identities over every basis blade of CGA 3D
// ============================================================================
TEST_CASE("Conformal basis identities") {
  const auto alg = make_algebra(Metric({1, 1, 1, 1, -1}));
  const auto blades = core::blades_by_grade(alg.dimension());

  SUBCASE("Geometric product is associative on basis blades") {
    for (BladeMask a : blades) {
      for (BladeMask b : blades) {
        for (BladeMask c : blades) {
          const auto A = alg.blade(a);
          const auto B = alg.blade(b);
          const auto C = alg.blade(c);
          CHECK(alg.geometric(alg.geometric(A, B), C) ==
                alg.geometric(A, alg.geometric(B, C)));
        }
      }
    }
  }

  SUBCASE("Distinct basis vectors anticommute and square to the metric") {
    for (int i = 0; i < alg.dimension(); ++i) {
      const auto ei = alg.basis_vector(i);
      CHECK(alg.dot(ei, ei) == alg.scalar(alg.metric().square(i)));
      for (int j = i + 1; j < alg.dimension(); ++j) {
        const auto ej = alg.basis_vector(j);
        CHECK(alg.geometric(ei, ej) == -alg.geometric(ej, ei));
        CHECK(alg.wedge(ei, ej) == -alg.wedge(ej, ei));
        CHECK(alg.geometric(ei, ej) == alg.wedge(ei, ej));
        CHECK(alg.dot(ei, ej).is_zero());
      }
    }
  }

  SUBCASE("Null vectors built from p and n") {
    const auto p = alg.basis_vector(3);
    const auto n = alg.basis_vector(4);
    const auto inf = n + p;
    const auto o = (n - p) * 0.5;

    CHECK(alg.geometric(inf, inf).is_zero());
    CHECK(alg.geometric(o, o).is_zero());
    CHECK(alg.dot(inf, o) == alg.scalar(-1.0));
    CHECK(alg.dot(o, inf) == alg.scalar(-1.0));
  }
}

TEST_CASE("Contractions, scalar product and commutators") {
  const auto alg = make_algebra(Metric::from_signature<core::Euclidean3D>());
  const auto e1 = alg.basis_vector(0);
  const auto e2 = alg.basis_vector(1);
  const auto e12 = alg.blade(0b11);

  CHECK(alg.left_contraction(e1, e12) == e2);
  CHECK(alg.left_contraction(e12, e1).is_zero());
  CHECK(alg.right_contraction(e12, e1) == -e2);
  CHECK(alg.right_contraction(e1, e12).is_zero());

  CHECK(alg.scalar_product(e1 + e2, e1 + e2) == doctest::Approx(2.0));
  CHECK(alg.norm_squared(e12) == doctest::Approx(1.0));

  CHECK(alg.commutator(e1, e2) == e12);
  CHECK(alg.commutator(e1, e1).is_zero());
  CHECK(alg.anticommutator(e1, e1) == alg.scalar(1.0));
  CHECK(alg.anticommutator(e1, e2).is_zero());
}

TEST_CASE("Duality and the regressive product") {
  SUBCASE("Dual of a projective vector") {
    const auto alg = make_algebra(Metric::from_signature<core::PGA2D>({"x", "y", "o"}));
    const auto v = alg.blade(0b001, 1.0) + alg.blade(0b010, 2.0) + alg.blade(0b100, 3.0);
    const auto d = alg.dual(v);
    // Coefficients on xy, xo, yo.
    CHECK(d[0b011] == doctest::Approx(3.0));
    CHECK(d[0b101] == doctest::Approx(-2.0));
    CHECK(d[0b110] == doctest::Approx(1.0));
    CHECK(alg.undual(d) == v);
  }

  SUBCASE("Dual is the right complement") {
    const auto alg = make_algebra(Metric::from_signature<core::CGA3D>());
    for (BladeMask mask : core::blades_by_grade(alg.dimension())) {
      const auto blade = alg.blade(mask);
      CHECK(alg.wedge(blade, alg.dual(blade)) == alg.pseudoscalar());
      CHECK(alg.undual(alg.dual(blade)) == blade);
    }
    CHECK(alg.dual(alg.scalar(1.0)) == alg.pseudoscalar());
    CHECK(alg.dual(alg.pseudoscalar()) == alg.scalar(1.0));
  }

  SUBCASE("Meet of two planes through the origin") {
    const auto alg = make_algebra(Metric::from_signature<core::Euclidean3D>());
    CHECK(alg.regressive(alg.blade(0b011), alg.blade(0b110)) == alg.blade(0b010));
    CHECK(alg.regressive(alg.pseudoscalar(), alg.blade(0b101)) == alg.blade(0b101));
  }
}

TEST_CASE("Versor inverse and transform") {
  const auto alg = make_algebra(Metric::from_signature<core::Euclidean3D>());
  const auto e1 = alg.basis_vector(0);
  const auto e2 = alg.basis_vector(1);
  const auto e12 = alg.blade(0b11);

  CHECK(alg.inverse(e1 * 2.0) == e1 * 0.5);
  CHECK(alg.inverse(e12) == -e12);
  CHECK(alg.geometric(e12, alg.inverse(e12)) == alg.scalar(1.0));

  // Scaling the versor does not change the transform.
  CHECK(alg.transform(e1 * 2.0, e2) == -e2);
  CHECK(alg.sandwich(e1 * 2.0, e2) == e2 * -4.0);

  CHECK_THROWS_AS((void)alg.inverse(Multivector()), std::invalid_argument);
  CHECK_THROWS_AS((void)alg.inverse(alg.scalar(1.0) + e1), std::invalid_argument);
}

TEST_CASE("Range checks and pruning tolerance") {
  test_support::configure_deterministic_test_env();
  const Algebra alg(Metric::from_signature<core::Euclidean3D>(), 1e-6);
  CHECK(alg.epsilon() == doctest::Approx(1e-6));

  CHECK_THROWS_AS((void)alg.basis_vector(3), core::OutOfRangeBlade);
  CHECK_THROWS_AS((void)alg.blade(8), core::OutOfRangeBlade);
  CHECK_THROWS_AS((void)alg.geometric(Multivector::from_blade(8, 1.0), alg.scalar(1.0)),
                  core::OutOfRangeBlade);

  CHECK(alg.geometric(alg.scalar(1e-7), alg.basis_vector(0)).is_zero());
  CHECK_FALSE(alg.geometric(alg.scalar(1e-5), alg.basis_vector(0)).is_zero());

  setenv("CLIFFORD_EPSILON", "1e-3", 1);
  CHECK(Algebra(Metric({1})).epsilon() == doctest::Approx(1e-3));
  setenv("CLIFFORD_EPSILON", "bogus", 1);
  CHECK(Algebra(Metric({1})).epsilon() == doctest::Approx(core::kDefaultEpsilon));
  setenv("CLIFFORD_EPSILON", "-1", 1);
  CHECK(Algebra(Metric({1})).epsilon() == doctest::Approx(core::kDefaultEpsilon));
  unsetenv("CLIFFORD_EPSILON");
}
