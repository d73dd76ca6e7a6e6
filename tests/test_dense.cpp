#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <array>
#include <random>

#include <clifford/core/algebra.hpp>
#include <clifford/core/dense.hpp>

#include "support/test_env.hpp"
#include "support/tolerances.hpp"

using namespace clifford;
using core::approx_equal;
using core::BladeMask;
using core::Multivector;
using Sig = core::CGA3D;

static Multivector random_multivector(std::mt19937 &rng) {
  std::uniform_real_distribution<double> coeff(-2.0, 2.0);
  std::bernoulli_distribution keep(0.5);
  Multivector mv;
  for (BladeMask mask = 0; mask < Sig::size; ++mask) {
    if (keep(rng)) {
      mv.set(mask, coeff(rng));
    }
  }
  return mv;
}

TEST_CASE("Dense kernel agrees with the sparse product engine") {
  test_support::configure_deterministic_test_env();
  const core::Algebra alg(core::Metric::from_signature<Sig>());
  std::mt19937 rng(1234);

  for (int trial = 0; trial < 20; ++trial) {
    const auto a = random_multivector(rng);
    const auto b = random_multivector(rng);
    const auto da = core::to_dense<Sig>(a);
    const auto db = core::to_dense<Sig>(b);

    CHECK(approx_equal(core::to_sparse(da * db), alg.geometric(a, b),
                       test_support::kTolMedium));
    CHECK(approx_equal(core::to_sparse(da ^ db), alg.wedge(a, b),
                       test_support::kTolMedium));
    CHECK(core::to_sparse(da.reverse()) == a.reverse());
    CHECK(approx_equal(core::to_sparse(da.sandwich(db)), alg.sandwich(a, b),
                       test_support::kTolLoose));
  }
}

TEST_CASE("Dense conversion round trips and range checks") {
  const auto mv = Multivector::from_blade(0b10010, -3.0) + Multivector::scalar(0.5);
  const auto dense = core::to_dense<Sig>(mv);
  CHECK(dense[0b10010] == doctest::Approx(-3.0));
  CHECK(dense[0] == doctest::Approx(0.5));
  CHECK(core::to_sparse(dense) == mv);

  CHECK_THROWS_AS((void)core::to_dense<Sig>(Multivector::from_blade(32, 1.0)),
                  core::OutOfRangeBlade);
  CHECK_THROWS_AS((void)core::to_dense<core::CGA2D>(Multivector::from_blade(16, 1.0)),
                  core::OutOfRangeBlade);
}

TEST_CASE("Every SIMD lane computes an independent product") {
  using core::Packet;
  constexpr size_t kLanes = Packet::size;

  std::mt19937 rng(99);
  const auto a = core::to_dense<Sig>(random_multivector(rng));
  std::array<core::DenseMultivector<double, Sig>, kLanes> rhs;
  core::WideMultivector<Sig> wide_rhs;
  for (size_t i = 0; i < Sig::size; ++i) {
    std::array<double, kLanes> lane_values{};
    for (size_t lane = 0; lane < kLanes; ++lane) {
      lane_values[lane] = static_cast<double>(lane + 1) * static_cast<double>(i % 5) - 1.0;
      rhs[lane].data[i] = lane_values[lane];
    }
    wide_rhs.data[i] = Packet::load_unaligned(lane_values.data());
  }

  const auto wide = core::broadcast(a) * wide_rhs;
  for (size_t i = 0; i < Sig::size; ++i) {
    std::array<double, kLanes> lanes{};
    wide.data[i].store_unaligned(lanes.data());
    for (size_t lane = 0; lane < kLanes; ++lane) {
      CHECK(lanes[lane] == doctest::Approx((a * rhs[lane])[i]));
    }
  }
}
