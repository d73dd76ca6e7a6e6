#include <benchmark/benchmark.h>

#include <Eigen/Dense>
#include <cstdlib>
#include <random>
#include <vector>

#include <clifford/cga/conformal.hpp>
#include <clifford/core/algebra.hpp>
#include <clifford/core/dense.hpp>
#include <clifford/ops/batch.hpp>

using namespace clifford;
using core::Multivector;
using Sig = core::CGA3D;

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() { setenv("CLIFFORD_BACKEND", "parallel", 0); }
} kBenchEnvSetup;
} // namespace

static Multivector random_multivector(std::mt19937 &rng, int dimension) {
  std::uniform_real_distribution<double> coeff(-1.0, 1.0);
  Multivector mv;
  for (core::BladeMask mask = 0; mask < (core::BladeMask{1} << dimension); ++mask) {
    mv.set(mask, coeff(rng));
  }
  return mv;
}

static std::vector<Eigen::Vector3d> make_cloud(size_t n_points) {
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> dist(-5.0, 5.0);
  std::vector<Eigen::Vector3d> points(n_points);
  for (auto &p : points) {
    p = Eigen::Vector3d(dist(rng), dist(rng), dist(rng));
  }
  return points;
}

static void BM_SparseGeometricProduct(benchmark::State &state) {
  const auto conformal = cga::Conformal::cga3d();
  std::mt19937 rng(7);
  const Multivector a = random_multivector(rng, conformal.layout().dimension());
  const Multivector b = random_multivector(rng, conformal.layout().dimension());
  for (auto _ : state) {
    benchmark::DoNotOptimize(conformal.geometric(a, b));
  }
}

static void BM_SparseVectorProduct(benchmark::State &state) {
  const auto conformal = cga::Conformal::cga3d();
  const Multivector a = conformal.encode_sphere(Eigen::Vector3d(1.0, 2.0, 3.0), 2.0);
  const Multivector b = conformal.up(Eigen::Vector3d(-1.0, 0.5, 4.0));
  for (auto _ : state) {
    benchmark::DoNotOptimize(conformal.geometric(a, b));
  }
}

static void BM_DenseGeometricProduct(benchmark::State &state) {
  const auto layout = cga::ConformalLayout::cga3d();
  std::mt19937 rng(7);
  const auto a = core::to_dense<Sig>(random_multivector(rng, layout.dimension()));
  const auto b = core::to_dense<Sig>(random_multivector(rng, layout.dimension()));
  for (auto _ : state) {
    auto c = a * b;
    benchmark::DoNotOptimize(c);
  }
}

static void BM_TransformPoints(benchmark::State &state) {
  const auto conformal = cga::Conformal::cga3d();
  const auto points = make_cloud(static_cast<size_t>(state.range(0)));
  // Inversion in the sphere of radius 2 about (1, 0, 0).
  const Multivector versor = conformal.encode_sphere(Eigen::Vector3d(1.0, 0.0, 0.0), 2.0);
  for (auto _ : state) {
    auto out = ops::transform_points<Sig>(conformal.layout(), versor, points);
    benchmark::DoNotOptimize(out.data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_SandwichAll(benchmark::State &state) {
  const auto conformal = cga::Conformal::cga3d();
  const auto cloud = make_cloud(static_cast<size_t>(state.range(0)));
  std::vector<Multivector> points;
  points.reserve(cloud.size());
  for (const auto &p : cloud) {
    points.push_back(conformal.up(p));
  }
  const Multivector versor = conformal.encode_sphere(Eigen::Vector3d(1.0, 0.0, 0.0), 2.0);
  for (auto _ : state) {
    auto out = ops::sandwich_all(conformal.algebra(), versor, points);
    benchmark::DoNotOptimize(out.data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_MultiplicationTable(benchmark::State &state) {
  const auto conformal = cga::Conformal::cga3d();
  for (auto _ : state) {
    auto table = ops::multiplication_table(conformal.algebra(), ops::ProductKind::Geometric);
    benchmark::DoNotOptimize(table.entries.data());
  }
}

BENCHMARK(BM_SparseGeometricProduct);
BENCHMARK(BM_SparseVectorProduct);
BENCHMARK(BM_DenseGeometricProduct);
BENCHMARK(BM_TransformPoints)->Arg(1000)->Arg(100000);
BENCHMARK(BM_SandwichAll)->Arg(1000)->Arg(10000);
BENCHMARK(BM_MultiplicationTable);

BENCHMARK_MAIN();
