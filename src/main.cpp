#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include <clifford/clifford.hpp>

using namespace clifford;
using core::Multivector;

struct Config {
  std::string algebra;
  ops::ProductKind product = ops::ProductKind::Geometric;
  bool high_level = false;
};

static void print_usage() {
  fmt::print("Usage: clifford_table <cga2|cga3|pga2|pga3> <product> [--high]\n"
             "Products: gp, wedge, dot, lc, rc, vee, commutator, anticommutator\n"
             "  --high   label conformal tables with inf and o instead of p and n\n");
}

static bool parse_args(int argc, char **argv, Config &cfg) {
  std::vector<std::string_view> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return false;
    }
    if (arg == "--high") {
      cfg.high_level = true;
      continue;
    }
    positional.push_back(arg);
  }
  if (positional.size() != 2) {
    return false;
  }

  cfg.algebra = std::string(positional[0]);
  const auto product = ops::product_kind_from_string(positional[1]);
  if (!product) {
    fmt::print(stderr, "Unknown product: {}\n", positional[1]);
    return false;
  }
  cfg.product = *product;
  return true;
}

// ==================================================================================
// TABLES
// ==================================================================================

static void print_table(const std::vector<std::string> &headers,
                        const std::vector<std::vector<std::string>> &rows) {
  size_t width = 1;
  for (const auto &h : headers)
    width = std::max(width, h.size());
  for (const auto &row : rows)
    for (const auto &cell : row)
      width = std::max(width, cell.size());

  fmt::print("{:>{}} |", "", width);
  for (const auto &h : headers)
    fmt::print(" {:>{}}", h, width);
  fmt::print("\n");

  for (size_t r = 0; r < rows.size(); ++r) {
    fmt::print("{:>{}} |", headers[r], width);
    for (const auto &cell : rows[r])
      fmt::print(" {:>{}}", cell, width);
    fmt::print("\n");
  }
}

static std::string header_of(core::BladeMask mask, const std::vector<std::string> &labels) {
  const std::string label = core::blade_label(mask, labels);
  return label.empty() ? "1" : label;
}

static int run_algebra_table(const core::Algebra &algebra, ops::ProductKind kind) {
  const auto table = ops::multiplication_table(algebra, kind);
  const auto &labels = algebra.metric().labels();

  std::vector<std::string> headers;
  for (auto mask : table.blades)
    headers.push_back(header_of(mask, labels));

  std::vector<std::vector<std::string>> rows(table.blades.size());
  for (size_t r = 0; r < table.blades.size(); ++r)
    for (size_t c = 0; c < table.blades.size(); ++c)
      rows[r].push_back(io::to_string(table.at(r, c), labels));

  print_table(headers, rows);
  return 0;
}

// Rows and columns are high-level blades; products run in the low-level basis.
static int run_high_level_table(const cga::Conformal &conformal, ops::ProductKind kind) {
  const auto &layout = conformal.layout();
  const auto labels = layout.high_level_labels();
  const auto blades = core::blades_by_grade(layout.dimension());

  std::vector<std::string> headers;
  std::vector<Multivector> low;
  for (auto mask : blades) {
    headers.push_back(header_of(mask, labels));
    low.push_back(layout.to_low_level(Multivector::from_blade(mask, 1.0)));
  }

  std::vector<std::vector<std::string>> rows(blades.size());
  for (size_t r = 0; r < blades.size(); ++r) {
    for (size_t c = 0; c < blades.size(); ++c) {
      const Multivector product = ops::apply_product(conformal.algebra(), kind, low[r], low[c]);
      rows[r].push_back(io::to_string(conformal.to_high_level(product), labels));
    }
  }

  print_table(headers, rows);
  return 0;
}

static std::optional<core::Algebra> projective_algebra(std::string_view name) {
  if (name == "pga2")
    return core::Algebra(core::Metric::from_signature<core::PGA2D>({"x", "y", "o"}));
  if (name == "pga3")
    return core::Algebra(core::Metric::from_signature<core::PGA3D>({"x", "y", "z", "o"}));
  return std::nullopt;
}

int main(int argc, char **argv) {
  Config cfg;
  if (!parse_args(argc, argv, cfg)) {
    print_usage();
    return 1;
  }

  try {
    if (cfg.algebra == "cga2" || cfg.algebra == "cga3") {
      const auto conformal =
          cfg.algebra == "cga2" ? cga::Conformal::cga2d() : cga::Conformal::cga3d();
      return cfg.high_level ? run_high_level_table(conformal, cfg.product)
                            : run_algebra_table(conformal.algebra(), cfg.product);
    }
    if (auto algebra = projective_algebra(cfg.algebra)) {
      if (cfg.high_level) {
        fmt::print(stderr, "--high only applies to conformal algebras\n");
        return 1;
      }
      return run_algebra_table(*algebra, cfg.product);
    }
  } catch (const std::exception &e) {
    fmt::print(stderr, "Error: {}\n", e.what());
    return 1;
  }

  fmt::print(stderr, "Unknown algebra: {}\n", cfg.algebra);
  print_usage();
  return 1;
}
