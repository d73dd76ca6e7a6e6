#pragma once

#include <stdexcept>
#include <string>

namespace clifford::core {

/// \brief A basis index or blade mask lies outside the configured metric.
class OutOfRangeBlade : public std::out_of_range {
public:
  explicit OutOfRangeBlade(const std::string &what) : std::out_of_range(what) {}
};

/**
 * \brief A multivector cannot be decoded as the requested geometric object.
 *
 * Raised when the normalizing coefficient of a decode is zero, e.g. a sphere
 * decode of a plane. Callers recover by trying another decode variant.
 */
class DegenerateObjectError : public std::runtime_error {
public:
  explicit DegenerateObjectError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace clifford::core
