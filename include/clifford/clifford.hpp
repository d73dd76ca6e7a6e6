#pragma once

/// \file
/// \brief Umbrella header for the public clifford API.

#include <clifford/core/algebra.hpp>
#include <clifford/core/blades.hpp>
#include <clifford/core/dense.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/metric.hpp>
#include <clifford/core/multivector.hpp>
#include <clifford/core/outermorphism.hpp>
#include <clifford/core/parallel.hpp>
#include <clifford/core/signature.hpp>
#include <clifford/core/tolerance.hpp>

#include <clifford/cga/codec.hpp>
#include <clifford/cga/conformal.hpp>
#include <clifford/cga/layout.hpp>
#include <clifford/cga/objects.hpp>

#include <clifford/io/format.hpp>

#include <clifford/ops/batch.hpp>
