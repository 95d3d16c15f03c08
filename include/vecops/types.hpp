// filename: types.hpp
// part of Integer Vector Operations Library
// MIT License

#pragma once

#include <cstdint>
#include <vector>

namespace vecops {

using Scalar = std::int32_t;

// Wide enough to hold any product of two Scalars plus one Scalar.
using Accumulator = std::int64_t;

using Vector = std::vector<Scalar>;

// Row-major: each element is one row.
using Matrix = std::vector<Vector>;

}  // namespace vecops
