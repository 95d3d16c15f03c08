#pragma once

#include "vecops/types.hpp"

#include <cstddef>
#include <string>

namespace vecops {

/**
 * @brief Throw ShapeMismatch(LengthMismatch) unless a and b have equal length.
 */
void requireSameLength(const std::string& operation, const Vector& a, const Vector& b);

[[nodiscard]] bool isRectangular(const Matrix& m);

/**
 * @brief Common row length of a rectangular matrix; 0 for a matrix without rows.
 *
 * Throws ShapeMismatch(RaggedMatrix) naming the first row whose length differs from row 0.
 */
[[nodiscard]] std::size_t columnCount(const std::string& operation, const Matrix& m);

}  // namespace vecops
