// filename: errors.hpp
// part of Integer Vector Operations Library
// MIT License

#pragma once

#include "vecops/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vecops {

/**
 * @brief Thrown when operand dimensions are incompatible.
 *
 * lhsSize()/rhsSize() carry the two conflicting dimensions:
 *  - LengthMismatch: lengths of the two vectors.
 *  - RaggedMatrix: length of row 0 and length of row(); row() is the first offending row.
 *  - ColumnMismatch: matrix column count and vector length.
 *  - RowMismatch: matrix row count and vector length.
 *  - NotSquare: matrix row count and column count.
 */
class ShapeMismatch : public std::invalid_argument {
public:
    enum class Kind { LengthMismatch, RaggedMatrix, ColumnMismatch, RowMismatch, NotSquare };

    ShapeMismatch(std::string operation, Kind kind, std::size_t lhsSize, std::size_t rhsSize,
                  std::size_t row = 0);

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] std::size_t lhsSize() const noexcept { return lhsSize_; }
    [[nodiscard]] std::size_t rhsSize() const noexcept { return rhsSize_; }
    [[nodiscard]] std::size_t row() const noexcept { return row_; }

private:
    std::string operation_;
    Kind kind_;
    std::size_t lhsSize_;
    std::size_t rhsSize_;
    std::size_t row_;
};

/**
 * @brief Thrown when a result does not fit in Scalar.
 *
 * index() is the element (or matrix row) being computed and value() the exact
 * out-of-range result, which always fits in an Accumulator.
 */
class Overflow : public std::overflow_error {
public:
    Overflow(std::string operation, std::size_t index, Accumulator value);

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] Accumulator value() const noexcept { return value_; }

private:
    std::string operation_;
    std::size_t index_;
    Accumulator value_;
};

const char* toString(ShapeMismatch::Kind kind);

}  // namespace vecops
