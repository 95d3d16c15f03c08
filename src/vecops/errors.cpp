#include "vecops/errors.hpp"

#include <sstream>
#include <utility>

namespace vecops {
namespace {

std::string describeShape(const std::string& operation, ShapeMismatch::Kind kind,
                          std::size_t lhsSize, std::size_t rhsSize, std::size_t row) {
    std::ostringstream oss;
    oss << operation << ": ";
    switch (kind) {
        case ShapeMismatch::Kind::LengthMismatch:
            oss << "vector lengths differ (" << lhsSize << " vs " << rhsSize << ")";
            break;
        case ShapeMismatch::Kind::RaggedMatrix:
            oss << "matrix is not rectangular (row 0 has " << lhsSize << " columns, row " << row
                << " has " << rhsSize << ")";
            break;
        case ShapeMismatch::Kind::ColumnMismatch:
            oss << "matrix has " << lhsSize << " columns but vector has " << rhsSize << " elements";
            break;
        case ShapeMismatch::Kind::RowMismatch:
            oss << "matrix has " << lhsSize << " rows but vector has " << rhsSize << " elements";
            break;
        case ShapeMismatch::Kind::NotSquare:
            oss << "matrix must be square (" << lhsSize << " rows, " << rhsSize << " columns)";
            break;
    }
    return oss.str();
}

std::string describeOverflow(const std::string& operation, std::size_t index, Accumulator value) {
    std::ostringstream oss;
    oss << operation << ": result " << value << " at index " << index
        << " exceeds the 32-bit integer range";
    return oss.str();
}

}  // namespace

ShapeMismatch::ShapeMismatch(std::string operation, Kind kind, std::size_t lhsSize,
                             std::size_t rhsSize, std::size_t row)
    : std::invalid_argument(describeShape(operation, kind, lhsSize, rhsSize, row)),
      operation_(std::move(operation)),
      kind_(kind),
      lhsSize_(lhsSize),
      rhsSize_(rhsSize),
      row_(row) {}

Overflow::Overflow(std::string operation, std::size_t index, Accumulator value)
    : std::overflow_error(describeOverflow(operation, index, value)),
      operation_(std::move(operation)),
      index_(index),
      value_(value) {}

const char* toString(ShapeMismatch::Kind kind) {
    switch (kind) {
        case ShapeMismatch::Kind::LengthMismatch:
            return "length_mismatch";
        case ShapeMismatch::Kind::RaggedMatrix:
            return "ragged_matrix";
        case ShapeMismatch::Kind::ColumnMismatch:
            return "column_mismatch";
        case ShapeMismatch::Kind::RowMismatch:
            return "row_mismatch";
        case ShapeMismatch::Kind::NotSquare:
            return "not_square";
    }
    return "unknown";
}

}  // namespace vecops
