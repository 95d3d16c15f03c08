#include "vecops/shape.hpp"

#include "vecops/errors.hpp"

namespace vecops {

void requireSameLength(const std::string& operation, const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw ShapeMismatch(operation, ShapeMismatch::Kind::LengthMismatch, a.size(), b.size());
    }
}

bool isRectangular(const Matrix& m) {
    if (m.empty()) {
        return true;
    }
    const std::size_t cols = m.front().size();
    for (const Vector& row : m) {
        if (row.size() != cols) {
            return false;
        }
    }
    return true;
}

std::size_t columnCount(const std::string& operation, const Matrix& m) {
    if (m.empty()) {
        return 0;
    }
    const std::size_t cols = m.front().size();
    for (std::size_t r = 1; r < m.size(); ++r) {
        if (m[r].size() != cols) {
            throw ShapeMismatch(operation, ShapeMismatch::Kind::RaggedMatrix, cols, m[r].size(), r);
        }
    }
    return cols;
}

}  // namespace vecops
