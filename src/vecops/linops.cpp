#include "vecops/linops.hpp"

#include "vecops/errors.hpp"
#include "vecops/shape.hpp"

#include <cstddef>
#include <limits>

namespace vecops::linops {
namespace {

constexpr Accumulator kScalarMin = std::numeric_limits<Scalar>::min();
constexpr Accumulator kScalarMax = std::numeric_limits<Scalar>::max();

[[nodiscard]] bool fitsScalar(Accumulator value) {
    return value >= kScalarMin && value <= kScalarMax;
}

[[nodiscard]] Scalar narrowChecked(const char* operation, std::size_t index, Accumulator value) {
    if (!fitsScalar(value)) {
        throw Overflow(operation, index, value);
    }
    return static_cast<Scalar>(value);
}

// Partial sums are bounded by |Scalar| + |Scalar|^2, so the Accumulator never wraps.
[[nodiscard]] Scalar dotChecked(const char* operation, std::size_t index, std::size_t n,
                                const Scalar* a, const Scalar* b) {
    Accumulator accum = 0;
    for (std::size_t idx = 0; idx < n; ++idx) {
        accum += static_cast<Accumulator>(a[idx]) * static_cast<Accumulator>(b[idx]);
        if (!fitsScalar(accum)) {
            throw Overflow(operation, index, accum);
        }
    }
    return static_cast<Scalar>(accum);
}

}  // namespace

Vector add(const Vector& a, const Vector& b) {
    requireSameLength("add", a, b);
    Vector result(a.size());
    for (std::size_t idx = 0; idx < a.size(); ++idx) {
        const Accumulator sum = static_cast<Accumulator>(a[idx]) + static_cast<Accumulator>(b[idx]);
        result[idx] = narrowChecked("add", idx, sum);
    }
    return result;
}

Vector sub(const Vector& a, const Vector& b) {
    requireSameLength("sub", a, b);
    Vector result(a.size());
    for (std::size_t idx = 0; idx < a.size(); ++idx) {
        const Accumulator diff = static_cast<Accumulator>(a[idx]) - static_cast<Accumulator>(b[idx]);
        result[idx] = narrowChecked("sub", idx, diff);
    }
    return result;
}

Vector scale(const Vector& a, Scalar k) {
    Vector result(a.size());
    for (std::size_t idx = 0; idx < a.size(); ++idx) {
        const Accumulator product = static_cast<Accumulator>(a[idx]) * static_cast<Accumulator>(k);
        result[idx] = narrowChecked("scale", idx, product);
    }
    return result;
}

Scalar dot(const Vector& a, const Vector& b) {
    requireSameLength("dot", a, b);
    return dotChecked("dot", 0, a.size(), a.data(), b.data());
}

Vector matVecMul(const Matrix& m, const Vector& v) {
    if (m.empty()) {
        return {};
    }
    const std::size_t cols = columnCount("mat_vec_mul", m);
    if (cols != v.size()) {
        throw ShapeMismatch("mat_vec_mul", ShapeMismatch::Kind::ColumnMismatch, cols, v.size());
    }
    // Entry i pairs v[j] with m[j][i], which indexes both axes by the same range.
    if (cols > 0 && cols != m.size()) {
        throw ShapeMismatch("mat_vec_mul", ShapeMismatch::Kind::NotSquare, m.size(), cols);
    }

    Vector result(m.size(), 0);
    for (std::size_t i = 0; i < cols; ++i) {
        Accumulator accum = 0;
        for (std::size_t j = 0; j < cols; ++j) {
            accum += static_cast<Accumulator>(m[j][i]) * static_cast<Accumulator>(v[j]);
            if (!fitsScalar(accum)) {
                throw Overflow("mat_vec_mul", i, accum);
            }
        }
        result[i] = static_cast<Scalar>(accum);
    }
    return result;
}

Vector vecMatMul(const Vector& v, const Matrix& m) {
    const std::size_t cols = columnCount("vec_mat_mul", m);
    if (m.size() != v.size()) {
        throw ShapeMismatch("vec_mat_mul", ShapeMismatch::Kind::RowMismatch, m.size(), v.size());
    }

    Vector result(cols);
    for (std::size_t col = 0; col < cols; ++col) {
        Accumulator accum = 0;
        for (std::size_t row = 0; row < m.size(); ++row) {
            accum += static_cast<Accumulator>(v[row]) * static_cast<Accumulator>(m[row][col]);
            if (!fitsScalar(accum)) {
                throw Overflow("vec_mat_mul", col, accum);
            }
        }
        result[col] = static_cast<Scalar>(accum);
    }
    return result;
}

Matrix transpose(const Matrix& m) {
    const std::size_t cols = columnCount("transpose", m);
    Matrix result(cols, Vector(m.size()));
    for (std::size_t row = 0; row < m.size(); ++row) {
        for (std::size_t col = 0; col < cols; ++col) {
            result[col][row] = m[row][col];
        }
    }
    return result;
}

}  // namespace vecops::linops
