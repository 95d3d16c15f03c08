#pragma once

#include "vecops/types.hpp"

namespace vecops::linops {

/**
 * @brief Elementwise sum a + b.
 *
 * Throws ShapeMismatch on unequal lengths and Overflow when a sum leaves the Scalar range.
 */
Vector add(const Vector& a, const Vector& b);

/**
 * @brief Elementwise difference a - b. Same error policy as add().
 */
Vector sub(const Vector& a, const Vector& b);

/**
 * @brief Multiply every element of a by k.
 *
 * Throws Overflow naming the element whose product leaves the Scalar range.
 */
Vector scale(const Vector& a, Scalar k);

/**
 * @brief Dot product of two equal-length vectors.
 *
 * Every partial sum must stay inside the Scalar range, otherwise Overflow is thrown.
 */
Scalar dot(const Vector& a, const Vector& b);

/**
 * @brief Compute y[i] = sum_j M[j][i] * v[j].
 *
 * M must be rectangular with as many columns as v has elements, and square unless it
 * has no columns. The result has one entry per row; a zero-column matrix yields zeros
 * and a matrix without rows yields an empty vector for any v.
 */
Vector matVecMul(const Matrix& m, const Vector& v);

/**
 * @brief Compute y = v^T M, i.e. y[j] = sum_i v[i] * M[i][j].
 *
 * v must have one element per row of M; M may be any rectangular shape. For a square
 * M this equals matVecMul(M, v).
 */
Vector vecMatMul(const Vector& v, const Matrix& m);

Matrix transpose(const Matrix& m);

}  // namespace vecops::linops
