#pragma once

#include "vecops/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vecops {

enum class OperationKind { Add, Sub, Scale, Dot, MatVecMul, VecMatMul, Transpose };

const char* toString(OperationKind kind);

std::optional<OperationKind> parseOperationKind(const std::string& name);

/**
 * @brief A result of any operation: dot yields a Scalar, transpose a Matrix, the rest a Vector.
 */
using Value = std::variant<Scalar, Vector, Matrix>;

enum class OutcomeStatus { Ok, ShapeMismatch, Overflow };

const char* toString(OutcomeStatus status);

std::optional<OutcomeStatus> parseOutcomeStatus(const std::string& name);

/**
 * @brief One operation read from a batch file.
 *
 * Only the operands used by the kind are meaningful: a/b for add, sub and dot,
 * a/k for scale, matrix/vector for the products, matrix for transpose.
 */
struct OperationSpec {
    std::string id;
    OperationKind kind{OperationKind::Add};
    Vector a;
    Vector b;
    Scalar k{0};
    Matrix matrix;
    Vector vector;
    std::optional<Value> expected;
    std::optional<OutcomeStatus> expectedError;
};

struct OperationBatch {
    std::string version;
    std::vector<OperationSpec> operations;
};

struct OperationOutcome {
    std::string id;
    OperationKind kind{OperationKind::Add};
    OutcomeStatus status{OutcomeStatus::Ok};
    std::optional<Value> value;
    std::string message;
    bool hasExpectation{false};
    bool matchesExpectation{true};
};

/**
 * @brief Run one operation. ShapeMismatch and Overflow are captured in the outcome;
 *        any other exception propagates.
 */
OperationOutcome evaluateOperation(const OperationSpec& spec);

std::vector<OperationOutcome> evaluateBatch(const OperationBatch& batch);

/**
 * @brief True when the outcome is what the batch asked for: an expected error if one was
 *        declared, otherwise success with a matching value (when a value was declared).
 */
[[nodiscard]] bool outcomeAccepted(const OperationOutcome& outcome);

/**
 * @brief Render a value as text: elements separated by spaces, matrix rows by "; ".
 */
std::string formatValue(const Value& value);

}  // namespace vecops
