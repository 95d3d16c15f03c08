#include "vecops/batch.hpp"

#include "vecops/errors.hpp"
#include "vecops/linops.hpp"

#include <sstream>
#include <stdexcept>

namespace vecops {
namespace {

void appendVector(std::ostringstream& oss, const Vector& v) {
    for (std::size_t idx = 0; idx < v.size(); ++idx) {
        if (idx > 0) {
            oss << ' ';
        }
        oss << v[idx];
    }
}

Value compute(const OperationSpec& spec) {
    switch (spec.kind) {
        case OperationKind::Add:
            return linops::add(spec.a, spec.b);
        case OperationKind::Sub:
            return linops::sub(spec.a, spec.b);
        case OperationKind::Scale:
            return linops::scale(spec.a, spec.k);
        case OperationKind::Dot:
            return linops::dot(spec.a, spec.b);
        case OperationKind::MatVecMul:
            return linops::matVecMul(spec.matrix, spec.vector);
        case OperationKind::VecMatMul:
            return linops::vecMatMul(spec.vector, spec.matrix);
        case OperationKind::Transpose:
            return linops::transpose(spec.matrix);
    }
    throw std::logic_error("Unhandled operation kind");
}

}  // namespace

const char* toString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Add:
            return "add";
        case OperationKind::Sub:
            return "sub";
        case OperationKind::Scale:
            return "scale";
        case OperationKind::Dot:
            return "dot";
        case OperationKind::MatVecMul:
            return "mat_vec_mul";
        case OperationKind::VecMatMul:
            return "vec_mat_mul";
        case OperationKind::Transpose:
            return "transpose";
    }
    return "unknown";
}

std::optional<OperationKind> parseOperationKind(const std::string& name) {
    for (const OperationKind kind :
         {OperationKind::Add, OperationKind::Sub, OperationKind::Scale, OperationKind::Dot,
          OperationKind::MatVecMul, OperationKind::VecMatMul, OperationKind::Transpose}) {
        if (name == toString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const char* toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Ok:
            return "ok";
        case OutcomeStatus::ShapeMismatch:
            return "shape_mismatch";
        case OutcomeStatus::Overflow:
            return "overflow";
    }
    return "unknown";
}

std::optional<OutcomeStatus> parseOutcomeStatus(const std::string& name) {
    if (name == "shape_mismatch") {
        return OutcomeStatus::ShapeMismatch;
    }
    if (name == "overflow") {
        return OutcomeStatus::Overflow;
    }
    return std::nullopt;
}

OperationOutcome evaluateOperation(const OperationSpec& spec) {
    OperationOutcome outcome{};
    outcome.id = spec.id;
    outcome.kind = spec.kind;
    outcome.hasExpectation = spec.expected.has_value() || spec.expectedError.has_value();

    try {
        outcome.value = compute(spec);
        outcome.status = OutcomeStatus::Ok;
    } catch (const ShapeMismatch& ex) {
        outcome.status = OutcomeStatus::ShapeMismatch;
        outcome.message = ex.what();
    } catch (const Overflow& ex) {
        outcome.status = OutcomeStatus::Overflow;
        outcome.message = ex.what();
    }

    if (spec.expectedError.has_value()) {
        outcome.matchesExpectation = (outcome.status == *spec.expectedError);
    } else if (spec.expected.has_value()) {
        outcome.matchesExpectation = outcome.value.has_value() && *outcome.value == *spec.expected;
    }
    return outcome;
}

std::vector<OperationOutcome> evaluateBatch(const OperationBatch& batch) {
    std::vector<OperationOutcome> outcomes;
    outcomes.reserve(batch.operations.size());
    for (const OperationSpec& spec : batch.operations) {
        outcomes.push_back(evaluateOperation(spec));
    }
    return outcomes;
}

bool outcomeAccepted(const OperationOutcome& outcome) {
    if (outcome.hasExpectation) {
        return outcome.matchesExpectation;
    }
    return outcome.status == OutcomeStatus::Ok;
}

std::string formatValue(const Value& value) {
    std::ostringstream oss;
    if (const auto* scalar = std::get_if<Scalar>(&value)) {
        oss << *scalar;
    } else if (const auto* vec = std::get_if<Vector>(&value)) {
        appendVector(oss, *vec);
    } else if (const auto* mat = std::get_if<Matrix>(&value)) {
        for (std::size_t row = 0; row < mat->size(); ++row) {
            if (row > 0) {
                oss << "; ";
            }
            appendVector(oss, (*mat)[row]);
        }
    }
    return oss.str();
}

}  // namespace vecops
