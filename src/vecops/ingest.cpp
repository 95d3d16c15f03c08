#include "vecops/ingest.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>

namespace vecops {
namespace {

Scalar requireScalar(const std::string& field, const nlohmann::json& node) {
    if (!node.is_number_integer()) {
        throw std::runtime_error(field + " must be an integer");
    }
    constexpr std::int64_t kMin = std::numeric_limits<Scalar>::min();
    constexpr std::int64_t kMax = std::numeric_limits<Scalar>::max();
    if (node.is_number_unsigned()) {
        if (node.get<std::uint64_t>() > static_cast<std::uint64_t>(kMax)) {
            throw std::runtime_error(field + " exceeds the 32-bit integer range");
        }
        return static_cast<Scalar>(node.get<std::uint64_t>());
    }
    const std::int64_t value = node.get<std::int64_t>();
    if (value < kMin || value > kMax) {
        throw std::runtime_error(field + " exceeds the 32-bit integer range");
    }
    return static_cast<Scalar>(value);
}

std::string requireString(const std::string& field, const nlohmann::json& node) {
    if (!node.is_string()) {
        throw std::runtime_error(field + " must be a string");
    }
    return node.get<std::string>();
}

Vector requireVector(const std::string& field, const nlohmann::json& node) {
    if (!node.is_array()) {
        throw std::runtime_error(field + " must be an array of integers");
    }
    Vector result;
    result.reserve(node.size());
    for (std::size_t idx = 0; idx < node.size(); ++idx) {
        result.push_back(requireScalar(field + "[" + std::to_string(idx) + "]", node[idx]));
    }
    return result;
}

// Rows may differ in length; rectangularity is the arithmetic's concern.
Matrix requireMatrix(const std::string& field, const nlohmann::json& node) {
    if (!node.is_array()) {
        throw std::runtime_error(field + " must be an array of rows");
    }
    Matrix result;
    result.reserve(node.size());
    for (std::size_t row = 0; row < node.size(); ++row) {
        result.push_back(requireVector(field + "[" + std::to_string(row) + "]", node[row]));
    }
    return result;
}

const nlohmann::json& requireField(const std::string& context, const nlohmann::json& node,
                                   const char* name) {
    if (!node.contains(name)) {
        throw std::runtime_error(context + " missing required field: " + name);
    }
    return node.at(name);
}

Value parseExpectedValue(const std::string& field, OperationKind kind, const nlohmann::json& node) {
    switch (kind) {
        case OperationKind::Dot:
            return requireScalar(field, node);
        case OperationKind::Transpose:
            return requireMatrix(field, node);
        default:
            return requireVector(field, node);
    }
}

OperationSpec parseOperation(std::size_t index, const nlohmann::json& node) {
    const std::string context = "operations[" + std::to_string(index) + "]";
    if (!node.is_object()) {
        throw std::runtime_error(context + " must be a JSON object");
    }

    OperationSpec spec{};
    spec.id = node.contains("id") ? requireString(context + ".id", node.at("id")) : context;
    if (spec.id.empty()) {
        throw std::runtime_error(context + ".id must be a non-empty string");
    }

    const std::string op = requireString(spec.id + ".op", requireField(spec.id, node, "op"));
    const auto kind = parseOperationKind(op);
    if (!kind) {
        throw std::runtime_error("Unsupported op for '" + spec.id + "': " + op);
    }
    spec.kind = *kind;

    const std::string prefix = spec.id + ".";
    switch (spec.kind) {
        case OperationKind::Add:
        case OperationKind::Sub:
        case OperationKind::Dot:
            spec.a = requireVector(prefix + "a", requireField(spec.id, node, "a"));
            spec.b = requireVector(prefix + "b", requireField(spec.id, node, "b"));
            break;
        case OperationKind::Scale:
            spec.a = requireVector(prefix + "a", requireField(spec.id, node, "a"));
            spec.k = requireScalar(prefix + "k", requireField(spec.id, node, "k"));
            break;
        case OperationKind::MatVecMul:
        case OperationKind::VecMatMul:
            spec.matrix = requireMatrix(prefix + "matrix", requireField(spec.id, node, "matrix"));
            spec.vector = requireVector(prefix + "vector", requireField(spec.id, node, "vector"));
            break;
        case OperationKind::Transpose:
            spec.matrix = requireMatrix(prefix + "matrix", requireField(spec.id, node, "matrix"));
            break;
    }

    if (node.contains("expect") && node.contains("expect_error")) {
        throw std::runtime_error("Operation '" + spec.id + "' cannot declare both expect and expect_error");
    }
    if (node.contains("expect")) {
        spec.expected = parseExpectedValue(prefix + "expect", spec.kind, node.at("expect"));
    }
    if (node.contains("expect_error")) {
        const std::string name = requireString(spec.id + ".expect_error", node.at("expect_error"));
        spec.expectedError = parseOutcomeStatus(name);
        if (!spec.expectedError) {
            throw std::runtime_error("Unsupported expect_error for '" + spec.id + "': " + name);
        }
    }
    return spec;
}

OperationBatch parseBatch(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("Batch JSON root must be an object");
    }

    OperationBatch batch{};
    batch.version = requireString("version", requireField("Batch JSON", json, "version"));
    if (batch.version != "0.1") {
        throw std::runtime_error("Unsupported batch version: " + batch.version);
    }

    const auto& operations = requireField("Batch JSON", json, "operations");
    if (!operations.is_array()) {
        throw std::runtime_error("Batch operations must be an array");
    }

    std::unordered_set<std::string> ids;
    batch.operations.reserve(operations.size());
    for (std::size_t idx = 0; idx < operations.size(); ++idx) {
        OperationSpec spec = parseOperation(idx, operations[idx]);
        if (!ids.insert(spec.id).second) {
            throw std::runtime_error("Duplicate operation id: " + spec.id);
        }
        batch.operations.push_back(std::move(spec));
    }
    return batch;
}

}  // namespace

OperationBatch loadBatchFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open batch JSON: " + path);
    }

    nlohmann::json json;
    input >> json;
    return parseBatch(json);
}

OperationBatch parseBatchJson(const std::string& text) {
    return parseBatch(nlohmann::json::parse(text));
}

}  // namespace vecops
