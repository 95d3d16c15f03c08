#include "vecops/batch.hpp"
#include "vecops/ingest.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool expectRejected(const std::string& label, const std::string& text, const std::string& needle) {
    try {
        (void)vecops::parseBatchJson(text);
    } catch (const std::runtime_error& ex) {
        const std::string message = ex.what();
        if (message.find(needle) == std::string::npos) {
            std::cerr << label << ": error does not mention '" << needle << "': " << message << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        std::cerr << label << ": unexpected exception type: " << ex.what() << "\n";
        return false;
    }
    std::cerr << label << ": malformed batch was accepted\n";
    return false;
}

}  // namespace

int main() {
    using namespace vecops;
    namespace fs = std::filesystem;

    const fs::path batchPath =
        (fs::path(__FILE__).parent_path() / "../inputs/tests/readme_examples.json").lexically_normal();

    OperationBatch batch;
    try {
        batch = loadBatchFromJson(batchPath.string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load README batch: " << ex.what() << "\n";
        return 1;
    }

    if (batch.version != "0.1" || batch.operations.size() != 13) {
        std::cerr << "README batch parsed with unexpected shape\n";
        return 1;
    }

    const OperationSpec& ragged = batch.operations[8];
    if (ragged.kind != OperationKind::MatVecMul || ragged.matrix.size() != 2 ||
        ragged.matrix[1].size() != 3 || !ragged.expectedError ||
        *ragged.expectedError != OutcomeStatus::ShapeMismatch) {
        std::cerr << "Ragged matrix operation was not preserved by ingest\n";
        return 1;
    }

    const std::vector<OperationOutcome> outcomes = evaluateBatch(batch);
    if (outcomes.size() != batch.operations.size()) {
        std::cerr << "Batch evaluation dropped operations\n";
        return 1;
    }
    for (const auto& outcome : outcomes) {
        if (!outcomeAccepted(outcome)) {
            std::cerr << "Operation '" << outcome.id << "' was not accepted: " << toString(outcome.status)
                      << " " << outcome.message << "\n";
            return 1;
        }
    }

    const OperationOutcome& matVec = outcomes[3];
    if (!matVec.value || formatValue(*matVec.value) != "30 36 42") {
        std::cerr << "mat_vec_mul outcome did not format as '30 36 42'\n";
        return 1;
    }
    const OperationOutcome& twoByTwo = outcomes[11];
    if (!twoByTwo.value || formatValue(*twoByTwo.value) != "-16 38") {
        std::cerr << "2x2 mat_vec_mul outcome did not format as '-16 38'\n";
        return 1;
    }
    const OperationOutcome& notSquare = outcomes[12];
    if (notSquare.status != OutcomeStatus::ShapeMismatch ||
        notSquare.message.find("square") == std::string::npos) {
        std::cerr << "Non-square mat_vec_mul was not reported as a shape mismatch: " << notSquare.message
                  << "\n";
        return 1;
    }

    const OperationOutcome& vecMat = outcomes[4];
    if (!vecMat.value || formatValue(*vecMat.value) != "30 36 42") {
        std::cerr << "vec_mat_mul outcome did not format as '30 36 42'\n";
        return 1;
    }
    const OperationOutcome& transposed = outcomes[6];
    if (!transposed.value || formatValue(*transposed.value) != "1 3 5; 2 4 6") {
        std::cerr << "transpose outcome did not format as matrix rows\n";
        return 1;
    }
    const OperationOutcome& lengthMismatch = outcomes[9];
    if (lengthMismatch.status != OutcomeStatus::ShapeMismatch || lengthMismatch.value ||
        lengthMismatch.message.find("3 vs 2") == std::string::npos) {
        std::cerr << "Length mismatch outcome lost its diagnostics: " << lengthMismatch.message << "\n";
        return 1;
    }

    OperationSpec wrong{};
    wrong.id = "wrong";
    wrong.kind = OperationKind::Add;
    wrong.a = {1, 2};
    wrong.b = {3, 4};
    wrong.expected = Value{Vector{0, 0}};
    const OperationOutcome wrongOutcome = evaluateOperation(wrong);
    if (wrongOutcome.status != OutcomeStatus::Ok || wrongOutcome.matchesExpectation ||
        outcomeAccepted(wrongOutcome)) {
        std::cerr << "A mismatching expectation was accepted\n";
        return 1;
    }

    OperationSpec unexpectedError{};
    unexpectedError.id = "unexpected";
    unexpectedError.kind = OperationKind::Scale;
    unexpectedError.a = {1 << 30};
    unexpectedError.k = 4;
    if (outcomeAccepted(evaluateOperation(unexpectedError))) {
        std::cerr << "An undeclared overflow was accepted\n";
        return 1;
    }

    bool ok = true;
    ok &= expectRejected("version", R"({"version": "9", "operations": []})", "version");
    ok &= expectRejected("missing version", R"({"operations": []})", "version");
    ok &= expectRejected("unknown op", R"({"version": "0.1", "operations": [{"id": "x", "op": "cross"}]})",
                         "cross");
    ok &= expectRejected("missing operand", R"({"version": "0.1", "operations": [{"id": "x", "op": "add", "a": [1]}]})",
                         "b");
    ok &= expectRejected("non-integer",
                         R"({"version": "0.1", "operations": [{"id": "x", "op": "scale", "a": [1.5], "k": 2}]})",
                         "x.a[0]");
    ok &= expectRejected("out of range",
                         R"({"version": "0.1", "operations": [{"id": "x", "op": "scale", "a": [1], "k": 2147483648}]})",
                         "x.k");
    ok &= expectRejected("duplicate id",
                         R"({"version": "0.1", "operations": [
                                {"id": "x", "op": "add", "a": [], "b": []},
                                {"id": "x", "op": "sub", "a": [], "b": []}]})",
                         "Duplicate");
    ok &= expectRejected("numeric op", R"({"version": "0.1", "operations": [{"id": "x", "op": 7, "a": [], "b": []}]})",
                         "x.op");
    ok &= expectRejected("numeric id", R"({"version": "0.1", "operations": [{"id": 5, "op": "add", "a": [], "b": []}]})",
                         "operations[0].id");
    ok &= expectRejected("numeric version", R"({"version": 1, "operations": []})", "version");
    ok &= expectRejected("numeric expect_error",
                         R"({"version": "0.1", "operations": [{"id": "x", "op": "add", "a": [], "b": [], "expect_error": 3}]})",
                         "x.expect_error");
    ok &= expectRejected("array root", R"([1, 2, 3])", "object");
    ok &= expectRejected("bad expect_error",
                         R"({"version": "0.1", "operations": [{"id": "x", "op": "add", "a": [], "b": [], "expect_error": "boom"}]})",
                         "boom");

    try {
        (void)loadBatchFromJson((batchPath.parent_path() / "does_not_exist.json").string());
        std::cerr << "Loading a missing file succeeded\n";
        ok = false;
    } catch (const std::runtime_error&) {
    }

    if (!ok) {
        return 1;
    }
    std::cout << "Batch ingest and evaluation validated successfully\n";
    return 0;
}
