// filename: io_csv.cpp
// part of Integer Vector Operations Library
// MIT License

#include "vecops/io_csv.hpp"

#include <fstream>
#include <stdexcept>

namespace vecops {
namespace {

// Quote fields that would otherwise break the column layout.
std::string csvField(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (const char c : text) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

void write_csv_outcomes(const std::string& path, const std::vector<OperationOutcome>& outcomes) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << "id,op,status,accepted,result\n";
    for (const auto& outcome : outcomes) {
        ofs << csvField(outcome.id) << ',' << toString(outcome.kind) << ',' << toString(outcome.status)
            << ',' << (outcomeAccepted(outcome) ? "true" : "false") << ',';
        if (outcome.value) {
            ofs << csvField(formatValue(*outcome.value));
        }
        ofs << '\n';
    }
    if (!ofs) {
        throw std::runtime_error("Failed to write CSV output: " + path);
    }
}

}  // namespace vecops
