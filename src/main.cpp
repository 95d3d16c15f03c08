#include "vecops/batch.hpp"
#include "vecops/ingest.hpp"
#include "vecops/io_csv.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: vecops_eval --ops PATH [--csv PATH] [--quiet] [--help]\n"
              << "  --ops <path>    Operation batch JSON to evaluate\n"
              << "  --csv <path>    Write one row per operation to a CSV report\n"
              << "  --quiet         Only report failures\n"
              << "  --help          Show this message\n";
}

void ensureParentDirectory(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Warning: could not create " << parent.string() << ": " << ec.message() << "\n";
        }
    }
}

struct EvalConfig {
    std::string opsPath;
    std::optional<std::string> csvPath;
    bool quiet{false};
};

enum class ParseStatus { Ok, Help, Error };

ParseStatus parseArgs(int argc, char** argv, EvalConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return ParseStatus::Help;
        } else if (arg == "--ops") {
            if (i + 1 >= argc) {
                std::cerr << "--ops requires a path\n";
                return ParseStatus::Error;
            }
            cfg.opsPath = argv[++i];
        } else if (arg == "--csv") {
            if (i + 1 >= argc) {
                std::cerr << "--csv requires a path\n";
                return ParseStatus::Error;
            }
            cfg.csvPath = std::string(argv[++i]);
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return ParseStatus::Error;
        }
    }
    if (cfg.opsPath.empty()) {
        std::cerr << "Missing required --ops PATH\n";
        return ParseStatus::Error;
    }
    return ParseStatus::Ok;
}

}  // namespace

int main(int argc, char** argv) {
    EvalConfig cfg{};
    switch (parseArgs(argc, argv, cfg)) {
        case ParseStatus::Help:
            printUsage();
            return 0;
        case ParseStatus::Error:
            printUsage();
            return 2;
        case ParseStatus::Ok:
            break;
    }

    vecops::OperationBatch batch;
    try {
        batch = vecops::loadBatchFromJson(cfg.opsPath);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load operation batch: " << ex.what() << "\n";
        return 2;
    }

    const std::vector<vecops::OperationOutcome> outcomes = vecops::evaluateBatch(batch);

    std::size_t rejected = 0;
    for (const auto& outcome : outcomes) {
        const bool accepted = vecops::outcomeAccepted(outcome);
        if (!accepted) {
            ++rejected;
        }
        if (cfg.quiet && accepted) {
            continue;
        }
        std::ostream& os = accepted ? std::cout : std::cerr;
        os << outcome.id << " [" << vecops::toString(outcome.kind) << "] "
           << vecops::toString(outcome.status);
        if (outcome.value) {
            os << ": " << vecops::formatValue(*outcome.value);
        } else if (!outcome.message.empty()) {
            os << ": " << outcome.message;
        }
        if (outcome.hasExpectation && !outcome.matchesExpectation) {
            os << " (does not match expectation)";
        }
        os << "\n";
    }

    if (cfg.csvPath) {
        try {
            ensureParentDirectory(*cfg.csvPath);
            vecops::write_csv_outcomes(*cfg.csvPath, outcomes);
            if (!cfg.quiet) {
                std::cout << "Wrote " << *cfg.csvPath << "\n";
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write CSV report: " << ex.what() << "\n";
            return 1;
        }
    }

    if (!cfg.quiet) {
        std::cout << outcomes.size() - rejected << "/" << outcomes.size() << " operations accepted\n";
    }
    return rejected == 0 ? 0 : 1;
}
