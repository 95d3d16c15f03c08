#pragma once

#include "vecops/batch.hpp"

#include <string>

namespace vecops {

/**
 * @brief Load an operation batch from a JSON file.
 *
 * Operand shapes are not checked here; that happens when the batch is evaluated.
 * Invalid documents throw std::runtime_error naming the offending field; JSON syntax
 * errors propagate from the parser.
 */
OperationBatch loadBatchFromJson(const std::string& path);

OperationBatch parseBatchJson(const std::string& text);

}  // namespace vecops
