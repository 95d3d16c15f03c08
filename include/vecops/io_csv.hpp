// filename: io_csv.hpp
// part of Integer Vector Operations Library
// MIT License

#pragma once

#include "vecops/batch.hpp"

#include <string>
#include <vector>

namespace vecops {

/**
 * @brief Write one row per outcome with columns id,op,status,accepted,result.
 *
 * Failed operations leave the result column empty.
 */
void write_csv_outcomes(const std::string& path, const std::vector<OperationOutcome>& outcomes);

}  // namespace vecops
