// filename: vecops.hpp
// part of Integer Vector Operations Library
// MIT License

#pragma once

#include "batch.hpp"
#include "errors.hpp"
#include "ingest.hpp"
#include "io_csv.hpp"
#include "linops.hpp"
#include "shape.hpp"
#include "types.hpp"
