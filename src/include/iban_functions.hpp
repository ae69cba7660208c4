#pragma once

#include "duckdb.hpp"

namespace duckdb {
namespace ibangen {

// Register IBAN/BBAN generation and inspection functions
void RegisterIbanFunctions(ExtensionLoader &loader);

} // namespace ibangen
} // namespace duckdb
