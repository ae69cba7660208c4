#pragma once

#include "duckdb.hpp"
#include <string>
#include <cctype>
#include <algorithm>

namespace duckdb {
namespace ibangen {

// String utilities
std::string trim(const std::string &str);
std::string to_upper(const std::string &str);

// Removes all whitespace and upper-cases, the compact form of an IBAN
std::string compact_identifier(const std::string &str);

// Character classification helpers
bool is_digit_char(char c);
bool is_alpha_char(char c);

} // namespace ibangen
} // namespace duckdb
