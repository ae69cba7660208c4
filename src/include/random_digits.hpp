#pragma once

#include "duckdb.hpp"
#include <cstdint>
#include <random>
#include <string>

namespace duckdb {
namespace ibangen {

// Uniform random characters for synthetic account numbers. Not suitable for
// anything that has to be unpredictable.
class RandomDigits {
public:
    RandomDigits();
    explicit RandomDigits(uint64_t seed);

    // length decimal digits, leading zeros included
    std::string Digits(idx_t length);
    std::string Characters(idx_t length, const std::string &alphabet);
    // One character per class letter: 'n' digit, 'a' upper-case letter, 'c' either
    std::string ForClasses(const std::string &classes);
    uint64_t NextSeed();

private:
    std::mt19937_64 gen;
};

} // namespace ibangen
} // namespace duckdb
