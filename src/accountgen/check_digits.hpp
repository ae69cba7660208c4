#pragma once

#include <string>

namespace duckdb {
namespace ibangen {
namespace accountgen {

// National control digits used when generating account numbers.
// All inputs must be non-empty strings of decimal digits.
class CheckDigits {
public:
    // Luhn digit sum over the whole input, returned as sum mod 10 (the raw
    // checksum, not its ten's complement). Finnish account numbers end in it.
    static int Luhn(const std::string &digits);

    // Weights 2,3,4,5,6,7 repeating from the rightmost digit, 11 - (sum mod 11).
    // 11 maps to 0; 10 is returned as is and is not a usable control digit.
    static int WeightedMod11(const std::string &digits);

    // Italian CIN: digit value at even positions, ODD_POSITION_VALUES at odd
    // positions (0-indexed), sum mod 26 as a letter 'A'..'Z'.
    static char CinLetter(const std::string &code);

    static constexpr int MOD11_INVALID = 10;

private:
    static int DigitAt(const std::string &digits, size_t pos);

    static const int MOD11_WEIGHTS[6];
    // Indexed by digit value 0-9, or letter value 0-25 for alphanumeric codes
    static const int ODD_POSITION_VALUES[29];
};

} // namespace accountgen
} // namespace ibangen
} // namespace duckdb
