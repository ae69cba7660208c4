#include "check_digits.hpp"
#include "duckdb.hpp"

namespace duckdb {
namespace ibangen {
namespace accountgen {

const int CheckDigits::MOD11_WEIGHTS[6] = {2, 3, 4, 5, 6, 7};

const int CheckDigits::ODD_POSITION_VALUES[29] = {
    1, 0, 5, 7, 9, 13, 15, 17, 19, 21, 2, 4, 18, 20, 11,
    3, 6, 8, 12, 14, 16, 10, 22, 25, 24, 23, 27, 28, 26
};

int CheckDigits::DigitAt(const std::string &digits, size_t pos) {
    char c = digits[pos];
    if (c < '0' || c > '9') {
        throw InvalidInputException("Expected a digit at position %llu of '%s'", static_cast<idx_t>(pos),
                                    digits.c_str());
    }
    return c - '0';
}

int CheckDigits::Luhn(const std::string &digits) {
    if (digits.empty()) {
        throw InvalidInputException("Cannot compute a Luhn checksum of an empty string");
    }

    int checksum = 0;
    bool double_digit = false;
    for (size_t i = digits.size(); i-- > 0;) {
        int digit = DigitAt(digits, i);
        if (double_digit) {
            digit *= 2;
            // Digit sum of a two-digit product
            checksum += digit / 10 + digit % 10;
        } else {
            checksum += digit;
        }
        double_digit = !double_digit;
    }
    return checksum % 10;
}

int CheckDigits::WeightedMod11(const std::string &digits) {
    if (digits.empty()) {
        throw InvalidInputException("Cannot compute a mod 11 control digit of an empty string");
    }

    int sum = 0;
    size_t weight_idx = 0;
    for (size_t i = digits.size(); i-- > 0;) {
        sum += DigitAt(digits, i) * MOD11_WEIGHTS[weight_idx % 6];
        weight_idx++;
    }
    int control = 11 - (sum % 11);
    return control == 11 ? 0 : control;
}

char CheckDigits::CinLetter(const std::string &code) {
    if (code.empty()) {
        throw InvalidInputException("Cannot compute a CIN of an empty string");
    }

    int total = 0;
    for (size_t i = 0; i < code.size(); i++) {
        int digit = DigitAt(code, i);
        if (i % 2 == 0) {
            total += digit;
        } else {
            total += ODD_POSITION_VALUES[digit];
        }
    }
    return static_cast<char>('A' + total % 26);
}

} // namespace accountgen
} // namespace ibangen
} // namespace duckdb
