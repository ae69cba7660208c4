#include "random_digits.hpp"

namespace duckdb {
namespace ibangen {

static const char DIGITS[] = "0123456789";
static const char LETTERS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
static const char ALPHANUMERICS[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

static uint64_t RandomSeed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

RandomDigits::RandomDigits() : gen(RandomSeed()) {
}

RandomDigits::RandomDigits(uint64_t seed) : gen(seed) {
}

std::string RandomDigits::Digits(idx_t length) {
    return Characters(length, DIGITS);
}

std::string RandomDigits::Characters(idx_t length, const std::string &alphabet) {
    if (alphabet.empty()) {
        throw InvalidInputException("Cannot draw random characters from an empty alphabet");
    }
    std::uniform_int_distribution<size_t> dis(0, alphabet.size() - 1);
    std::string result;
    result.reserve(length);
    for (idx_t i = 0; i < length; i++) {
        result += alphabet[dis(gen)];
    }
    return result;
}

std::string RandomDigits::ForClasses(const std::string &classes) {
    std::string result;
    result.reserve(classes.size());
    for (char char_class : classes) {
        switch (char_class) {
            case 'n': result += Characters(1, DIGITS); break;
            case 'a': result += Characters(1, LETTERS); break;
            case 'c': result += Characters(1, ALPHANUMERICS); break;
            default:
                throw InvalidInputException("Unknown character class '%s'", std::string(1, char_class));
        }
    }
    return result;
}

uint64_t RandomDigits::NextSeed() {
    return gen();
}

} // namespace ibangen
} // namespace duckdb
