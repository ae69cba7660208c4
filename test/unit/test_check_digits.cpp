#include "check_digits.hpp"
#include "duckdb.hpp"

#include <gtest/gtest.h>

using duckdb::InvalidInputException;
using duckdb::ibangen::accountgen::CheckDigits;

TEST(CheckDigitsTest, LuhnReturnsRawChecksum) {
    EXPECT_EQ(CheckDigits::Luhn("79927398713"), 0);
    EXPECT_EQ(CheckDigits::Luhn("7992739871"), 6);
    EXPECT_EQ(CheckDigits::Luhn("123"), 8);
    EXPECT_EQ(CheckDigits::Luhn("5"), 5);
}

TEST(CheckDigitsTest, LuhnSumsDigitsOfDoubledProducts) {
    // 5 doubled is 10, which contributes 1
    EXPECT_EQ(CheckDigits::Luhn("59"), 0);
    EXPECT_EQ(CheckDigits::Luhn("18"), 0);
}

TEST(CheckDigitsTest, LuhnRejectsNonDigits) {
    EXPECT_THROW(CheckDigits::Luhn("12a4"), InvalidInputException);
    EXPECT_THROW(CheckDigits::Luhn(""), InvalidInputException);
}

TEST(CheckDigitsTest, WeightedMod11MatchesNorwegianAccount) {
    // 8601 11 17947
    EXPECT_EQ(CheckDigits::WeightedMod11("8601111794"), 7);
}

TEST(CheckDigitsTest, WeightedMod11MapsElevenToZero) {
    EXPECT_EQ(CheckDigits::WeightedMod11("0"), 0);
    EXPECT_EQ(CheckDigits::WeightedMod11("1"), 9);
}

TEST(CheckDigitsTest, WeightedMod11ReportsTen) {
    EXPECT_EQ(CheckDigits::WeightedMod11("6"), CheckDigits::MOD11_INVALID);
}

TEST(CheckDigitsTest, CinLetter) {
    EXPECT_EQ(CheckDigits::CinLetter("0"), 'A');
    EXPECT_EQ(CheckDigits::CinLetter("00"), 'B');
    EXPECT_EQ(CheckDigits::CinLetter("12"), 'G');
    // 9 + 21 wraps around
    EXPECT_EQ(CheckDigits::CinLetter("99"), 'E');
    EXPECT_THROW(CheckDigits::CinLetter("X1"), InvalidInputException);
}
