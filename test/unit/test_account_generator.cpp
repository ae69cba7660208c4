#include "account_generator.hpp"
#include "check_digits.hpp"
#include "log_capture.hpp"

#include <gtest/gtest.h>

using namespace duckdb;
using namespace duckdb::ibangen;
using namespace duckdb::ibangen::accountgen;
using duckdb::ibangen::LogLevel;

static bool StartsWith(const std::string &value, const std::string &prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

class AccountGeneratorTest : public ::testing::Test {
protected:
    LogCapture capture;
};

TEST_F(AccountGeneratorTest, SelectsCountryRule) {
    EXPECT_EQ(AccountGenerator::RuleFor("FI"), CountryRule::FINLAND);
    EXPECT_EQ(AccountGenerator::RuleFor("no"), CountryRule::NORWAY);
    EXPECT_EQ(AccountGenerator::RuleFor("IT"), CountryRule::ITALY);
    EXPECT_EQ(AccountGenerator::RuleFor("DK"), CountryRule::DENMARK);
    EXPECT_EQ(AccountGenerator::RuleFor("SE"), CountryRule::SWEDEN);
    EXPECT_EQ(AccountGenerator::RuleFor("DE"), CountryRule::GENERIC);

    AccountGenerator generator(" se ");
    EXPECT_EQ(generator.GetCountryCode(), "SE");
    EXPECT_FALSE(generator.WarningsEnabled());
}

TEST_F(AccountGeneratorTest, RejectsBadCountryCodes) {
    EXPECT_THROW(AccountGenerator("SWE"), InvalidInputException);
    EXPECT_THROW(AccountGenerator("S"), InvalidInputException);
    EXPECT_THROW(AccountGenerator("1E"), InvalidInputException);
    EXPECT_THROW(AccountGenerator("ZZ"), InvalidInputException);
}

TEST_F(AccountGeneratorTest, EveryCountryGeneratesValidIbans) {
    uint64_t seed = 1;
    for (auto &country : IbanRegistry::Countries()) {
        AccountGenerator generator(country, seed++);
        for (int i = 0; i < 20; i++) {
            auto iban = generator.GenerateIban();
            EXPECT_TRUE(Iban::IsValid(iban.GetCompact())) << iban.GetCompact();
            EXPECT_EQ(iban.GetCountryCode(), country);
        }
    }
}

TEST_F(AccountGeneratorTest, RegenerationKeepsCountryAndBank) {
    const char *ibans[] = {"GB82WEST12345698765432", "DE89370400440532013000", "FI2112345600000785",
                           "NO9386011117947",        "IT60X0542811101000000123456", "DK5000400440116243",
                           "CH9300762011623852957",  "SE4550000000058398257466"};
    for (auto text : ibans) {
        auto old_iban = Iban::Parse(text);
        AccountGenerator generator(old_iban.GetCountryCode(), 99);
        auto new_iban = generator.RegenerateIban(old_iban);
        EXPECT_TRUE(Iban::IsValid(new_iban.GetCompact())) << text;
        EXPECT_EQ(new_iban.GetCountryCode(), old_iban.GetCountryCode()) << text;
        EXPECT_EQ(new_iban.GetBankCode(), old_iban.GetBankCode()) << text;
        EXPECT_EQ(new_iban.GetBranchCode(), old_iban.GetBranchCode()) << text;
        EXPECT_NE(new_iban.GetAccountCode(), old_iban.GetAccountCode()) << text;
    }
}

TEST_F(AccountGeneratorTest, RegeneratedFinnishAccountEndsWithLuhnDigit) {
    auto old_iban = Iban::Parse("FI2112345600000785");
    AccountGenerator generator("FI", 17);
    for (int i = 0; i < 20; i++) {
        auto new_iban = generator.RegenerateIban(old_iban);
        auto account = new_iban.GetAccountCode();
        ASSERT_EQ(new_iban.GetBankCode(), "123");
        ASSERT_EQ(account.size(), 11u);
        auto random_part = account.substr(3, AccountGenerator::FINNISH_RANDOM_DIGITS);
        EXPECT_EQ(account.back() - '0', CheckDigits::Luhn(new_iban.GetBankCode() + random_part)) << account;
    }
}

TEST_F(AccountGeneratorTest, AssemblyFailureIsInternalError) {
    AccountGenerator finnish("FI", 1);
    EXPECT_THROW(finnish.GenerateIbanForBank("12345"), InternalException);

    // CIN, 11 digit bank code and account part do not fit the Italian BBAN
    AccountGenerator italian("IT", 1);
    EXPECT_THROW(italian.GenerateIbanForBank("05428111011"), InternalException);
}

TEST_F(AccountGeneratorTest, RegenerationRequiresMatchingCountry) {
    AccountGenerator generator("FI");
    EXPECT_THROW(generator.RegenerateIban(Iban::Parse("DE89370400440532013000")), InvalidInputException);
}

TEST_F(AccountGeneratorTest, SeededGeneratorsRepeat) {
    AccountGenerator first("DE", 5);
    AccountGenerator second("DE", 5);
    EXPECT_EQ(first.GenerateIban().GetCompact(), second.GenerateIban().GetCompact());
}

TEST_F(AccountGeneratorTest, FinnishAccountEndsWithLuhnDigit) {
    AccountGenerator generator("FI", 11);
    for (int i = 0; i < 50; i++) {
        auto account = generator.GenerateIbanForBank("123").GetAccountCode();
        ASSERT_EQ(account.size(), 11u);
        EXPECT_EQ(account.substr(0, 3), "000");
        auto random_part = account.substr(3, AccountGenerator::FINNISH_RANDOM_DIGITS);
        EXPECT_EQ(account.back() - '0', CheckDigits::Luhn("123" + random_part)) << account;
    }
}

TEST_F(AccountGeneratorTest, NorwegianAccountEndsWithMod11Digit) {
    AccountGenerator generator("NO", 12);
    for (int i = 0; i < 200; i++) {
        auto account = generator.GenerateIbanForBank("8601").GetAccountCode();
        ASSERT_EQ(account.size(), 7u);
        int control = CheckDigits::WeightedMod11("8601" + account.substr(0, AccountGenerator::NORWEGIAN_RANDOM_DIGITS));
        EXPECT_NE(control, CheckDigits::MOD11_INVALID);
        EXPECT_EQ(account.back() - '0', control) << account;
    }
}

TEST_F(AccountGeneratorTest, ItalianCinPrecedesBankCode) {
    AccountGenerator generator("IT", 13);
    for (int i = 0; i < 20; i++) {
        auto iban = generator.GenerateIbanForBank("0542811101");
        auto bban = iban.GetBban();
        EXPECT_EQ(bban.substr(1, 10), "0542811101");
        EXPECT_EQ(bban[0], CheckDigits::CinLetter(iban.GetAccountCode() + "0542811101")) << bban;
    }
}

TEST_F(AccountGeneratorTest, GenericCountryWarnsOncePerInstance) {
    AccountGenerator generator("DE", 3);
    generator.GenerateIban();
    generator.GenerateIban();
    EXPECT_EQ(capture.Count(LogLevel::WARN), 1u);
    EXPECT_TRUE(capture.Contains(LogLevel::WARN, "No dedicated implementation for country DE"));

    AccountGenerator quiet("DE", 3);
    quiet.DisableWarnings();
    quiet.GenerateIban();
    EXPECT_EQ(capture.Count(LogLevel::WARN), 1u);
}

TEST_F(AccountGeneratorTest, DedicatedCountriesDoNotWarn) {
    for (auto country : {"DK", "FI", "NO", "IT", "SE"}) {
        AccountGenerator generator(country, 4);
        generator.GenerateIban();
    }
    EXPECT_EQ(capture.Count(LogLevel::WARN), 0u);
}

TEST_F(AccountGeneratorTest, RegeneratesPlainBban) {
    AccountGenerator generator("NO", 21);
    auto bban = generator.RegenerateBban("86011117947");
    ASSERT_EQ(bban.size(), 11u);
    EXPECT_TRUE(StartsWith(bban, "8601"));
    EXPECT_TRUE(Iban::FromBban("NO", bban).GetBban() == bban);
}

TEST_F(AccountGeneratorTest, RegeneratesSwedishBbanInNationalFormat) {
    auto seb = RegenerateBban("SE", "58398257466");
    ASSERT_EQ(seb.size(), 11u);
    EXPECT_TRUE(StartsWith(seb, "5839"));
    EXPECT_NE(seb, "58398257466");

    auto danske = RegenerateBban("SE", "123456789012345");
    ASSERT_EQ(danske.size(), 15u);
    EXPECT_TRUE(StartsWith(danske, "1234"));
    EXPECT_NE(danske, "123456789012345");

    auto plusgirot = RegenerateBban("SE", "12345678");
    EXPECT_EQ(plusgirot.size(), 8u);
    EXPECT_NE(plusgirot, "12345678");

    auto standard = RegenerateBban("SE", "12345678901234567890");
    ASSERT_EQ(standard.size(), 20u);
    EXPECT_TRUE(StartsWith(standard, "123"));
}

TEST_F(AccountGeneratorTest, RegeneratesSwedishIbanWithBankPart) {
    AccountGenerator generator("SE", 8);
    auto iban = generator.RegenerateIban(Iban::Parse("SE4550000000058398257466"));
    EXPECT_TRUE(StartsWith(iban.GetBban(), "5000000005839"));
    EXPECT_NE(iban.GetCompact(), "SE4550000000058398257466");
    EXPECT_TRUE(generator.GetSwedishMapper().HasDiscoveredMapping());
    EXPECT_TRUE(StartsWith(generator.IbanToBban(iban), "5839"));
}

TEST_F(AccountGeneratorTest, MalformedBbanIsLeftUnmodified) {
    EXPECT_EQ(RegenerateBban("SE", "not-a-bban"), "not-a-bban");
    EXPECT_TRUE(capture.Contains(LogLevel::WARN, "Old BBAN is invalid"));

    EXPECT_EQ(RegenerateBban("DE", "1234"), "1234");
}

TEST_F(AccountGeneratorTest, MalformedIbanIsLeftUnmodified) {
    EXPECT_EQ(RegenerateIban("DE00 not an iban"), "DE00 not an iban");
    EXPECT_TRUE(capture.Contains(LogLevel::WARN, "Old IBAN is invalid"));
}

TEST_F(AccountGeneratorTest, FreeFunctions) {
    auto iban = RegenerateIban("DE89370400440532013000");
    EXPECT_TRUE(Iban::IsValid(iban));
    EXPECT_EQ(Iban::Parse(iban).GetBankCode(), "37040044");

    EXPECT_TRUE(Iban::IsValid(GenerateRandomIban("fi")));
    EXPECT_THROW(GenerateRandomIban("ZZ"), InvalidInputException);
}
