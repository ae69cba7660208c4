#pragma once

#include "duckdb.hpp"
#include "iban_registry.hpp"
#include "random_digits.hpp"
#include "swedish_bban_mapper.hpp"

#include <cstdint>
#include <string>

namespace duckdb {
namespace ibangen {
namespace accountgen {

// Countries with their own account number rules. Anything else is GENERIC:
// random digits that make a structurally valid IBAN, nothing more.
enum class CountryRule : uint8_t {
    GENERIC = 0,
    DENMARK = 1,
    FINLAND = 2,
    NORWAY = 3,
    ITALY = 4,
    SWEDEN = 5
};

// Generates and regenerates IBANs and BBANs of one country: the country and
// bank part stay, the account number is replaced by random digits that keep
// the national control digits valid.
//
// Instances are cheap and meant to be short-lived. The Swedish rule remembers
// the bank format of the first account number it converts (see
// SwedishBbanMapper), so use one instance per Swedish bank and never share one
// between threads.
class AccountGenerator {
public:
    explicit AccountGenerator(const std::string &country_code);
    AccountGenerator(const std::string &country_code, uint64_t seed);

    static CountryRule RuleFor(const std::string &country_code);

    // Account code part of the IBAN (no country or bank code)
    std::string GenerateAccountPart(const std::string &bank_code);
    // bank_code is bank and branch code together
    Iban GenerateIbanForBank(const std::string &bank_code);
    // Random bank code, which need not belong to an existing bank
    Iban GenerateIban();
    Iban RegenerateIban(const Iban &old_iban);
    // Unconvertible BBANs are logged and returned unchanged
    std::string RegenerateBban(const std::string &old_bban);

    Iban BbanToIban(const std::string &bban);
    std::string IbanToBban(const Iban &iban);

    const std::string &GetCountryCode() const {
        return country_code;
    }
    bool WarningsEnabled() const {
        return warnings;
    }
    // The "no dedicated rule" diagnostic can only be switched off
    void DisableWarnings() {
        warnings = false;
    }
    const SwedishBbanMapper &GetSwedishMapper() const {
        return swedish_mapper;
    }

    // Norwegian draws whose control digit would be 10
    static constexpr idx_t MAX_CONTROL_DIGIT_ATTEMPTS = 256;
    static constexpr idx_t FINNISH_RANDOM_DIGITS = 7;
    static constexpr idx_t NORWEGIAN_RANDOM_DIGITS = 6;

private:
    AccountGenerator(const std::string &country_code, RandomDigits random);

    std::string GenerateRandomAccountPart();
    std::string GenerateFinnishAccountPart(const std::string &bank_code);
    std::string GenerateNorwegianAccountPart(const std::string &bank_code);
    Iban GenerateItalianIban(const std::string &bank_code);
    Iban RegenerateSwedishIban(const Iban &old_iban);
    Iban AssembleFromBban(const std::string &bban);

    std::string country_code;
    CountryRule rule;
    bool warnings;
    bool warning_emitted;
    const IbanSpec *spec;
    RandomDigits random;
    SwedishBbanMapper swedish_mapper;
};

// Replaces the account number of an IBAN, keeping country and bank. Invalid
// IBANs are logged and returned unchanged.
std::string RegenerateIban(const std::string &old_iban);
// Random IBAN of a country; the bank code need not belong to any bank
std::string GenerateRandomIban(const std::string &country_code);
// Replaces the account number of a national BBAN. Unconvertible BBANs are
// logged and returned unchanged.
std::string RegenerateBban(const std::string &country_code, const std::string &old_bban);

} // namespace accountgen
} // namespace ibangen
} // namespace duckdb
