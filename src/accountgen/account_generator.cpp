#include "account_generator.hpp"
#include "check_digits.hpp"
#include "ibangen_log.hpp"
#include "utils.hpp"

#include <unordered_map>

namespace duckdb {
namespace ibangen {
namespace accountgen {

// Denmark has nothing beyond the IBAN structure, it only skips the warning
static const std::unordered_map<std::string, CountryRule> COUNTRY_RULES = {
    {"DK", CountryRule::DENMARK},
    {"FI", CountryRule::FINLAND},
    {"NO", CountryRule::NORWAY},
    {"IT", CountryRule::ITALY},
    {"SE", CountryRule::SWEDEN}
};

static std::string NormalizeCountryCode(const std::string &country_code) {
    std::string code = to_upper(trim(country_code));
    if (code.size() != 2 || !is_alpha_char(code[0]) || !is_alpha_char(code[1])) {
        throw InvalidInputException("Country code must have 2 letters, got '%s'", country_code.c_str());
    }
    return code;
}

AccountGenerator::AccountGenerator(const std::string &country_code_p)
    : AccountGenerator(country_code_p, RandomDigits()) {
}

AccountGenerator::AccountGenerator(const std::string &country_code_p, uint64_t seed)
    : AccountGenerator(country_code_p, RandomDigits(seed)) {
}

AccountGenerator::AccountGenerator(const std::string &country_code_p, RandomDigits random_p)
    : country_code(NormalizeCountryCode(country_code_p)), rule(RuleFor(country_code)),
      warnings(rule == CountryRule::GENERIC), warning_emitted(false), spec(&IbanRegistry::Get(country_code)),
      random(std::move(random_p)) {
}

CountryRule AccountGenerator::RuleFor(const std::string &country_code) {
    auto it = COUNTRY_RULES.find(to_upper(country_code));
    if (it == COUNTRY_RULES.end()) {
        return CountryRule::GENERIC;
    }
    return it->second;
}

std::string AccountGenerator::GenerateAccountPart(const std::string &bank_code) {
    switch (rule) {
        case CountryRule::FINLAND:
            return GenerateFinnishAccountPart(bank_code);
        case CountryRule::NORWAY:
            return GenerateNorwegianAccountPart(bank_code);
        default:
            return GenerateRandomAccountPart();
    }
}

std::string AccountGenerator::GenerateRandomAccountPart() {
    if (warnings && !warning_emitted) {
        Log::Warning("No dedicated implementation for country " + country_code +
                     ". We will generate a number, which is a correct IBAN, but not necessarily a correct "
                     "country-specific number");
        warning_emitted = true;
    }
    return random.Digits(spec->account_code_length);
}

// Seven random digits and a Luhn digit over bank code and random digits
std::string AccountGenerator::GenerateFinnishAccountPart(const std::string &bank_code) {
    std::string random_part = random.Digits(FINNISH_RANDOM_DIGITS);
    int control_digit = CheckDigits::Luhn(bank_code + random_part);
    return random_part + std::to_string(control_digit);
}

// Six random digits and a mod 11 digit; a draw whose control digit is 10 is discarded
std::string AccountGenerator::GenerateNorwegianAccountPart(const std::string &bank_code) {
    for (idx_t attempt = 0; attempt < MAX_CONTROL_DIGIT_ATTEMPTS; attempt++) {
        std::string random_part = random.Digits(NORWEGIAN_RANDOM_DIGITS);
        int control_digit = CheckDigits::WeightedMod11(bank_code + random_part);
        if (control_digit == CheckDigits::MOD11_INVALID) {
            continue;
        }
        return random_part + std::to_string(control_digit);
    }
    throw InternalException("No valid Norwegian control digit for bank code %s after %llu attempts",
                            bank_code.c_str(), MAX_CONTROL_DIGIT_ATTEMPTS);
}

Iban AccountGenerator::GenerateIbanForBank(const std::string &bank_code) {
    if (rule == CountryRule::ITALY) {
        return GenerateItalianIban(bank_code);
    }

    std::string account_part = GenerateAccountPart(bank_code);
    try {
        return Iban::Generate(country_code, bank_code, account_part);
    } catch (const InvalidInputException &e) {
        throw InternalException("We generated an invalid IBAN. This means, that probably there is a bug in the "
                                "mechanism generating IBAN or the country registry. Error: %s",
                                ErrorMessage(e));
    }
}

// The CIN control letter precedes bank code and account number
Iban AccountGenerator::GenerateItalianIban(const std::string &bank_code) {
    std::string account_part = GenerateAccountPart(bank_code);
    char cin = CheckDigits::CinLetter(account_part + bank_code);
    return AssembleFromBban(std::string(1, cin) + bank_code + account_part);
}

Iban AccountGenerator::AssembleFromBban(const std::string &bban) {
    try {
        return Iban::FromBban(country_code, bban);
    } catch (const InvalidInputException &e) {
        throw InternalException("We generated an invalid IBAN. This means, that probably there is a bug in the "
                                "mechanism generating IBAN or the country registry. Error: %s",
                                ErrorMessage(e));
    }
}

Iban AccountGenerator::GenerateIban() {
    idx_t bank_length = spec->bank_code_length + spec->branch_code_length;
    std::string bank_code = random.ForClasses(spec->CharacterClasses(spec->bank_offset, bank_length));
    return GenerateIbanForBank(bank_code);
}

Iban AccountGenerator::RegenerateIban(const Iban &old_iban) {
    if (old_iban.GetCountryCode() != country_code) {
        throw InvalidInputException("IBAN %s does not belong to country %s", old_iban.GetCompact().c_str(),
                                    country_code.c_str());
    }
    if (rule == CountryRule::SWEDEN) {
        return RegenerateSwedishIban(old_iban);
    }
    return GenerateIbanForBank(old_iban.GetBankCode() + old_iban.GetBranchCode());
}

// Bank specific Swedish formats keep their whole bank part, only the
// account number digits after it are replaced
Iban AccountGenerator::RegenerateSwedishIban(const Iban &old_iban) {
    IbanToBban(old_iban);
    if (!swedish_mapper.HasDiscoveredMapping()) {
        return GenerateIbanForBank(old_iban.GetBankCode() + old_iban.GetBranchCode());
    }

    auto &bank_part = swedish_mapper.GetIbanPrefix();
    std::string account_number = random.Digits(SwedishBbanMapper::STANDARD_BBAN_LENGTH - bank_part.size());
    return AssembleFromBban(bank_part + account_number);
}

std::string AccountGenerator::RegenerateBban(const std::string &old_bban) {
    unique_ptr<Iban> old_iban;
    try {
        old_iban = make_uniq<Iban>(BbanToIban(old_bban));
    } catch (const InvalidInputException &e) {
        Log::Warning("Old BBAN is invalid, leaving it unmodified. BBAN: " + old_bban + ", country: " +
                     country_code + ", error: " + ErrorMessage(e));
        return old_bban;
    }
    return IbanToBban(RegenerateIban(*old_iban));
}

Iban AccountGenerator::BbanToIban(const std::string &bban) {
    if (rule == CountryRule::SWEDEN) {
        return Iban::FromBban(country_code, swedish_mapper.ToIbanPart(compact_identifier(bban)));
    }
    return Iban::FromBban(country_code, bban);
}

std::string AccountGenerator::IbanToBban(const Iban &iban) {
    if (rule == CountryRule::SWEDEN) {
        return swedish_mapper.ToNationalBban(iban.GetBban());
    }
    return iban.GetBban();
}

std::string RegenerateIban(const std::string &old_iban) {
    unique_ptr<Iban> iban;
    try {
        iban = make_uniq<Iban>(Iban::Parse(old_iban));
    } catch (const InvalidInputException &e) {
        Log::Warning("Old IBAN is invalid, leaving it unmodified. IBAN: " + old_iban + ", error: " +
                     ErrorMessage(e));
        return old_iban;
    }
    AccountGenerator generator(iban->GetCountryCode());
    return generator.RegenerateIban(*iban).GetCompact();
}

std::string GenerateRandomIban(const std::string &country_code) {
    AccountGenerator generator(country_code);
    return generator.GenerateIban().GetCompact();
}

std::string RegenerateBban(const std::string &country_code, const std::string &old_bban) {
    AccountGenerator generator(country_code);
    return generator.RegenerateBban(old_bban);
}

} // namespace accountgen
} // namespace ibangen
} // namespace duckdb
