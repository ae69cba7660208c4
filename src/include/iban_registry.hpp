#pragma once

#include "duckdb.hpp"
#include <regex>
#include <string>
#include <vector>

namespace duckdb {
namespace ibangen {

// Structure of one country's IBAN as published in the SWIFT IBAN registry.
// The BBAN format uses registry notation: "4!a6!n8!n" means four upper-case
// letters, six digits, eight digits. 'c' stands for an alphanumeric character.
struct IbanSpec {
    std::string country_code;
    idx_t iban_length;
    std::string bban_format;
    idx_t bank_offset;
    idx_t bank_code_length;
    idx_t branch_code_length;
    idx_t account_code_length;

    idx_t BbanLength() const {
        return iban_length - 4;
    }
    idx_t AccountOffset() const {
        return bank_offset + bank_code_length + branch_code_length;
    }

    // True when the BBAN has the registry length and character classes
    bool Matches(const std::string &bban) const;

    // One 'n', 'a' or 'c' per BBAN position in [offset, offset + length)
    std::string CharacterClasses(idx_t offset, idx_t length) const;

    std::regex pattern;
    std::string position_classes;
};

class IbanRegistry {
public:
    // nullptr for countries without a registry entry
    static const IbanSpec *Find(const std::string &country_code);
    // Throws InvalidInputException for countries without a registry entry
    static const IbanSpec &Get(const std::string &country_code);
    static std::vector<std::string> Countries();
};

// A structurally valid IBAN, always held in compact upper-case form
class Iban {
public:
    // Throws InvalidInputException when the text is not a valid IBAN
    static Iban Parse(const std::string &text);
    // Computes the check digits for a national BBAN and validates the result
    static Iban FromBban(const std::string &country_code, const std::string &bban);
    // bank_code holds bank and branch code together; both parts are zero-padded
    static Iban Generate(const std::string &country_code, const std::string &bank_code,
                         const std::string &account_code);

    static bool IsValid(const std::string &text);
    static std::string ComputeCheckDigits(const std::string &country_code, const std::string &bban);

    const std::string &GetCompact() const {
        return compact;
    }
    std::string GetCountryCode() const;
    std::string GetCheckDigits() const;
    std::string GetBban() const;
    std::string GetBankCode() const;
    std::string GetBranchCode() const;
    std::string GetAccountCode() const;
    // Groups of four characters separated by spaces
    // Compacts any text and groups it in blocks of four, valid or not
    static std::string Format(const std::string &text);

private:
    Iban(const IbanSpec &spec, std::string compact);

    const IbanSpec *spec;
    std::string compact;
};

} // namespace ibangen
} // namespace duckdb
