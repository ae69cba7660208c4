#include "iban_registry.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdio>
#include <map>

namespace duckdb {
namespace ibangen {

struct IbanSpecEntry {
    const char *country_code;
    idx_t iban_length;
    const char *bban_format;
    idx_t bank_offset;
    idx_t bank_code_length;
    idx_t branch_code_length;
};

// IBAN structures (SWIFT IBAN registry). Bank and branch lengths follow the
// registry's "bank identifier" and "branch identifier" positions.
static const IbanSpecEntry IBAN_SPECS[] = {
    {"AD", 24, "4!n4!n12!c", 0, 4, 4},        {"AE", 23, "3!n16!n", 0, 3, 0},
    {"AL", 28, "8!n16!c", 0, 3, 4},           {"AT", 20, "5!n11!n", 0, 5, 0},
    {"AZ", 28, "4!a20!c", 0, 4, 0},           {"BA", 20, "3!n3!n8!n2!n", 0, 3, 3},
    {"BE", 16, "3!n7!n2!n", 0, 3, 0},         {"BG", 22, "4!a4!n2!n8!c", 0, 4, 4},
    {"BH", 22, "4!a14!c", 0, 4, 0},           {"BY", 28, "4!c4!n16!c", 0, 4, 4},
    {"CH", 21, "5!n12!c", 0, 5, 0},           {"CR", 22, "4!n14!n", 0, 4, 0},
    {"CY", 28, "3!n5!n16!c", 0, 3, 5},        {"CZ", 24, "4!n6!n10!n", 0, 4, 0},
    {"DE", 22, "8!n10!n", 0, 8, 0},           {"DK", 18, "4!n9!n1!n", 0, 4, 0},
    {"DO", 28, "4!c20!n", 0, 4, 0},           {"EE", 20, "2!n2!n11!n1!n", 0, 2, 0},
    {"EG", 29, "4!n4!n17!n", 0, 4, 4},        {"ES", 24, "4!n4!n1!n1!n10!n", 0, 4, 4},
    {"FI", 18, "3!n11!n", 0, 3, 0},           {"FO", 18, "4!n9!n1!n", 0, 4, 0},
    {"FR", 27, "5!n5!n11!c2!n", 0, 5, 5},     {"GB", 22, "4!a6!n8!n", 0, 4, 6},
    {"GE", 22, "2!a16!n", 0, 2, 0},           {"GI", 23, "4!a15!c", 0, 4, 0},
    {"GL", 18, "4!n9!n1!n", 0, 4, 0},         {"GR", 27, "3!n4!n16!c", 0, 3, 4},
    {"GT", 28, "4!c20!c", 0, 4, 0},           {"HR", 21, "7!n10!n", 0, 7, 0},
    {"HU", 28, "3!n4!n1!n15!n1!n", 0, 3, 4},  {"IE", 22, "4!a6!n8!n", 0, 4, 6},
    {"IL", 23, "3!n3!n13!n", 0, 3, 3},        {"IS", 26, "4!n2!n6!n10!n", 0, 4, 0},
    {"IT", 27, "1!a5!n5!n12!c", 1, 5, 5},     {"JO", 30, "4!a4!n18!c", 0, 4, 4},
    {"KW", 30, "4!a22!c", 0, 4, 0},           {"KZ", 20, "3!n13!c", 0, 3, 0},
    {"LB", 28, "4!n20!c", 0, 4, 0},           {"LC", 32, "4!a24!c", 0, 4, 0},
    {"LI", 21, "5!n12!c", 0, 5, 0},           {"LT", 20, "5!n11!n", 0, 5, 0},
    {"LU", 20, "3!n13!c", 0, 3, 0},           {"LV", 21, "4!a13!c", 0, 4, 0},
    {"MC", 27, "5!n5!n11!c2!n", 0, 5, 5},     {"MD", 24, "2!c18!c", 0, 2, 0},
    {"ME", 22, "3!n13!n2!n", 0, 3, 0},        {"MK", 19, "3!n10!c2!n", 0, 3, 0},
    {"MR", 27, "5!n5!n11!n2!n", 0, 5, 5},     {"MT", 31, "4!a5!n18!c", 0, 4, 5},
    {"NL", 18, "4!a10!n", 0, 4, 0},           {"NO", 15, "4!n6!n1!n", 0, 4, 0},
    {"PK", 24, "4!a16!c", 0, 4, 0},           {"PL", 28, "8!n16!n", 0, 8, 0},
    {"PS", 29, "4!a21!c", 0, 4, 0},           {"PT", 25, "4!n4!n11!n2!n", 0, 4, 4},
    {"QA", 29, "4!a21!c", 0, 4, 0},           {"RO", 24, "4!a16!c", 0, 4, 0},
    {"RS", 22, "3!n13!n2!n", 0, 3, 0},        {"SA", 24, "2!n18!c", 0, 2, 0},
    {"SE", 24, "3!n16!n1!n", 0, 3, 0},        {"SI", 19, "5!n8!n2!n", 0, 5, 0},
    {"SK", 24, "4!n6!n10!n", 0, 4, 0},        {"TN", 24, "2!n3!n13!n2!n", 0, 2, 3},
    {"TR", 26, "5!n1!n16!c", 0, 5, 0},        {"UA", 29, "6!n19!c", 0, 6, 0},
    {"VG", 24, "4!a16!n", 0, 4, 0},           {"XK", 20, "4!n10!n2!n", 0, 4, 0},
};

// Expands "4!a6!n" into a regex and into one class letter per position
static void CompileBbanFormat(IbanSpec &spec) {
    std::string regex_text;
    std::string classes;
    const std::string &format = spec.bban_format;
    size_t pos = 0;
    while (pos < format.size()) {
        size_t digits_end = pos;
        while (digits_end < format.size() && is_digit_char(format[digits_end])) {
            digits_end++;
        }
        if (digits_end == pos || digits_end + 1 >= format.size() || format[digits_end] != '!') {
            throw InternalException("Malformed BBAN format '%s' for %s", format.c_str(), spec.country_code.c_str());
        }
        idx_t count = std::stoul(format.substr(pos, digits_end - pos));
        char char_class = format[digits_end + 1];
        switch (char_class) {
            case 'n': regex_text += "[0-9]"; break;
            case 'a': regex_text += "[A-Z]"; break;
            case 'c': regex_text += "[A-Z0-9]"; break;
            default:
                throw InternalException("Unknown character class '%s' in BBAN format for %s",
                                        std::string(1, char_class), spec.country_code.c_str());
        }
        regex_text += "{" + std::to_string(count) + "}";
        classes.append(count, char_class);
        pos = digits_end + 2;
    }
    if (classes.size() != spec.BbanLength()) {
        throw InternalException("BBAN format '%s' does not match IBAN length %llu for %s", format.c_str(),
                                spec.iban_length, spec.country_code.c_str());
    }
    spec.pattern = std::regex(regex_text);
    spec.position_classes = classes;
}

static const std::map<std::string, IbanSpec> &GetSpecs() {
    static const std::map<std::string, IbanSpec> specs = [] {
        std::map<std::string, IbanSpec> result;
        for (const auto &entry : IBAN_SPECS) {
            IbanSpec spec;
            spec.country_code = entry.country_code;
            spec.iban_length = entry.iban_length;
            spec.bban_format = entry.bban_format;
            spec.bank_offset = entry.bank_offset;
            spec.bank_code_length = entry.bank_code_length;
            spec.branch_code_length = entry.branch_code_length;
            spec.account_code_length =
                spec.BbanLength() - entry.bank_offset - entry.bank_code_length - entry.branch_code_length;
            CompileBbanFormat(spec);
            result.emplace(spec.country_code, std::move(spec));
        }
        return result;
    }();
    return specs;
}

bool IbanSpec::Matches(const std::string &bban) const {
    return bban.size() == BbanLength() && std::regex_match(bban, pattern);
}

std::string IbanSpec::CharacterClasses(idx_t offset, idx_t length) const {
    if (offset + length > position_classes.size()) {
        throw InternalException("BBAN position %llu+%llu out of range for %s", offset, length, country_code.c_str());
    }
    return position_classes.substr(offset, length);
}

const IbanSpec *IbanRegistry::Find(const std::string &country_code) {
    auto &specs = GetSpecs();
    auto it = specs.find(to_upper(country_code));
    if (it == specs.end()) {
        return nullptr;
    }
    return &it->second;
}

const IbanSpec &IbanRegistry::Get(const std::string &country_code) {
    auto spec = Find(country_code);
    if (!spec) {
        throw InvalidInputException("Unsupported IBAN country code '%s'", country_code.c_str());
    }
    return *spec;
}

std::vector<std::string> IbanRegistry::Countries() {
    std::vector<std::string> countries;
    for (auto &entry : GetSpecs()) {
        countries.push_back(entry.first);
    }
    return countries;
}

// ISO 7064 mod 97-10 over the rearranged IBAN, letters count as A=10 .. Z=35
static int Mod97(const std::string &rearranged) {
    int remainder = 0;
    for (char c : rearranged) {
        if (is_digit_char(c)) {
            remainder = (remainder * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            remainder = (remainder * 100 + (c - 'A' + 10)) % 97;
        } else {
            throw InvalidInputException("Invalid character '%s' in IBAN", std::string(1, c));
        }
    }
    return remainder;
}

std::string Iban::ComputeCheckDigits(const std::string &country_code, const std::string &bban) {
    int check = 98 - Mod97(bban + to_upper(country_code) + "00");
    char buffer[3];
    snprintf(buffer, sizeof(buffer), "%02d", check);
    return std::string(buffer);
}

Iban::Iban(const IbanSpec &spec_p, std::string compact_p) : spec(&spec_p), compact(std::move(compact_p)) {
}

Iban Iban::Parse(const std::string &text) {
    std::string cleaned = compact_identifier(text);

    if (cleaned.length() < 5) {
        throw InvalidInputException("IBAN '%s' is too short", text.c_str());
    }
    if (!is_alpha_char(cleaned[0]) || !is_alpha_char(cleaned[1])) {
        throw InvalidInputException("IBAN '%s' does not start with a country code", text.c_str());
    }
    if (!is_digit_char(cleaned[2]) || !is_digit_char(cleaned[3])) {
        throw InvalidInputException("IBAN '%s' has non-numeric check digits", text.c_str());
    }

    auto &spec = IbanRegistry::Get(cleaned.substr(0, 2));
    if (cleaned.length() != spec.iban_length) {
        throw InvalidInputException("IBAN '%s' has length %llu, expected %llu for %s", text.c_str(),
                                    static_cast<idx_t>(cleaned.length()), spec.iban_length,
                                    spec.country_code.c_str());
    }

    std::string bban = cleaned.substr(4);
    if (!spec.Matches(bban)) {
        throw InvalidInputException("IBAN '%s' does not match the %s BBAN format %s", text.c_str(),
                                    spec.country_code.c_str(), spec.bban_format.c_str());
    }

    // Move the country code and check digits to the end, mod 97 must be 1
    if (Mod97(bban + cleaned.substr(0, 4)) != 1) {
        throw InvalidInputException("IBAN '%s' has invalid check digits", text.c_str());
    }
    return Iban(spec, std::move(cleaned));
}

Iban Iban::FromBban(const std::string &country_code, const std::string &bban) {
    auto &spec = IbanRegistry::Get(country_code);
    std::string cleaned = compact_identifier(bban);
    if (!spec.Matches(cleaned)) {
        throw InvalidInputException("BBAN '%s' does not match the %s BBAN format %s", bban.c_str(),
                                    spec.country_code.c_str(), spec.bban_format.c_str());
    }
    return Parse(spec.country_code + ComputeCheckDigits(spec.country_code, cleaned) + cleaned);
}

Iban Iban::Generate(const std::string &country_code, const std::string &bank_code,
                    const std::string &account_code) {
    auto &spec = IbanRegistry::Get(country_code);
    if (spec.bank_offset != 0) {
        throw InvalidInputException("%s BBANs start with a national check character, build them with FromBban",
                                    spec.country_code.c_str());
    }
    idx_t bank_length = spec.bank_code_length + spec.branch_code_length;
    if (bank_code.size() > bank_length) {
        throw InvalidInputException("Bank code '%s' is longer than %llu characters for %s", bank_code.c_str(),
                                    bank_length, spec.country_code.c_str());
    }
    if (account_code.size() > spec.account_code_length) {
        throw InvalidInputException("Account code '%s' is longer than %llu characters for %s",
                                    account_code.c_str(), spec.account_code_length, spec.country_code.c_str());
    }
    std::string bban = std::string(bank_length - bank_code.size(), '0') + bank_code +
                       std::string(spec.account_code_length - account_code.size(), '0') + account_code;
    return FromBban(spec.country_code, bban);
}

bool Iban::IsValid(const std::string &text) {
    try {
        Parse(text);
        return true;
    } catch (const InvalidInputException &) {
        return false;
    }
}

std::string Iban::GetCountryCode() const {
    return compact.substr(0, 2);
}

std::string Iban::GetCheckDigits() const {
    return compact.substr(2, 2);
}

std::string Iban::GetBban() const {
    return compact.substr(4);
}

std::string Iban::GetBankCode() const {
    return compact.substr(4 + spec->bank_offset, spec->bank_code_length);
}

std::string Iban::GetBranchCode() const {
    return compact.substr(4 + spec->bank_offset + spec->bank_code_length, spec->branch_code_length);
}

std::string Iban::GetAccountCode() const {
    return compact.substr(4 + spec->AccountOffset());
}

std::string Iban::Format(const std::string &text) {
    std::string cleaned = compact_identifier(text);
    std::string formatted;
    for (size_t i = 0; i < cleaned.length(); i++) {
        if (i > 0 && i % 4 == 0) {
            formatted += ' ';
        }
        formatted += cleaned[i];
    }
    return formatted;
}

} // namespace ibangen
} // namespace duckdb
