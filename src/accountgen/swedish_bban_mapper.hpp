#pragma once

#include "duckdb.hpp"
#include <regex>
#include <string>
#include <vector>

namespace duckdb {
namespace ibangen {
namespace accountgen {

// Swedish IBANs always carry a 20 digit BBAN, but the account numbers people
// use are bank specific and shorter:
//
//   Bank           National            IBAN BBAN part
//   Danske         1bbb aaaaaaaaaaa    1200 0000 0aaa aaaa aaaa
//   Nordea         3bbb aaaaaaaaaaa    3000 0000 0aaa aaaa aaaa
//   ICA-banken     927b aaaaaaa        9270 0000 0927 baaa aaaa
//   SEB            5bbb aaaaaaa        5000 0000 05bb baaa aaaa
//   Handelsbanken  6bbb aaaaaaaaa      6000 0000 000a aaaa aaaa
//   Swedbank       7bbb aaaaaaa        8000 0000 07bb baaa aaaa
//   Swedbank       8bbbb aaaaaaaaaa    8000 08bb bbaa aaaa aaaa
//   Plusgirot      aaaaaaaa            9500 0099 6000 aaaa aaaa
//
// The first conversion that recognizes a bank format remembers the bank part
// on both sides and every later conversion reuses it. One mapper therefore
// serves the account numbers of a single bank; feeding it numbers of another
// bank afterwards silently applies the first bank's prefixes.
class SwedishBbanMapper {
public:
    static constexpr idx_t STANDARD_BBAN_LENGTH = 20;

    // National account number to the 20 digit BBAN part of the IBAN.
    // Unrecognized formats are logged and returned unchanged.
    std::string ToIbanPart(const std::string &bban);
    // 20 digit BBAN part back to the national account number. Parts without
    // a bank specific format are returned unchanged.
    std::string ToNationalBban(const std::string &iban_part);

    bool HasDiscoveredMapping() const {
        return discovered;
    }
    const std::string &GetBbanPrefix() const {
        return bban_prefix;
    }
    const std::string &GetIbanPrefix() const {
        return iban_prefix;
    }

private:
    struct BankFormat {
        const char *bank;
        std::regex pattern;
        std::string replacement;
    };

    static const std::vector<BankFormat> &NationalFormats();
    static const std::vector<BankFormat> &IbanFormats();

    void Remember(const std::string &national_prefix, const std::string &iban_part_prefix);

    bool discovered = false;
    std::string bban_prefix;
    std::string iban_prefix;
};

} // namespace accountgen
} // namespace ibangen
} // namespace duckdb
