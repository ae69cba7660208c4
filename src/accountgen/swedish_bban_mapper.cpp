#include "swedish_bban_mapper.hpp"
#include "ibangen_log.hpp"

namespace duckdb {
namespace ibangen {
namespace accountgen {

// The last capture group is always the account number
const std::vector<SwedishBbanMapper::BankFormat> &SwedishBbanMapper::NationalFormats() {
    static const std::vector<BankFormat> formats = {
        {"Danske", std::regex("^1(\\d{3})(\\d{11})$"), "120000000$2"},
        {"Nordea", std::regex("^3(\\d{3})(\\d{11})$"), "300000000$2"},
        {"ICA-banken", std::regex("^927(\\d)(\\d{7})$"), "927000000927$1$2"},
        {"SEB", std::regex("^5(\\d{3})(\\d{7})$"), "5000000005$1$2"},
        {"Handelsbanken", std::regex("^6(\\d{3})(\\d{9})$"), "60000000000$2"},
        {"Swedbank", std::regex("^7(\\d{3})(\\d{7})$"), "8000000007$1$2"},
        {"Swedbank", std::regex("^8(\\d{4})(\\d{10})$"), "800008$1$2"},
        {"Plusgirot", std::regex("^(\\d{8})$"), "950000996000$1"},
    };
    return formats;
}

const std::vector<SwedishBbanMapper::BankFormat> &SwedishBbanMapper::IbanFormats() {
    static const std::vector<BankFormat> formats = {
        {"Danske", std::regex("^120000000(\\d{11})$"), "1000$1"},
        {"Nordea", std::regex("^300000000(\\d{11})$"), "3000$1"},
        {"ICA-banken", std::regex("^927000000927(\\d)(\\d{7})$"), "927$1$2"},
        {"SEB", std::regex("^5000000005(\\d{3})(\\d{7})$"), "5$1$2"},
        {"Handelsbanken", std::regex("^60000000000(\\d{9})$"), "6000$1"},
        {"Swedbank", std::regex("^8000000007(\\d{3})(\\d{7})$"), "7$1$2"},
        {"Swedbank", std::regex("^800008(\\d{4})(\\d{10})$"), "8$1$2"},
        {"Plusgirot", std::regex("^9500009960(\\d{2})(\\d{8})$"), "$2"},
    };
    return formats;
}

void SwedishBbanMapper::Remember(const std::string &national_prefix, const std::string &iban_part_prefix) {
    bban_prefix = national_prefix;
    iban_prefix = iban_part_prefix;
    discovered = true;
}

std::string SwedishBbanMapper::ToIbanPart(const std::string &bban) {
    if (discovered && bban.size() >= bban_prefix.size()) {
        return iban_prefix + bban.substr(bban_prefix.size());
    }

    if (bban.size() == STANDARD_BBAN_LENGTH) {
        return bban;
    }

    std::smatch match;
    for (auto &format : NationalFormats()) {
        if (!std::regex_match(bban, match, format.pattern)) {
            continue;
        }
        std::string iban_part = match.format(format.replacement);
        size_t account_length = match.length(match.size() - 1);
        Remember(bban.substr(0, bban.size() - account_length),
                 iban_part.substr(0, STANDARD_BBAN_LENGTH - account_length));
        Log::Debug("Swedish " + std::string(format.bank) + " BBAN with non-standard length, bank part " +
                   iban_prefix + ", account number length " + std::to_string(account_length));
        return iban_part;
    }

    Log::Warning("Unrecognized Swedish BBAN format: " + bban);
    return bban;
}

std::string SwedishBbanMapper::ToNationalBban(const std::string &iban_part) {
    if (discovered && iban_part.size() >= iban_prefix.size()) {
        return bban_prefix + iban_part.substr(iban_prefix.size());
    }

    std::smatch match;
    for (auto &format : IbanFormats()) {
        if (!std::regex_match(iban_part, match, format.pattern)) {
            continue;
        }
        std::string bban = match.format(format.replacement);
        size_t account_length = match.length(match.size() - 1);
        Remember(bban.substr(0, bban.size() - account_length),
                 iban_part.substr(0, STANDARD_BBAN_LENGTH - account_length));
        Log::Debug("Swedish " + std::string(format.bank) + " IBAN, bank part " + iban_prefix +
                   ", account number length " + std::to_string(account_length));
        return bban;
    }

    return iban_part;
}

} // namespace accountgen
} // namespace ibangen
} // namespace duckdb
