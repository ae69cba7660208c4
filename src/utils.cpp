#include "utils.hpp"

namespace duckdb {
namespace ibangen {

std::string trim(const std::string &str) {
    if (str.empty()) return str;

    size_t start = 0;
    size_t end = str.length() - 1;

    while (start <= end && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
        if (start == str.length()) {
            return "";
        }
    }

    while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
        end--;
    }

    return str.substr(start, end - start + 1);
}

std::string to_upper(const std::string &str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string compact_identifier(const std::string &str) {
    std::string cleaned;
    cleaned.reserve(str.size());
    for (char c : str) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            cleaned += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return cleaned;
}

bool is_digit_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c));
}

bool is_alpha_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c));
}

} // namespace ibangen
} // namespace duckdb
