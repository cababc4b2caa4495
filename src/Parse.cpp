/**
 * @file Parse.cpp
 * @brief Implementation of scalar literal parsing
 */

#include "agentcfg/Parse.hpp"

#include <cctype>
#include <cstdint>
#include <limits>

namespace agentcfg {

namespace {

/**
 * @brief Value of a digit in any base up to 16, or -1
 */
int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::optional<bool> parse_bool(const std::string& str) {
    if (str == "1" || str == "t" || str == "T" ||
        str == "TRUE" || str == "true" || str == "True") {
        return true;
    }
    if (str == "0" || str == "f" || str == "F" ||
        str == "FALSE" || str == "false" || str == "False") {
        return false;
    }
    return std::nullopt;
}

std::optional<int> parse_int(const std::string& str) {
    size_t pos = 0;
    bool negative = false;
    if (pos < str.size() && (str[pos] == '+' || str[pos] == '-')) {
        negative = str[pos] == '-';
        ++pos;
    }
    if (pos >= str.size()) {
        return std::nullopt;
    }

    // Base prefix
    int base = 10;
    if (str[pos] == '0' && pos + 1 < str.size()) {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(str[pos + 1])));
        if (p == 'x') { base = 16; pos += 2; }
        else if (p == 'o') { base = 8; pos += 2; }
        else if (p == 'b') { base = 2; pos += 2; }
        else { base = 8; pos += 1; }
        if (pos >= str.size()) {
            return std::nullopt;
        }
    }

    const std::int64_t limit = negative
        ? -static_cast<std::int64_t>(std::numeric_limits<int>::min())
        : static_cast<std::int64_t>(std::numeric_limits<int>::max());

    std::int64_t magnitude = 0;
    for (; pos < str.size(); ++pos) {
        const int d = digit_value(str[pos]);
        if (d < 0 || d >= base) {
            return std::nullopt;
        }
        magnitude = magnitude * base + d;
        if (magnitude > limit) {
            return std::nullopt;
        }
    }

    return static_cast<int>(negative ? -magnitude : magnitude);
}

} // namespace agentcfg
