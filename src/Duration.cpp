/**
 * @file Duration.cpp
 * @brief Implementation of duration parsing and formatting
 */

#include "agentcfg/Duration.hpp"
#include "agentcfg/Errors.hpp"

#include <cctype>
#include <cstdint>
#include <limits>

namespace agentcfg {

namespace {

constexpr std::uint64_t kMaxMagnitude = std::uint64_t{1} << 63;

constexpr std::uint64_t kNanosecond  = 1;
constexpr std::uint64_t kMicrosecond = 1000 * kNanosecond;
constexpr std::uint64_t kMillisecond = 1000 * kMicrosecond;
constexpr std::uint64_t kSecond      = 1000 * kMillisecond;
constexpr std::uint64_t kMinute      = 60 * kSecond;
constexpr std::uint64_t kHour        = 60 * kMinute;

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief Map a unit suffix to its length in nanoseconds (0 = unknown)
 */
std::uint64_t unit_nanos(const std::string& unit) {
    if (unit == "ns") return kNanosecond;
    if (unit == "us") return kMicrosecond;
    if (unit == "\xC2\xB5s") return kMicrosecond;  // U+00B5 micro sign
    if (unit == "\xCE\xBCs") return kMicrosecond;  // U+03BC greek mu
    if (unit == "ms") return kMillisecond;
    if (unit == "s") return kSecond;
    if (unit == "m") return kMinute;
    if (unit == "h") return kHour;
    return 0;
}

/**
 * @brief Emit the fractional digits of v / 10^prec, trailing zeros dropped
 *
 * On return v holds the integer part.
 */
std::string fraction_digits(std::uint64_t& v, int prec) {
    std::string digits;
    bool print = false;
    for (int i = 0; i < prec; ++i) {
        const auto digit = static_cast<char>(v % 10);
        print = print || digit != 0;
        if (print) digits.insert(digits.begin(), static_cast<char>('0' + digit));
        v /= 10;
    }
    if (print) digits.insert(digits.begin(), '.');
    return digits;
}

} // anonymous namespace

Duration parse_duration(const std::string& text) {
    std::size_t pos = 0;
    bool negative = false;

    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        ++pos;
    }

    if (text.compare(pos, std::string::npos, "0") == 0) {
        return Duration::zero();
    }
    if (pos >= text.size()) {
        throw DurationError(text);
    }

    std::uint64_t total = 0;
    while (pos < text.size()) {
        if (!(text[pos] == '.' || is_digit(text[pos]))) {
            throw DurationError(text);
        }

        // integer part
        std::uint64_t whole = 0;
        const std::size_t whole_start = pos;
        while (pos < text.size() && is_digit(text[pos])) {
            if (whole > kMaxMagnitude / 10) throw DurationError(text);
            whole = whole * 10 + static_cast<std::uint64_t>(text[pos] - '0');
            if (whole > kMaxMagnitude) throw DurationError(text);
            ++pos;
        }
        const bool has_whole = pos != whole_start;

        // fractional part; digits beyond what fits are dropped
        std::uint64_t frac = 0;
        double scale = 1.0;
        bool has_frac = false;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            const std::size_t frac_start = pos;
            bool overflow = false;
            while (pos < text.size() && is_digit(text[pos])) {
                if (!overflow) {
                    if (frac > (std::numeric_limits<std::int64_t>::max() - 9) / 10) {
                        overflow = true;
                    } else {
                        frac = frac * 10 + static_cast<std::uint64_t>(text[pos] - '0');
                        scale *= 10;
                    }
                }
                ++pos;
            }
            has_frac = pos != frac_start;
        }
        if (!has_whole && !has_frac) {
            throw DurationError(text);
        }

        // unit
        const std::size_t unit_start = pos;
        while (pos < text.size() && text[pos] != '.' && !is_digit(text[pos])) {
            ++pos;
        }
        if (pos == unit_start) {
            throw DurationError(text);
        }
        const std::uint64_t unit = unit_nanos(text.substr(unit_start, pos - unit_start));
        if (unit == 0) {
            throw DurationError(text);
        }

        if (whole > kMaxMagnitude / unit) throw DurationError(text);
        std::uint64_t term = whole * unit;
        if (frac > 0) {
            term += static_cast<std::uint64_t>(static_cast<double>(frac) *
                                               (static_cast<double>(unit) / scale));
            if (term > kMaxMagnitude) throw DurationError(text);
        }
        if (term > kMaxMagnitude - total) throw DurationError(text);
        total += term;
    }

    if (negative) {
        if (total == kMaxMagnitude) return Duration(std::numeric_limits<std::int64_t>::min());
        return Duration(-static_cast<std::int64_t>(total));
    }
    if (total > kMaxMagnitude - 1) {
        throw DurationError(text);
    }
    return Duration(static_cast<std::int64_t>(total));
}

std::string format_duration(Duration d) {
    const std::int64_t count = d.count();
    if (count == 0) return "0s";

    const bool negative = count < 0;
    std::uint64_t u = negative ? std::uint64_t{0} - static_cast<std::uint64_t>(count)
                               : static_cast<std::uint64_t>(count);

    std::string out;
    if (u < kSecond) {
        std::string unit;
        int prec = 0;
        if (u < kMicrosecond) {
            unit = "ns";
        } else if (u < kMillisecond) {
            prec = 3;
            unit = "\xC2\xB5s";
        } else {
            prec = 6;
            unit = "ms";
        }
        const std::string frac = fraction_digits(u, prec);
        out = std::to_string(u) + frac + unit;
    } else {
        const std::string frac = fraction_digits(u, 9);
        out = std::to_string(u % 60) + frac + "s";
        u /= 60;
        if (u > 0) {
            out = std::to_string(u % 60) + "m" + out;
            u /= 60;
            if (u > 0) {
                out = std::to_string(u) + "h" + out;
            }
        }
    }

    return negative ? "-" + out : out;
}

} // namespace agentcfg
