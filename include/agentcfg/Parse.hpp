/**
 * @file Parse.hpp
 * @brief Scalar literal parsing for command line values
 *
 * Literal rules:
 * - Boolean: "1", "t", "T", "TRUE", "true", "True" -> true;
 *            "0", "f", "F", "FALSE", "false", "False" -> false
 * - Integer: optional sign, decimal or prefixed base ("0x1f", "0o17",
 *            "0b101", legacy leading-zero octal), must fit in int
 *
 * Both return std::nullopt on anything else so that callers can decide
 * whether a token is a value at all (see boolean flags).
 */

#ifndef AGENTCFG_PARSE_HPP
#define AGENTCFG_PARSE_HPP

#include <optional>
#include <string>

namespace agentcfg {

/**
 * @brief Parse a boolean literal
 *
 * @param str Input token
 * @return Parsed value, or std::nullopt if str is not a boolean literal
 *
 * Examples:
 * ```cpp
 * parse_bool("true");   // true
 * parse_bool("F");      // false
 * parse_bool("yes");    // nullopt
 * parse_bool("");       // nullopt
 * ```
 */
std::optional<bool> parse_bool(const std::string& str);

/**
 * @brief Parse an integer literal
 *
 * @param str Input token
 * @return Parsed value, or std::nullopt if str is malformed or out of range
 *
 * Examples:
 * ```cpp
 * parse_int("8500");    // 8500
 * parse_int("-1");      // -1
 * parse_int("0x10");    // 16
 * parse_int("12ab");    // nullopt
 * ```
 */
std::optional<int> parse_int(const std::string& str);

} // namespace agentcfg

#endif // AGENTCFG_PARSE_HPP
