/**
 * @file Duration.hpp
 * @brief Duration type and Go-style duration literals
 *
 * Accepted syntax: an optional sign followed by one or more
 * `<decimal><unit>` terms, e.g. "300ms", "-1.5h", "2h45m". Valid units are
 * "ns", "us" (or "µs"), "ms", "s", "m", "h". A bare "0" is allowed.
 */

#ifndef AGENTCFG_DURATION_HPP
#define AGENTCFG_DURATION_HPP

#include <chrono>
#include <string>

namespace agentcfg {

/**
 * @brief Duration with nanosecond resolution
 */
using Duration = std::chrono::nanoseconds;

/**
 * @brief Parse a duration literal
 *
 * @param text Literal such as "5m" or "1h30m"
 * @return Parsed duration
 * @throws DurationError if the literal is malformed or overflows
 *
 * Examples:
 * ```cpp
 * parse_duration("5m");     // 300s
 * parse_duration("1.5h");   // 90m
 * parse_duration("0");      // 0
 * parse_duration("5");      // throws (missing unit)
 * ```
 */
Duration parse_duration(const std::string& text);

/**
 * @brief Render a duration in canonical form
 *
 * Durations of a second or more use "h", "m" and "s" components
 * ("1h30m0s", "5m0s", "1.5s"); smaller ones use the largest fitting
 * sub-second unit ("300ms", "12µs", "7ns"). Zero renders as "0s".
 */
std::string format_duration(Duration d);

} // namespace agentcfg

#endif // AGENTCFG_DURATION_HPP
