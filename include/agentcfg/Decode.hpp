/**
 * @file Decode.hpp
 * @brief Configuration documents to fragments
 *
 * Two document formats are supported, JSON and TOML. Both describe the
 * same key layout:
 *
 * ```json
 * {
 *   "bind_addr": "0.0.0.0",
 *   "start_join": ["10.0.0.1"],
 *   "node_meta": {"rack": "r1"},
 *   "ports": {"dns": 8600}
 * }
 * ```
 *
 * ```toml
 * bind_addr = "0.0.0.0"
 * start_join = ["10.0.0.1"]
 *
 * [node_meta]
 * rack = "r1"
 *
 * [ports]
 * dns = 8600
 * ```
 *
 * Decoding rules:
 * - A key that is missing or null leaves the field absent
 * - A value of the wrong type is a ConfigParseError naming the key path
 * - Unknown keys are ignored with a warning
 * - Durations (retry_interval, retry_interval_wan) are strings parsed while
 *   decoding; check_update_interval is kept as text for the resolver
 */

#ifndef AGENTCFG_DECODE_HPP
#define AGENTCFG_DECODE_HPP

#include "agentcfg/Fragment.hpp"
#include "agentcfg/Value.hpp"

#include <string>

namespace agentcfg {

/**
 * @brief Document format
 */
enum class Format {
    Auto,  ///< Sniff from content, see detect_format()
    Json,
    Toml
};

/**
 * @brief Guess the format of a document
 *
 * @param text Document text
 * @return Format::Json if the first non-blank character is '{',
 *         Format::Toml otherwise
 */
Format detect_format(const std::string& text);

/**
 * @brief Decode a document into a fragment
 *
 * @param text Document text
 * @param format Document format, Format::Auto to sniff
 * @param source Name used in error messages (usually the file path)
 * @return Decoded fragment
 * @throws ConfigParseError on syntax errors, a non-object root, or type
 *         mismatches
 *
 * Examples:
 * ```cpp
 * parse_file(R"({"bootstrap": true})").bootstrap;      // true
 * parse_file("ports = { dns = 123 }").ports.dns;       // 123
 * parse_file(R"({"bootstrap": "yes"})");               // throws
 * ```
 */
ConfigFragment parse_file(const std::string& text,
                          Format format = Format::Auto,
                          const std::string& source = "<input>");

/**
 * @brief Map an already parsed document tree onto a fragment
 *
 * @param doc Document root, must be an object
 * @param source Name used in error messages
 * @throws ConfigParseError if doc is not an object or on type mismatches
 */
ConfigFragment fragment_from_value(const Value& doc, const std::string& source);

/**
 * @brief Render a fragment as a document tree
 *
 * Uses the same keys as the decoder; absent fields and empty containers
 * are omitted, durations are rendered with format_duration().
 */
Value fragment_to_value(const ConfigFragment& fragment);

} // namespace agentcfg

#endif // AGENTCFG_DECODE_HPP
