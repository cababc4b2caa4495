/**
 * @file Value.hpp
 * @brief Document tree type shared by the JSON and TOML decoders
 *
 * Both document formats are first parsed into a nlohmann::json tree and
 * then mapped onto a ConfigFragment by a single decoder.
 */

#ifndef AGENTCFG_VALUE_HPP
#define AGENTCFG_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace agentcfg {

/**
 * @brief JSON-like document value
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace agentcfg

#endif // AGENTCFG_VALUE_HPP
