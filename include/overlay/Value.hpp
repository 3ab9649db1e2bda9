/**
 * @file Value.hpp
 * @brief Value type for overlay documents
 *
 * Uses nlohmann::json as the underlying tagged value model:
 * - Null
 * - Bool (true | false)
 * - Number (integer or floating storage, compared numerically)
 * - String (std::string, UTF-8)
 * - Sequence (array: [Value, ...])
 * - Mapping (object: {String: Value, ...}, keys iterate in ascending order)
 */

#ifndef OVERLAY_VALUE_HPP
#define OVERLAY_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace overlay {

/**
 * @brief Tagged document value
 *
 * Alias for nlohmann::json. Engine code branches on the tag through
 * is_null(), is_boolean(), is_number(), is_string(), is_array() and
 * is_object(); arrays are Sequences and objects are Mappings.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable kind name for a Value
 * @param val The value to inspect
 * @return "null", "bool", "number", "string", "sequence" or "mapping"
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "bool";
    if (val.is_number()) return "number";
    if (val.is_string()) return "string";
    if (val.is_array()) return "sequence";
    if (val.is_object()) return "mapping";
    return "unknown";
}

/**
 * @brief Check if value is a container (sequence or mapping)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace overlay

#endif // OVERLAY_VALUE_HPP
