/**
 * @file Value.hpp
 * @brief Value and attribute map types for person attributes
 *
 * Attribute values use nlohmann::ordered_json as the underlying value model,
 * so a single attribute value may be any of:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array / Object
 *
 * An attribute map associates each attribute name with an ordered list of
 * values. The list itself may be absent for a key (std::nullopt), which is
 * distinct from an empty list.
 */

#ifndef PERSONDIR_VALUE_HPP
#define PERSONDIR_VALUE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace persondir {

/**
 * @brief JSON-like value type for a single attribute value
 *
 * Alias for nlohmann::ordered_json: objects keep insertion order, so
 * documents are written back in the order they were read. See the
 * nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Ordered sequence of values for one attribute
 */
using AttributeValues = std::vector<Value>;

/**
 * @brief Attribute name to (possibly absent) ordered value list
 *
 * Backed by nlohmann::ordered_map so iteration follows insertion order,
 * which keeps merge output deterministic.
 */
using AttributeMap = nlohmann::ordered_map<std::string, std::optional<AttributeValues>>;

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

} // namespace persondir

#endif // PERSONDIR_VALUE_HPP
