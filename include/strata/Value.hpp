/**
 * @file Value.hpp
 * @brief Value type for layered configuration data
 *
 * Uses nlohmann::ordered_json as the underlying value model so that maps
 * keep their insertion order across merges:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 */

#ifndef STRATA_VALUE_HPP
#define STRATA_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace strata {

/**
 * @brief JSON-like value type for configuration layers
 *
 * Alias for nlohmann::ordered_json. The merge engine dispatches on
 * Value::type(); see nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

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

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace strata

#endif // STRATA_VALUE_HPP
