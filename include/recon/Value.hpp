/**
 * @file Value.hpp
 * @brief Value type for property bags and literal trees
 *
 * Uses nlohmann::ordered_json as the underlying value model so that map
 * entries keep their insertion order:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * Values JSON has no native shape for (dates, enumerations, credentials,
 * code blocks, ...) are objects tagged with the "$type" marker key; see
 * Typed.hpp.
 */

#ifndef RECON_VALUE_HPP
#define RECON_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace recon {

/**
 * @brief Ordered JSON-like value type
 *
 * Alias for nlohmann::ordered_json. Supports the full nlohmann API:
 * is_*() queries, get<T>(), size(), operator[], at(), iteration and the
 * comparison operators (used for array sorting in the comparator).
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 *
 * Typed leaves report their class (enumerations, typed scalars, objects)
 * or their kind (datetime, secure, credential, ...). Plain values report
 * "null", "boolean", "integer", "float", "string", "array" or "object".
 *
 * @param val The value to inspect
 * @return Type name string used by the comparator's type check
 */
std::string type_name(const Value& val);

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace recon

#endif // RECON_VALUE_HPP
