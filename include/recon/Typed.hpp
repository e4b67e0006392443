/**
 * @file Typed.hpp
 * @brief Construction and inspection of typed leaves
 *
 * A typed leaf is an object whose "$type" member names its kind:
 *
 * | kind         | members                                         |
 * |--------------|-------------------------------------------------|
 * | "datetime"   | value (ISO-8601 string)                         |
 * | "enum"       | class, name, value (integer)                    |
 * | "secure"     | value (decrypted text)                          |
 * | "credential" | username, password                              |
 * | "script"     | value (block source without outer braces)       |
 * | "handle"     | value (integer)                                 |
 * | "markup"     | value (XML text)                                |
 * | "table"      | rows (array)                                    |
 * | "ordered"    | entries (object)                                |
 * | "scalar"     | class, value                                    |
 * | "object"     | class, properties, extended, entries, items     |
 *
 * Property bags read from JSON or TOML can carry the same shapes, which is
 * how files express dates or credentials.
 */

#ifndef RECON_TYPED_HPP
#define RECON_TYPED_HPP

#include "recon/Value.hpp"
#include <cstdint>
#include <string>

namespace recon {
namespace typed {

/// Marker key identifying a typed leaf
inline constexpr const char* kTag = "$type";

inline constexpr const char* kDateTime   = "datetime";
inline constexpr const char* kEnum       = "enum";
inline constexpr const char* kSecure     = "secure";
inline constexpr const char* kCredential = "credential";
inline constexpr const char* kScript     = "script";
inline constexpr const char* kHandle     = "handle";
inline constexpr const char* kMarkup     = "markup";
inline constexpr const char* kTable      = "table";
inline constexpr const char* kOrdered    = "ordered";
inline constexpr const char* kScalar     = "scalar";
inline constexpr const char* kObject     = "object";

// ---------------------------------------------------------------------------
// Constructors
// ---------------------------------------------------------------------------

Value datetime(const std::string& iso);
Value enumeration(const std::string& cls, const std::string& name, std::int64_t value);
Value secure(const std::string& text);
Value credential(const std::string& username, const std::string& password);
Value script(const std::string& source);
Value handle(std::int64_t value);
Value markup(const std::string& xml);
Value table(Value rows);
Value ordered(Value entries);
Value scalar(const std::string& cls, Value raw);

/**
 * @brief Build a structured object leaf
 *
 * @param cls Class name shown by strong rendering
 * @param properties Declared properties (preferred when non-empty)
 * @param extended Incidental properties, used when no declared ones exist
 */
Value object(const std::string& cls, Value properties,
             Value extended = Value::object());

/**
 * @brief Build a structured object leaf that only exposes enumeration
 *
 * Renders as a sequence of @p items.
 */
Value collection(const std::string& cls, Value items);

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

/**
 * @brief Kind of a typed leaf
 * @return The "$type" string, or an empty string for plain values
 */
std::string kind_of(const Value& val);

/// True when @p val is a typed leaf of the given kind
bool is(const Value& val, const char* kind);

/// True when @p val carries a recognised "$type" marker
bool is_typed(const Value& val);

/// Class name of enum, scalar and object leaves (empty otherwise)
std::string class_of(const Value& val);

/**
 * @brief Normalize a property-bag-like value to a plain object
 *
 * Plain objects are returned unchanged; "ordered" leaves yield their
 * entries; "object" leaves yield declared properties, else extended
 * properties, else dictionary entries, else an empty object. Anything else
 * is returned unchanged.
 */
Value to_property_bag(const Value& val);

/// True for plain objects and "ordered"/"object" leaves
bool is_property_bag_like(const Value& val);

} // namespace typed
} // namespace recon

#endif // RECON_TYPED_HPP
