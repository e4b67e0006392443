/**
 * @file Parse.hpp
 * @brief Typed parsing of setting values given as text
 *
 * Used for environment variables and --set overrides. First match wins:
 * - T1: Boolean ("true", "false", case-insensitive)
 * - T2: Null ("null", case-insensitive)
 * - T3: Integer (^-?[0-9]+$)
 * - T4: Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - T5: JSON compound ({...} or [...])
 * - T6: Literal expression ('...', @{...}, @(...), [Type]..., secure(...))
 * - T7: Raw string (fallback)
 */

#ifndef RECON_PARSE_HPP
#define RECON_PARSE_HPP

#include "recon/Value.hpp"
#include <string>

namespace recon {

/**
 * @brief Parse text to a typed Value
 *
 * Text that looks like a JSON compound or a literal expression but fails to
 * parse as one falls through to the raw string rule.
 *
 * ```cpp
 * parse_value("TRUE")              // → true
 * parse_value("-17")               // → -17
 * parse_value("2.5e3")             // → 2500.0
 * parse_value("[\"a\",\"b\"]")     // → ["a", "b"]
 * parse_value("@('a', 'b')")       // → ["a", "b"]
 * parse_value("'\\t'")             // → "\\t" (quoted literal, no escapes)
 * parse_value("[datetime]'2024-05-01T00:00:00'") // → datetime leaf
 * parse_value("hello")             // → "hello"
 * ```
 */
Value parse_value(const std::string& text);

} // namespace recon

#endif // RECON_PARSE_HPP
