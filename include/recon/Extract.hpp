/**
 * @file Extract.hpp
 * @brief Safe extraction of literal values from argument text
 *
 * The fragment is read as the argument list of an invocation and parsed
 * with a restricted grammar. Nothing is ever evaluated; only literal value
 * shapes are reconstructed.
 *
 * Rules X1-X6:
 * - X1: A list argument ('a', 'b' / ,'a' / @(...) / (...)) contributes one
 *       literal per element
 * - X2: A map argument (@{...}) contributes its structure; code-block values
 *       keep their source text with one enclosing brace pair stripped
 * - X3: A string or bare word contributes its text
 * - X4: Numbers, true/false/null, secure(...), credential(...) and casts
 *       are literal shapes and are accepted
 * - X5: Variables, sub-expressions, expandable strings, other calls and
 *       code blocks outside maps throw UnsupportedArgumentShape
 * - X6: Text that does not parse throws MalformedLiteral; no literals are
 *       produced for it
 */

#ifndef RECON_EXTRACT_HPP
#define RECON_EXTRACT_HPP

#include "recon/Value.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace recon {

/**
 * @brief Extract literal arguments from argument text
 *
 * @param text Argument list text (e.g., "'web01' @{ Port = 80 }")
 * @return Literals in argument order, list arguments flattened (X1)
 * @throws MalformedLiteral if the text does not parse (X6)
 * @throws UnsupportedArgumentShape for non-literal arguments (X5)
 *
 * Examples:
 * ```cpp
 * extract_arguments("'a', 'b'");          // ["a", "b"]
 * extract_arguments("web01 @{ Port = 80 }"); // ["web01", {"Port": 80}]
 * extract_arguments("@{ Run = { Get-Item . } }");
 * // [{"Run": {"$type": "script", "value": " Get-Item . "}}]
 * extract_arguments("$name");             // throws UnsupportedArgumentShape
 * extract_arguments("@{ a = 'x'");        // throws MalformedLiteral
 * ```
 */
std::vector<Value> extract_arguments(std::string_view text);

/**
 * @brief Extract exactly one literal expression
 *
 * Unlike extract_arguments(), list values are returned as a single array.
 * This is the inverse of serialize() for its literal subset.
 *
 * @param text Literal expression text
 * @return Reconstructed value
 * @throws MalformedLiteral if the text is not exactly one expression
 * @throws UnsupportedArgumentShape for non-literal shapes
 */
Value extract_value(std::string_view text);

/**
 * @brief Normalize code-block text
 *
 * Strips one pair of braces when they enclose the whole text. A newline
 * the serializer appended after a trailing comment is removed as well.
 *
 * @param text Block text, with or without its braces
 * @return Block source as stored in a "script" leaf
 */
std::string normalize_block_text(std::string_view text);

/**
 * @brief Check block source for a '#' comment outside quoted text
 *
 * A comment starts at a '#' that begins the text or follows whitespace,
 * ';', '{' or '('.
 */
bool block_has_comment(std::string_view source);

} // namespace recon

#endif // RECON_EXTRACT_HPP
