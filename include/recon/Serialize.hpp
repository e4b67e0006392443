/**
 * @file Serialize.hpp
 * @brief Value-to-literal-expression serialization
 *
 * Renders a Value tree as literal text that Extract.hpp reads back:
 *
 * ```
 * @{
 *     'Name' = 'svc'
 *     'Tags' = 'a', 'b'
 *     'When' = [datetime]'2024-05-01T10:00:00Z'
 *     'Login' = credential('alice', secure('secret'))
 *     'Probe' = { Test-Path C:\ }
 * }
 * ```
 *
 * Rules R1-R6:
 * - R1: Containers at depth >= max_depth render the placeholder '...'
 * - R2: Empty sequence -> @(); one element -> ,x (or (,x) as a list item)
 * - R3: Inline when depth >= expand - 1, for primitive arrays, and for
 *       single-pair maps; negative expand selects compact inline form
 * - R4: Otherwise one element/pair per line, indented per depth
 * - R5: Essential casts (datetime, enum, ordered, xml) in weak mode,
 *       every cast in strong mode, no casts in explore mode unless strong
 * - R6: Output is trimmed of trailing whitespace
 */

#ifndef RECON_SERIALIZE_HPP
#define RECON_SERIALIZE_HPP

#include "recon/Value.hpp"
#include <string>

namespace recon {

/**
 * @brief Rendering parameters threaded through the recursion
 *
 * Copied per descent; only depth and list_item change between levels.
 */
struct RenderContext {
    int depth = 0;              ///< Current depth (0 at the top)
    int max_depth = 9;          ///< Containers at this depth become '...'
    int expand = 9;             ///< Expansion threshold; negative = compact
    int indent_size = 4;        ///< indent_char repetitions per level
    char indent_char = ' ';
    bool strong = false;        ///< Emit every type cast
    bool explore = false;       ///< Suppress casts (unless strong)
    std::string newline = "\n";
    bool list_item = false;     ///< Rendering an element of a sequence
};

/**
 * @brief Serialize a value to literal expression text
 *
 * Never throws on well-formed trees. Objects without readable members
 * render as an empty map.
 *
 * @param val Value to render
 * @param ctx Rendering parameters (depth is the starting depth)
 * @return Literal text, trailing whitespace removed
 *
 * Examples:
 * ```cpp
 * serialize(Value{{"Name", "svc"}, {"Retries", 3}});
 * // @{
 * //     'Name' = 'svc'
 * //     'Retries' = 3
 * // }
 *
 * RenderContext ctx;
 * ctx.expand = -1;
 * serialize(Value{{"a", Value::array({1, 2})}}, ctx);
 * // @{'a'=1,2}
 *
 * serialize(Value::array({"x"}));   // ,'x'
 * ```
 */
std::string serialize(const Value& val, const RenderContext& ctx = RenderContext{});

/**
 * @brief Quote text as a single-quoted literal, doubling embedded quotes
 */
std::string quote_literal(const std::string& text);

} // namespace recon

#endif // RECON_SERIALIZE_HPP
