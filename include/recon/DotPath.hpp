/**
 * @file DotPath.hpp
 * @brief Dot-path access into settings and property bags
 *
 * Paths such as "render.max_depth" or "compare.exclude.0" address nested
 * members. Typed leaves are values, not containers: a path never descends
 * into a "$type" object.
 *
 * Rules:
 * - RULE D1: get_by_dot() without fallback throws KeyError for a missing path
 * - RULE D2: get_by_dot() with fallback returns it for a missing path, but
 *            still throws TypeError when traversal hits a leaf
 * - RULE D3: set_by_dot() with create_missing=false throws for missing parents
 * - RULE D4: set_by_dot() with create_missing=true creates (or replaces)
 *            intermediate maps
 * - RULE D5: contains_dot() returns false for a missing path
 */

#ifndef RECON_DOTPATH_HPP
#define RECON_DOTPATH_HPP

#include "recon/Value.hpp"
#include <string>
#include <vector>

namespace recon {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped: "a..b" → ["a", "b"], "" → [].
 */
std::vector<std::string> split_dot_path(const std::string& path);

/// Join segments with '.'
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Resolve a dot-path (RULE D1)
 *
 * @return Pointer into @p data
 * @throws KeyError if a segment is missing or an index is out of range
 * @throws TypeError if traversal reaches a scalar or typed leaf
 *
 * ```cpp
 * Value s = {{"render", {{"expand", 2}}}};
 * get_by_dot(s, "render.expand");        // → 2
 * get_by_dot(s, "render.indent");        // throws KeyError
 * get_by_dot(s, "render.expand.x");      // throws TypeError
 * ```
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Resolve a dot-path, returning @p fallback when missing (RULE D2)
 * @throws TypeError if traversal reaches a scalar or typed leaf
 */
const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& fallback);

/**
 * @brief Assign a value at a dot-path (RULES D3, D4)
 *
 * @throws KeyError if create_missing=false and a parent is missing
 * @throws TypeError if create_missing=false and a parent is not a map
 */
void set_by_dot(Value& data, const std::string& path, const Value& value,
                bool create_missing = true);

/// True when the path resolves (RULE D5)
bool contains_dot(const Value& data, const std::string& path);

} // namespace recon

#endif // RECON_DOTPATH_HPP
