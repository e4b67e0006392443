/**
 * @file EnvMapper.hpp
 * @brief Mapping of environment variables onto setting keys
 *
 * - RULE E1: Only variables named {PREFIX}_* are read (prefix matched
 *            ignoring case); an empty prefix disables the layer
 * - RULE E2: The remainder is lower-cased, "__" keeps an underscore and
 *            "_" becomes a dot (RENDER_MAX_DEPTH → render.max.depth)
 * - RULE E3: The dotted name is remapped onto a known key that differs
 *            only in '_' versus '.' (render.max.depth → render.max_depth)
 * - RULE E4: Names that match no known key are ignored
 * - RULE E5: Values are typed with parse_value()
 */

#ifndef RECON_ENVMAPPER_HPP
#define RECON_ENVMAPPER_HPP

#include "recon/Value.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace recon {

/**
 * @brief Apply RULE E2 to a name with its prefix removed
 *
 * - COMPARE_SORT_ARRAYS → compare.sort.arrays
 * - MESSAGES__NO_MATCH → messages_no.match
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Remove "{prefix}_" from @p var_name, ignoring case
 * @return The remainder, or an empty string when the prefix does not match
 */
std::string strip_prefix(const std::string& var_name, const std::string& prefix);

/**
 * @brief Environment variables selected by RULE E1, as (name, value) pairs
 */
std::vector<std::pair<std::string, std::string>>
collect_env_vars(const std::string& prefix);

/**
 * @brief Every dot-path of @p data, maps included, typed leaves as leaves
 *
 * {"render": {"expand": 9}} → {"render", "render.expand"}
 */
std::set<std::string> flatten_keys(const Value& data, const std::string& prefix = "");

/**
 * @brief Resolve a transformed name against known keys (RULES E3, E4)
 * @return The known key, or an empty string when none matches
 */
std::string remap_env_key(const std::string& dot_path,
                          const std::set<std::string>& known_keys);

/**
 * @brief Build the environment layer for Settings::load()
 *
 * @param prefix Variable prefix without trailing underscore (e.g., "RECON")
 * @param known Settings tree whose keys are accepted
 * @return Map holding the recognised overrides
 */
Value load_env_layer(const std::string& prefix, const Value& known);

} // namespace recon

#endif // RECON_ENVMAPPER_HPP
