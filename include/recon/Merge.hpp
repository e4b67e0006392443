/**
 * @file Merge.hpp
 * @brief Deep merge of settings layers and property bags
 *
 * Rules:
 * - RULE P1: Null in the override keeps the base value
 * - RULE P2: Two plain maps merge key by key, recursively
 * - RULE P3: Anything else in the override replaces the base value
 *            (scalars, arrays and typed leaves are atomic)
 */

#ifndef RECON_MERGE_HPP
#define RECON_MERGE_HPP

#include "recon/Value.hpp"
#include <vector>

namespace recon {

/**
 * @brief Merge @p override_val onto @p base
 *
 * ```cpp
 * Value base = {{"render", {{"expand", 9}, {"strong", false}}}};
 * Value over = {{"render", {{"strong", true}}}};
 * deep_merge(base, over);
 * // {"render": {"expand": 9, "strong": true}}
 *
 * // A typed leaf is never merged member by member
 * Value a = {{"When", typed::datetime("2024-01-01T00:00:00")}};
 * Value b = {{"When", typed::datetime("2025-06-30T12:00:00")}};
 * deep_merge(a, b);   // {"When": <2025-06-30 datetime>}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Merge layers in order, lowest precedence first
 * @return Merged result, or an empty map for no layers
 */
Value deep_merge_all(const std::vector<Value>& layers);

} // namespace recon

#endif // RECON_MERGE_HPP
