/**
 * @file Compare.hpp
 * @brief Structural comparison of current and desired property bags
 *
 * Per compared key, in order:
 * - RULE S1: Credentials compare user names only; secrets are never compared
 * - RULE S2: Unless skip_type_check, two non-null values of different type
 *            names do not match
 * - RULE S3: Equal non-array values match
 * - RULE S4: A key the desired bag does not hold matches
 * - RULE S5: Arrays match when lengths agree and every element pair matches
 *            (after an optional independent sort of both arrays)
 * - RULE S6: Nested maps are compared recursively with the property list
 *            cleared
 * - RULE S7: Remaining scalars use loose equality: textual, ignoring case
 * - RULE S8: With reverse_check, the bags are also compared swapped
 *
 * Every key is evaluated even after a mismatch so that the trace lists all
 * differences. A mismatch is reported as false, never thrown.
 */

#ifndef RECON_COMPARE_HPP
#define RECON_COMPARE_HPP

#include "recon/Messages.hpp"
#include "recon/Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace recon {

/**
 * @brief Options for one comparison
 */
struct CompareOptions {
    /// Keys to compare; all keys of the desired bag when unset
    std::optional<std::vector<std::string>> properties;
    /// Keys never compared
    std::vector<std::string> exclude;
    bool skip_type_check = false;
    bool sort_arrays = false;
    bool reverse_check = false;
};

/**
 * @brief Outcome for one top-level key
 */
struct PropertyResult {
    std::string property;
    Value expected;
    Value actual;
    bool in_desired_state = true;
};

/**
 * @brief Outcome of compare()
 */
struct StateReport {
    bool in_desired_state = true;
    std::vector<PropertyResult> properties;
};

/**
 * @brief One trace line
 */
struct TraceEntry {
    std::string message_id;  ///< Catalog id (e.g., "no_match")
    std::string property;
    bool match = false;
    std::string text;        ///< Formatted message
};

/// Receives each trace line as it is produced
using TraceSink = std::function<void(const TraceEntry&)>;

/**
 * @brief Runs a code block for comparison against a string
 *
 * Receives the block source and returns its result. Without an evaluator,
 * blocks compare by source text.
 */
using BlockEvaluator = std::function<Value(const std::string& source)>;

/**
 * @brief Decides whether a current state matches a desired state
 *
 * ```cpp
 * StateComparator cmp{MessageCatalog{}};
 * Value current = {{"Tags", {"b", "a"}}};
 * Value desired = {{"Tags", {"a", "b"}}};
 * cmp.test(current, desired, {});            // false
 * CompareOptions sorted;
 * sorted.sort_arrays = true;
 * cmp.test(current, desired, sorted);        // true
 * ```
 */
class StateComparator {
public:
    explicit StateComparator(MessageCatalog messages,
                             BlockEvaluator evaluator = {},
                             TraceSink sink = {});

    /**
     * @brief Compare two property bags
     *
     * Takes both bags by value; the caller's copies are left untouched.
     *
     * @throws InvalidInputShape if either input is not property-bag-like
     * @throws MissingPropertyList if @p desired is an "object" leaf and no
     *         property list is given
     */
    bool test(Value current, Value desired, const CompareOptions& options) const;

    /**
     * @brief Compare and collect one result per top-level key
     *
     * Keys seen only by the reverse pass are appended after the forward
     * results.
     *
     * @throws InvalidInputShape, MissingPropertyList as for test()
     */
    StateReport compare(Value current, Value desired, const CompareOptions& options) const;

private:
    MessageCatalog messages_;
    BlockEvaluator evaluator_;
    TraceSink sink_;

    bool run(const Value& current, const Value& desired, const CompareOptions& options,
             const std::string& path, StateReport* report) const;

    bool compare_key(const Value& current, const Value& desired, const std::string& key,
                     const CompareOptions& options, const std::string& path) const;

    bool compare_arrays(Value current, Value desired, const CompareOptions& options,
                        const std::string& property) const;

    Value resolve_block(const Value& val, const Value& paired) const;

    void trace(const std::string& id, const std::string& property, bool match,
               MessageArgs args) const;
};

/**
 * @brief Loose equality used for scalar values
 *
 * Equal values match; otherwise two scalars match when their text forms
 * are equal ignoring ASCII case (5 and "5", true and "True").
 */
bool loosely_equal(const Value& a, const Value& b);

} // namespace recon

#endif // RECON_COMPARE_HPP
