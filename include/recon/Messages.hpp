/**
 * @file Messages.hpp
 * @brief Localizable templates for comparator trace lines
 *
 * Templates use fmt named arguments. Every template is formatted with the
 * same set of names, so any of them may appear in any message:
 *
 * - property: key being compared (dot-joined for nested maps)
 * - actual, expected: current and desired values as compact literals
 * - actual_type, expected_type: type names of the two values
 * - index: array element position
 * - actual_count, expected_count: array lengths
 * - result: overall outcome ("true" or "false")
 *
 * Message ids: match, no_match, type_mismatch, credential_match,
 * credential_no_match, array_empty_match, array_missing, array_length,
 * array_element_no_match, key_not_in_desired, reverse_check, result.
 */

#ifndef RECON_MESSAGES_HPP
#define RECON_MESSAGES_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace recon {

/**
 * @brief Values available to every template
 */
struct MessageArgs {
    std::string property;
    std::string actual;
    std::string expected;
    std::string actual_type;
    std::string expected_type;
    std::size_t index = 0;
    std::size_t actual_count = 0;
    std::size_t expected_count = 0;
    std::string result;
};

/**
 * @brief Message id to template mapping with built-in English defaults
 */
class MessageCatalog {
public:
    /// Catalog holding only the defaults
    MessageCatalog();

    /**
     * @brief Catalog with some templates replaced
     * @throws SettingsError for an unknown id
     */
    explicit MessageCatalog(const std::map<std::string, std::string>& overrides);

    /**
     * @brief Template for @p id
     * @throws SettingsError for an unknown id
     */
    const std::string& get(const std::string& id) const;

    /**
     * @brief Format the template for @p id
     * @throws SettingsError for an unknown id
     */
    std::string format(const std::string& id, const MessageArgs& args) const;

    /**
     * @brief Replace one template
     * @throws SettingsError for an unknown id or a template fmt rejects
     */
    void set(const std::string& id, std::string text);

    /// Ids of every known message
    static std::vector<std::string> ids();

private:
    std::map<std::string, std::string> templates_;
};

} // namespace recon

#endif // RECON_MESSAGES_HPP
