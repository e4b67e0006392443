/**
 * @file Classify.hpp
 * @brief Value classification for the expression serializer
 *
 * Classification order (first match wins). The order matters because some
 * categories are subsets of others:
 * - C1:  Null
 * - C2:  Boolean
 * - C3:  Tagged string (char, mailaddress, regex, semver, type, version, uri)
 * - C4:  Number
 * - C5:  String
 * - C6:  Secure value
 * - C7:  Credential pair
 * - C8:  Date/time
 * - C9:  Enumeration
 * - C10: Code block
 * - C11: Opaque handle
 * - C12: Markup document
 * - C13: Tabular container
 * - C14: Explicit ordered map
 * - C15: Value scalar (other typed scalars)
 * - C16: Structured object, plain map, or sequence (fallback)
 */

#ifndef RECON_CLASSIFY_HPP
#define RECON_CLASSIFY_HPP

#include "recon/Value.hpp"
#include <string>

namespace recon {

/**
 * @brief Rendering category of a value
 */
enum class Category {
    Null,
    Boolean,
    TaggedString,
    Number,
    String,
    SecureValue,
    Credential,
    DateTime,
    Enumeration,
    CodeBlock,
    Handle,
    Markup,
    Table,
    OrderedMap,
    ValueScalar,
    Object,
    Map,
    Sequence
};

/**
 * @brief Classify a value for rendering
 *
 * Pure and total: unknown shapes fall through to the structured-object
 * branch (plain map or sequence).
 *
 * @param val Value to classify
 * @return Rendering category
 */
Category classify(const Value& val);

/**
 * @brief Stable lower-case name of a category (e.g., "tagged-string")
 */
const char* category_name(Category cat) noexcept;

/**
 * @brief Check whether a typed scalar class prints as a tagged string
 *
 * Case-insensitive membership test against the C3 class set.
 */
bool is_tagged_string_class(const std::string& cls) noexcept;

} // namespace recon

#endif // RECON_CLASSIFY_HPP
