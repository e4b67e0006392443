/**
 * @file Classify.cpp
 * @brief Implementation of value classification
 */

#include "recon/Classify.hpp"
#include "recon/Typed.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace recon {

namespace {
    const std::array<const char*, 7> TAGGED_STRING_CLASSES = {
        "char", "mailaddress", "regex", "semver", "type", "version", "uri"
    };

    bool iequals(const std::string& a, const char* b) {
        std::size_t i = 0;
        for (; i < a.size() && b[i] != '\0'; ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return i == a.size() && b[i] == '\0';
    }
}

bool is_tagged_string_class(const std::string& cls) noexcept {
    return std::any_of(TAGGED_STRING_CLASSES.begin(), TAGGED_STRING_CLASSES.end(),
                       [&](const char* c) { return iequals(cls, c); });
}

Category classify(const Value& val) {
    // C1, C2
    if (val.is_null()) return Category::Null;
    if (val.is_boolean()) return Category::Boolean;

    const std::string kind = typed::kind_of(val);

    // C3: before numbers so a char code still prints quoted
    if (kind == typed::kScalar && is_tagged_string_class(typed::class_of(val))) {
        return Category::TaggedString;
    }

    // C4, C5
    if (val.is_number()) return Category::Number;
    if (val.is_string()) return Category::String;

    // C6 - C14
    if (kind == typed::kSecure) return Category::SecureValue;
    if (kind == typed::kCredential) return Category::Credential;
    if (kind == typed::kDateTime) return Category::DateTime;
    if (kind == typed::kEnum) return Category::Enumeration;
    if (kind == typed::kScript) return Category::CodeBlock;
    if (kind == typed::kHandle) return Category::Handle;
    if (kind == typed::kMarkup) return Category::Markup;
    if (kind == typed::kTable) return Category::Table;
    if (kind == typed::kOrdered) return Category::OrderedMap;

    // C15
    if (kind == typed::kScalar) return Category::ValueScalar;

    // C16
    if (kind == typed::kObject) return Category::Object;
    if (val.is_object()) return Category::Map;
    return Category::Sequence;
}

const char* category_name(Category cat) noexcept {
    switch (cat) {
        case Category::Null:         return "null";
        case Category::Boolean:      return "boolean";
        case Category::TaggedString: return "tagged-string";
        case Category::Number:       return "number";
        case Category::String:       return "string";
        case Category::SecureValue:  return "secure";
        case Category::Credential:   return "credential";
        case Category::DateTime:     return "datetime";
        case Category::Enumeration:  return "enumeration";
        case Category::CodeBlock:    return "code-block";
        case Category::Handle:       return "handle";
        case Category::Markup:       return "markup";
        case Category::Table:        return "table";
        case Category::OrderedMap:   return "ordered-map";
        case Category::ValueScalar:  return "value-scalar";
        case Category::Object:       return "object";
        case Category::Map:          return "map";
        case Category::Sequence:     return "sequence";
    }
    return "unknown";
}

} // namespace recon
