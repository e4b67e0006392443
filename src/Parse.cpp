/**
 * @file Parse.cpp
 * @brief Implementation of typed text parsing
 */

#include "recon/Parse.hpp"
#include "recon/Errors.hpp"
#include "recon/Extract.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <stdexcept>

namespace recon {

namespace {
    const std::regex INTEGER_RE("^-?[0-9]+$");
    const std::regex FLOAT_RE("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    bool starts_with(const std::string& s, const char* prefix) {
        return s.rfind(prefix, 0) == 0;
    }

    /**
     * @brief Heuristic for text written in the literal grammar
     */
    bool looks_literal(const std::string& s) {
        return s.front() == '\'' || s.front() == '[' ||
               starts_with(s, "@{") || starts_with(s, "@(") || starts_with(s, "@'") ||
               starts_with(to_lower(s), "secure(") ||
               starts_with(to_lower(s), "credential(");
    }
}

Value parse_value(const std::string& text) {
    if (text.empty()) {
        return "";
    }

    // T1, T2
    const std::string lower = to_lower(text);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    // T3
    if (std::regex_match(text, INTEGER_RE)) {
        try {
            return static_cast<std::int64_t>(std::stoll(text));
        } catch (const std::out_of_range&) {
            // too wide for int64; keep the text
            return text;
        }
    }

    // T4
    if (std::regex_match(text, FLOAT_RE)) {
        return std::stod(text);
    }

    // T5
    if ((text.front() == '{' && text.back() == '}') ||
        (text.front() == '[' && text.back() == ']')) {
        Value parsed = Value::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // T6
    if (looks_literal(text)) {
        try {
            return extract_value(text);
        } catch (const MalformedLiteral&) {
            // not a literal after all
        } catch (const UnsupportedArgumentShape&) {
            // only literal shapes are accepted
        }
    }

    // T7
    return text;
}

} // namespace recon
