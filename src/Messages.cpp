/**
 * @file Messages.cpp
 * @brief Default trace message templates
 */

#include "recon/Messages.hpp"
#include "recon/Errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace recon {

namespace {

const std::map<std::string, std::string>& defaults() {
    static const std::map<std::string, std::string> table = {
        {"match",
         "MATCH: Value (type '{actual_type}') for property '{property}' does match. "
         "Current state is '{actual}' and desired state is '{expected}'"},
        {"no_match",
         "NOTMATCH: Value (type '{actual_type}') for property '{property}' does not match. "
         "Current state is '{actual}' and desired state is '{expected}'"},
        {"type_mismatch",
         "NOTMATCH: Value (type '{actual_type}') for property '{property}' does not match "
         "the desired type '{expected_type}'"},
        {"credential_match",
         "MATCH: Credential for property '{property}' matches user name '{expected}'"},
        {"credential_no_match",
         "NOTMATCH: Credential for property '{property}' has user name '{actual}', "
         "expected '{expected}'"},
        {"array_empty_match",
         "MATCH: Property '{property}' is an empty array in both states"},
        {"array_missing",
         "NOTMATCH: Property '{property}' is null in the current state but the desired "
         "state has elements '{expected}'"},
        {"array_length",
         "NOTMATCH: Property '{property}' has {actual_count} elements, "
         "desired state has {expected_count}"},
        {"array_element_no_match",
         "NOTMATCH: Element {index} of property '{property}' does not match. "
         "Current state is '{actual}' and desired state is '{expected}'"},
        {"key_not_in_desired",
         "MATCH: Property '{property}' is not part of the desired state"},
        {"reverse_check",
         "Checking the desired state against the current state (reverse check)"},
        {"result",
         "State comparison result: {result}"},
    };
    return table;
}

std::string format_template(const std::string& text, const MessageArgs& args) {
    return fmt::format(fmt::runtime(text),
                       fmt::arg("property", args.property),
                       fmt::arg("actual", args.actual),
                       fmt::arg("expected", args.expected),
                       fmt::arg("actual_type", args.actual_type),
                       fmt::arg("expected_type", args.expected_type),
                       fmt::arg("index", args.index),
                       fmt::arg("actual_count", args.actual_count),
                       fmt::arg("expected_count", args.expected_count),
                       fmt::arg("result", args.result));
}

} // anonymous namespace

MessageCatalog::MessageCatalog() : templates_(defaults()) {}

MessageCatalog::MessageCatalog(const std::map<std::string, std::string>& overrides)
    : templates_(defaults()) {
    for (const auto& [id, text] : overrides) {
        set(id, text);
    }
}

const std::string& MessageCatalog::get(const std::string& id) const {
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        throw SettingsError("messages." + id, "unknown message id");
    }
    return it->second;
}

std::string MessageCatalog::format(const std::string& id, const MessageArgs& args) const {
    return format_template(get(id), args);
}

void MessageCatalog::set(const std::string& id, std::string text) {
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        throw SettingsError("messages." + id, "unknown message id");
    }
    try {
        format_template(text, MessageArgs{});
    } catch (const fmt::format_error& e) {
        throw SettingsError("messages." + id, e.what());
    }
    it->second = std::move(text);
}

std::vector<std::string> MessageCatalog::ids() {
    std::vector<std::string> out;
    for (const auto& entry : defaults()) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace recon
