/**
 * @file Compare.cpp
 * @brief Implementation of the state comparator
 */

#include "recon/Compare.hpp"
#include "recon/Errors.hpp"
#include "recon/Log.hpp"
#include "recon/Serialize.hpp"
#include "recon/Typed.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace recon {

namespace {

const char* const MASK = "***";

bool is_plain_map(const Value& val) {
    return val.is_object() && !typed::is_typed(val);
}

bool is_scalar(const Value& val) {
    return val.is_string() || val.is_number() || val.is_boolean();
}

Value member(const Value& bag, const std::string& key) {
    auto it = bag.find(key);
    return it == bag.end() ? Value() : *it;
}

/**
 * @brief Structured leaves compare as the property bag they expose
 */
Value normalize(Value val) {
    if (typed::is(val, typed::kObject) || typed::is(val, typed::kOrdered)) {
        return typed::to_property_bag(val);
    }
    return val;
}

/**
 * @brief Copy of @p val with object members in key order at every level
 *
 * Comparisons go through this form so member order never decides a result.
 */
Value canonical(const Value& val) {
    if (val.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(val.size());
        for (auto it = val.begin(); it != val.end(); ++it) {
            keys.push_back(it.key());
        }
        std::sort(keys.begin(), keys.end());
        Value out = Value::object();
        for (const auto& key : keys) {
            out[key] = canonical(val.at(key));
        }
        return out;
    }
    if (val.is_array()) {
        Value out = Value::array();
        for (const auto& child : val) {
            out.push_back(canonical(child));
        }
        return out;
    }
    return val;
}

bool same_value(const Value& a, const Value& b) {
    return canonical(a) == canonical(b);
}

bool value_less(const Value& a, const Value& b) {
    return canonical(a) < canonical(b);
}

std::string text_of(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    return val.dump();
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

/**
 * @brief Copy of @p val with secure text and passwords replaced
 */
Value mask_secrets(Value val) {
    if (typed::is(val, typed::kSecure)) {
        val["value"] = MASK;
    } else if (typed::is(val, typed::kCredential)) {
        val["password"] = MASK;
    } else if (val.is_structured()) {
        for (auto& child : val) {
            child = mask_secrets(std::move(child));
        }
    }
    return val;
}

/**
 * @brief Single-line text of a value for trace messages
 */
std::string display(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    RenderContext ctx;
    ctx.expand = -1;
    ctx.max_depth = 4;
    return serialize(mask_secrets(val), ctx);
}

MessageArgs make_args(const std::string& property, const Value& actual, const Value& expected) {
    MessageArgs args;
    args.property = property;
    args.actual = display(actual);
    args.expected = display(expected);
    args.actual_type = type_name(actual);
    args.expected_type = type_name(expected);
    return args;
}

bool type_differs(const Value& a, const Value& b, const CompareOptions& options) {
    if (options.skip_type_check || a.is_null() || b.is_null()) return false;
    return type_name(a) != type_name(b);
}

std::string child_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

} // anonymous namespace

bool loosely_equal(const Value& a, const Value& b) {
    if (same_value(a, b)) return true;
    if (!is_scalar(a) || !is_scalar(b)) return false;
    return iequals(text_of(a), text_of(b));
}

StateComparator::StateComparator(MessageCatalog messages, BlockEvaluator evaluator,
                                 TraceSink sink)
    : messages_(std::move(messages))
    , evaluator_(std::move(evaluator))
    , sink_(std::move(sink))
{}

// ============================================================================
// Entry points
// ============================================================================

bool StateComparator::test(Value current, Value desired, const CompareOptions& options) const {
    return compare(std::move(current), std::move(desired), options).in_desired_state;
}

StateReport StateComparator::compare(Value current, Value desired,
                                     const CompareOptions& options) const {
    if (!typed::is_property_bag_like(current)) {
        throw InvalidInputShape("current", type_name(current));
    }
    if (!typed::is_property_bag_like(desired)) {
        throw InvalidInputShape("desired", type_name(desired));
    }
    if (typed::is(desired, typed::kObject) && !options.properties) {
        throw MissingPropertyList(typed::class_of(desired));
    }

    StateReport report;
    report.in_desired_state = run(typed::to_property_bag(current),
                                  typed::to_property_bag(desired),
                                  options, "", &report);

    MessageArgs args;
    args.result = report.in_desired_state ? "true" : "false";
    trace("result", "", report.in_desired_state, std::move(args));
    return report;
}

// ============================================================================
// Comparison
// ============================================================================

bool StateComparator::run(const Value& current, const Value& desired,
                          const CompareOptions& options, const std::string& path,
                          StateReport* report) const {
    std::vector<std::string> keys;
    if (options.properties) {
        keys = *options.properties;
    } else {
        for (auto it = desired.begin(); it != desired.end(); ++it) {
            keys.push_back(it.key());
        }
    }
    keys.erase(std::remove_if(keys.begin(), keys.end(), [&](const std::string& key) {
                   return std::find(options.exclude.begin(), options.exclude.end(), key) !=
                          options.exclude.end();
               }),
               keys.end());

    // Every key is evaluated; the verdict only ever moves to false
    bool in_state = true;
    for (const auto& key : keys) {
        const bool match = compare_key(current, desired, key, options, path);
        if (report) {
            report->properties.push_back(
                PropertyResult{key, member(desired, key), member(current, key), match});
        }
        in_state = in_state && match;
    }

    if (options.reverse_check) {
        trace("reverse_check", path, true, MessageArgs{});

        CompareOptions reversed = options;
        reversed.reverse_check = false;
        StateReport reverse_report;
        const bool reverse_match = run(desired, current, reversed, path,
                                       report ? &reverse_report : nullptr);

        if (report) {
            for (auto& result : reverse_report.properties) {
                auto seen = std::find_if(report->properties.begin(), report->properties.end(),
                                         [&](const PropertyResult& r) {
                                             return r.property == result.property;
                                         });
                if (seen == report->properties.end()) {
                    std::swap(result.expected, result.actual);
                    report->properties.push_back(std::move(result));
                } else if (!result.in_desired_state) {
                    seen->in_desired_state = false;
                }
            }
        }
        in_state = in_state && reverse_match;
    }
    return in_state;
}

bool StateComparator::compare_key(const Value& current, const Value& desired,
                                  const std::string& key, const CompareOptions& options,
                                  const std::string& path) const {
    const std::string property = child_path(path, key);
    const Value cur = normalize(member(current, key));
    const Value des = normalize(member(desired, key));
    MessageArgs args = make_args(property, cur, des);

    // RULE S1
    if (typed::is(des, typed::kCredential)) {
        const Value expected_user = des.value("username", Value(""));
        Value actual_user;
        if (cur.is_string()) {
            actual_user = cur;
        } else if (typed::is(cur, typed::kCredential)) {
            actual_user = cur.value("username", Value(""));
        }
        const bool match = !actual_user.is_null() && loosely_equal(actual_user, expected_user);
        args.expected = text_of(expected_user);
        args.actual = actual_user.is_null() ? display(cur) : text_of(actual_user);
        trace(match ? "credential_match" : "credential_no_match", property, match, args);
        return match;
    }

    // RULE S2
    if (type_differs(cur, des, options)) {
        trace("type_mismatch", property, false, args);
        return false;
    }

    // RULE S3
    if (!des.is_array() && same_value(cur, des)) {
        trace("match", property, true, args);
        return true;
    }

    // RULE S4
    if (!desired.contains(key)) {
        trace("key_not_in_desired", property, true, args);
        return true;
    }

    // RULE S5
    if (des.is_array()) {
        return compare_arrays(cur, des, options, property);
    }

    // RULE S6
    if (is_plain_map(cur) && is_plain_map(des)) {
        CompareOptions nested = options;
        nested.properties.reset();
        return run(cur, des, nested, property, nullptr);
    }

    // RULE S7
    const bool match = loosely_equal(resolve_block(cur, des), resolve_block(des, cur));
    trace(match ? "match" : "no_match", property, match, args);
    return match;
}

bool StateComparator::compare_arrays(Value current, Value desired,
                                     const CompareOptions& options,
                                     const std::string& property) const {
    MessageArgs args = make_args(property, current, desired);

    if (desired.empty() && (current.is_null() || (current.is_array() && current.empty()))) {
        trace("array_empty_match", property, true, args);
        return true;
    }
    if (current.is_null()) {
        trace("array_missing", property, false, args);
        return false;
    }
    if (!current.is_array()) {
        Value wrapped = Value::array();
        wrapped.push_back(std::move(current));
        current = std::move(wrapped);
    }
    if (current.size() != desired.size()) {
        args.actual_count = current.size();
        args.expected_count = desired.size();
        trace("array_length", property, false, args);
        return false;
    }

    if (options.sort_arrays) {
        std::sort(current.begin(), current.end(), value_less);
        std::sort(desired.begin(), desired.end(), value_less);
    }

    bool in_state = true;
    for (size_t i = 0; i < desired.size(); ++i) {
        const Value& cur = current[i];
        const Value& des = desired[i];
        const std::string element = property + "." + std::to_string(i);

        MessageArgs elem_args = make_args(element, cur, des);
        elem_args.index = i;

        if (type_differs(cur, des, options)) {
            trace("type_mismatch", element, false, elem_args);
            in_state = false;
            continue;
        }

        const Value c = normalize(resolve_block(cur, des));
        const Value d = normalize(resolve_block(des, cur));

        if (is_plain_map(c) && is_plain_map(d)) {
            CompareOptions nested = options;
            nested.properties.reset();
            const bool match = run(c, d, nested, element, nullptr);
            in_state = in_state && match;
            continue;
        }

        if (!loosely_equal(c, d)) {
            elem_args.property = property;
            trace("array_element_no_match", property, false, elem_args);
            in_state = false;
        }
    }

    if (in_state) {
        trace("match", property, true, args);
    }
    return in_state;
}

Value StateComparator::resolve_block(const Value& val, const Value& paired) const {
    if (!typed::is(val, typed::kScript)) {
        return val;
    }
    const std::string source = val.value("value", std::string());
    if (paired.is_string() && evaluator_) {
        return evaluator_(source);
    }
    return Value(source);
}

void StateComparator::trace(const std::string& id, const std::string& property, bool match,
                            MessageArgs args) const {
    if (args.property.empty()) {
        args.property = property;
    }
    TraceEntry entry{id, property, match, messages_.format(id, args)};
    logger()->debug("{}", entry.text);
    if (sink_) {
        sink_(entry);
    }
}

} // namespace recon
