/**
 * @file Typed.cpp
 * @brief Typed leaf helpers and Value type names
 */

#include "recon/Typed.hpp"

#include <array>
#include <cstring>

namespace recon {
namespace typed {

namespace {
    const std::array<const char*, 11> KNOWN_KINDS = {
        kDateTime, kEnum, kSecure, kCredential, kScript, kHandle,
        kMarkup, kTable, kOrdered, kScalar, kObject
    };

    Value tagged(const char* kind) {
        Value v = Value::object();
        v[kTag] = kind;
        return v;
    }

    bool has_members(const Value& val, const char* key) {
        auto it = val.find(key);
        return it != val.end() && it->is_object() && !it->empty();
    }
}

Value datetime(const std::string& iso) {
    Value v = tagged(kDateTime);
    v["value"] = iso;
    return v;
}

Value enumeration(const std::string& cls, const std::string& name, std::int64_t value) {
    Value v = tagged(kEnum);
    v["class"] = cls;
    v["name"] = name;
    v["value"] = value;
    return v;
}

Value secure(const std::string& text) {
    Value v = tagged(kSecure);
    v["value"] = text;
    return v;
}

Value credential(const std::string& username, const std::string& password) {
    Value v = tagged(kCredential);
    v["username"] = username;
    v["password"] = password;
    return v;
}

Value script(const std::string& source) {
    Value v = tagged(kScript);
    v["value"] = source;
    return v;
}

Value handle(std::int64_t value) {
    Value v = tagged(kHandle);
    v["value"] = value;
    return v;
}

Value markup(const std::string& xml) {
    Value v = tagged(kMarkup);
    v["value"] = xml;
    return v;
}

Value table(Value rows) {
    Value v = tagged(kTable);
    v["rows"] = rows.is_array() ? std::move(rows) : Value::array();
    return v;
}

Value ordered(Value entries) {
    Value v = tagged(kOrdered);
    v["entries"] = entries.is_object() ? std::move(entries) : Value::object();
    return v;
}

Value scalar(const std::string& cls, Value raw) {
    Value v = tagged(kScalar);
    v["class"] = cls;
    v["value"] = std::move(raw);
    return v;
}

Value object(const std::string& cls, Value properties, Value extended) {
    Value v = tagged(kObject);
    v["class"] = cls;
    if (properties.is_object()) v["properties"] = std::move(properties);
    if (extended.is_object() && !extended.empty()) v["extended"] = std::move(extended);
    return v;
}

Value collection(const std::string& cls, Value items) {
    Value v = tagged(kObject);
    v["class"] = cls;
    v["items"] = items.is_array() ? std::move(items) : Value::array();
    return v;
}

std::string kind_of(const Value& val) {
    if (!val.is_object()) return "";
    auto it = val.find(kTag);
    if (it == val.end() || !it->is_string()) return "";
    const auto& kind = it->get_ref<const std::string&>();
    for (const char* known : KNOWN_KINDS) {
        if (kind == known) return kind;
    }
    return "";
}

bool is(const Value& val, const char* kind) {
    if (!val.is_object()) return false;
    auto it = val.find(kTag);
    return it != val.end() && it->is_string() &&
           std::strcmp(it->get_ref<const std::string&>().c_str(), kind) == 0;
}

bool is_typed(const Value& val) {
    return !kind_of(val).empty();
}

std::string class_of(const Value& val) {
    if (!is(val, kEnum) && !is(val, kScalar) && !is(val, kObject)) return "";
    auto it = val.find("class");
    if (it == val.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

Value to_property_bag(const Value& val) {
    if (is(val, kOrdered)) {
        return val.value("entries", Value::object());
    }
    if (is(val, kObject)) {
        if (has_members(val, "properties")) return val.at("properties");
        if (has_members(val, "extended")) return val.at("extended");
        if (has_members(val, "entries")) return val.at("entries");
        return Value::object();
    }
    return val;
}

bool is_property_bag_like(const Value& val) {
    if (is(val, kOrdered) || is(val, kObject)) return true;
    return val.is_object() && !is_typed(val);
}

} // namespace typed

std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) {
        std::string cls = typed::class_of(val);
        if (!cls.empty()) return cls;
        std::string kind = typed::kind_of(val);
        if (!kind.empty()) return kind;
        return "object";
    }
    return "unknown";
}

} // namespace recon
