/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "recon/Merge.hpp"
#include "recon/Typed.hpp"

namespace recon {

namespace {
    bool is_plain_map(const Value& val) {
        return val.is_object() && !typed::is_typed(val);
    }
}

Value deep_merge(const Value& base, const Value& override_val) {
    // RULE P1
    if (override_val.is_null()) {
        return base;
    }

    // RULE P3
    if (!is_plain_map(base) || !is_plain_map(override_val)) {
        return override_val;
    }

    // RULE P2
    Value result = base;
    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        auto existing = result.find(it.key());
        if (existing != result.end()) {
            *existing = deep_merge(*existing, it.value());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

Value deep_merge_all(const std::vector<Value>& layers) {
    Value result = Value::object();
    for (const auto& layer : layers) {
        result = deep_merge(result, layer);
    }
    return result;
}

} // namespace recon
