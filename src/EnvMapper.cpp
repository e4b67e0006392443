/**
 * @file EnvMapper.cpp
 * @brief Implementation of environment variable mapping
 */

#include "recon/EnvMapper.hpp"
#include "recon/DotPath.hpp"
#include "recon/Log.hpp"
#include "recon/Parse.hpp"
#include "recon/Typed.hpp"

#include <algorithm>
#include <cctype>

#ifdef _WIN32
    #include <windows.h>
#else
    extern char** environ;
#endif

namespace recon {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool starts_with_icase(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           to_lower(str.substr(0, prefix.size())) == to_lower(prefix);
}

/**
 * @brief All environment variables as (name, value) pairs.
 */
std::vector<std::pair<std::string, std::string>> get_all_env_vars() {
    std::vector<std::pair<std::string, std::string>> result;

    auto add = [&result](const std::string& entry) {
        const size_t eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            result.emplace_back(entry.substr(0, eq), entry.substr(eq + 1));
        }
    };

#ifdef _WIN32
    LPCH block = GetEnvironmentStrings();
    if (block == nullptr) return result;
    for (LPCH current = block; *current != '\0';) {
        std::string entry(current);
        add(entry);
        current += entry.size() + 1;
    }
    FreeEnvironmentStrings(block);
#else
    if (environ == nullptr) return result;
    for (char** env = environ; *env != nullptr; ++env) {
        add(*env);
    }
#endif

    return result;
}

/// Key with every '_' read as '.', for RULE E3 matching
std::string dotted(std::string key) {
    std::replace(key.begin(), key.end(), '_', '.');
    return key;
}

} // anonymous namespace

std::string transform_env_name(const std::string& name) {
    const std::string lower = to_lower(name);
    std::string out;
    out.reserve(lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] != '_') {
            out += lower[i];
        } else if (i + 1 < lower.size() && lower[i + 1] == '_') {
            out += '_';
            ++i;
        } else {
            out += '.';
        }
    }
    return out;
}

std::string strip_prefix(const std::string& var_name, const std::string& prefix) {
    const std::string full = prefix + "_";
    if (!starts_with_icase(var_name, full)) {
        return "";
    }
    return var_name.substr(full.size());
}

std::vector<std::pair<std::string, std::string>>
collect_env_vars(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> result;
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') {
        normalized.pop_back();
    }
    // RULE E1
    if (normalized.empty()) {
        return result;
    }
    for (auto& [name, value] : get_all_env_vars()) {
        if (!strip_prefix(name, normalized).empty()) {
            result.emplace_back(std::move(name), std::move(value));
        }
    }
    return result;
}

std::set<std::string> flatten_keys(const Value& data, const std::string& prefix) {
    std::set<std::string> keys;
    if (!data.is_object() || typed::is_typed(data)) {
        return keys;
    }
    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        keys.insert(key);
        auto nested = flatten_keys(it.value(), key);
        keys.insert(nested.begin(), nested.end());
    }
    return keys;
}

std::string remap_env_key(const std::string& dot_path,
                          const std::set<std::string>& known_keys) {
    if (known_keys.count(dot_path) > 0) {
        return dot_path;
    }
    const std::string wanted = dotted(dot_path);
    for (const auto& key : known_keys) {
        if (dotted(key) == wanted) {
            return key;
        }
    }
    return "";
}

Value load_env_layer(const std::string& prefix, const Value& known) {
    Value layer = Value::object();
    const auto known_keys = flatten_keys(known);

    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') {
        normalized.pop_back();
    }

    for (const auto& [name, raw] : collect_env_vars(normalized)) {
        const std::string key = remap_env_key(
            transform_env_name(strip_prefix(name, normalized)), known_keys);
        // RULE E4
        if (key.empty()) {
            logger()->debug("ignoring environment variable {}: no such setting", name);
            continue;
        }
        logger()->debug("environment variable {} sets {}", name, key);
        set_by_dot(layer, key, parse_value(raw));
    }
    return layer;
}

} // namespace recon
