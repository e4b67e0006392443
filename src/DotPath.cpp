/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path access
 */

#include "recon/DotPath.hpp"
#include "recon/Errors.hpp"
#include "recon/Typed.hpp"

#include <algorithm>
#include <cctype>

namespace recon {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c != '.') {
            current += c;
        } else if (!current.empty()) {
            segments.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        if (!out.empty()) out += '.';
        out += seg;
    }
    return out;
}

namespace {

/**
 * @brief Canonical non-negative index ("0", "12", not "012")
 */
bool is_index(const std::string& seg) {
    if (seg.empty() || (seg[0] == '0' && seg.size() > 1)) return false;
    return std::all_of(seg.begin(), seg.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_traversable(const Value& val) {
    return val.is_array() || (val.is_object() && !typed::is_typed(val));
}

/**
 * @brief Descend one segment
 * @return Child pointer, or nullptr when the segment does not exist
 * @throws TypeError when @p current cannot be traversed
 */
const Value* step(const Value& current, const std::string& seg, const std::string& path) {
    if (!is_traversable(current)) {
        throw TypeError(path, "map or array", type_name(current));
    }
    if (current.is_object()) {
        auto it = current.find(seg);
        return it == current.end() ? nullptr : &*it;
    }
    if (!is_index(seg)) return nullptr;
    const size_t idx = std::stoull(seg);
    return idx < current.size() ? &current[idx] : nullptr;
}

} // anonymous namespace

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (!current) throw KeyError(path, seg);
    }
    return current;
}

const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& fallback) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (!current) return &fallback;
    }
    return current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value,
                bool create_missing) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        const bool last = i + 1 == segments.size();

        if (!current->is_object() || typed::is_typed(*current)) {
            if (!create_missing) {
                throw TypeError(path, "map", type_name(*current));
            }
            *current = Value::object();
        }
        if (last) {
            (*current)[seg] = value;
            return;
        }
        if (!current->contains(seg)) {
            if (!create_missing) throw KeyError(path, seg);
            (*current)[seg] = Value::object();
        }
        current = &(*current)[seg];
    }
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        if (!is_traversable(*current)) return false;
        current = step(*current, seg, path);
        if (!current) return false;
    }
    return true;
}

} // namespace recon
