/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "recon/Loader.hpp"
#include "recon/Errors.hpp"
#include "recon/Extract.hpp"
#include "recon/Log.hpp"
#include "recon/Typed.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace recon {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Line and column (1-based) of a byte offset
 */
std::pair<int, int> line_column(const std::string& text, size_t offset) {
    int line = 1;
    int column = 1;
    for (size_t i = 0; i < offset && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

template <typename T>
std::string stream_text(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

/**
 * @brief Convert a toml++ node to a Value.
 */
Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_text(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_text(node.as_time()->get()));

        case toml::node_type::date_time:
            return typed::datetime(stream_text(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Format loaders
// ============================================================================

Value load_json_file(const std::string& path) {
    const std::string content = read_file(path);
    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        auto [line, column] = line_column(content, e.byte > 0 ? e.byte - 1 : 0);
        throw ConfigParseError(path, line, column, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    try {
        toml::table table = toml::parse_file(path);
        return toml_to_value(table);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

Value load_literal_file(const std::string& path) {
    const std::string content = read_file(path);
    try {
        return extract_value(content);
    } catch (const MalformedLiteral& e) {
        auto [line, column] = line_column(content, e.offset());
        throw ConfigParseError(path, line, column, e.reason());
    } catch (const UnsupportedArgumentShape& e) {
        auto [line, column] = line_column(content, e.offset());
        throw ConfigParseError(path, line, column,
                               "unsupported argument shape '" + e.shape() + "'");
    }
}

// ============================================================================
// Entry points
// ============================================================================

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

Value load_property_bag(const std::string& path) {
    const std::string ext = get_file_extension(path);
    logger()->debug("loading {} ({})", path, ext.empty() ? "no extension" : ext);

    if (ext == ".json") return load_json_file(path);
    if (ext == ".toml") return load_toml_file(path);
    if (ext == ".rexpr") return load_literal_file(path);

    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    throw ConfigParseError(path, 0, 0,
                           "unsupported file type '" + ext +
                           "' (expected .json, .toml or .rexpr)");
}

Value load_settings_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }
    const std::string ext = get_file_extension(path);
    if (ext != ".json" && ext != ".toml") {
        if (!file_exists(path)) {
            throw FileNotFoundError(path);
        }
        throw ConfigParseError(path, 0, 0,
                               "unsupported settings file type '" + ext +
                               "' (expected .json or .toml)");
    }
    Value data = ext == ".json" ? load_json_file(path) : load_toml_file(path);
    if (!data.is_object()) {
        throw ConfigParseError(path, 0, 0, "settings file must hold a table/object");
    }
    return data;
}

std::string load_text_file(const std::string& path) {
    return read_file(path);
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ReconError("Cannot open '" + path + "' for writing");
    }
    out << text;
    if (!out) {
        throw ReconError("Failed to write '" + path + "'");
    }
}

} // namespace recon
