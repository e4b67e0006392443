/**
 * @file Settings.cpp
 * @brief Settings layering and typed accessors
 */

#include "recon/Settings.hpp"
#include "recon/DotPath.hpp"
#include "recon/EnvMapper.hpp"
#include "recon/Loader.hpp"
#include "recon/Log.hpp"
#include "recon/Merge.hpp"
#include "recon/Parse.hpp"

namespace recon {

namespace {

int non_negative(const Settings& s, const std::string& key, int fallback) {
    const int v = s.get<int>(key, fallback);
    if (v < 0) {
        throw SettingsError(key, "must not be negative");
    }
    return v;
}

char indent_char_of(const std::string& text) {
    if (text == "tab") return '\t';
    if (text == "space") return ' ';
    if (text.size() != 1) {
        throw SettingsError("render.indent_char", "must be a single character, 'tab' or 'space'");
    }
    return text[0];
}

std::string newline_of(const std::string& text) {
    if (text == "\n" || text == "lf") return "\n";
    if (text == "\r\n" || text == "crlf") return "\r\n";
    throw SettingsError("render.newline", "must be \"\\n\", \"\\r\\n\", lf or crlf");
}

} // anonymous namespace

Settings::Settings() : data_(defaults()) {}

Value Settings::defaults() {
    Value messages = Value::object();
    const MessageCatalog catalog;
    for (const auto& id : MessageCatalog::ids()) {
        messages[id] = catalog.get(id);
    }

    const RenderContext render;
    return Value{
        {"render", {
            {"max_depth", render.max_depth},
            {"expand", render.expand},
            {"indent_size", render.indent_size},
            {"indent_char", std::string(1, render.indent_char)},
            {"strong", render.strong},
            {"explore", render.explore},
            {"newline", render.newline},
        }},
        {"compare", {
            {"skip_type_check", false},
            {"sort_arrays", false},
            {"reverse_check", false},
            {"exclude", Value::array()},
        }},
        {"messages", messages},
        {"log", {{"level", "warn"}}},
    };
}

Settings Settings::load(const LoadOptions& opts) {
    // RULE P1
    const Value base = defaults();

    // RULE P2
    Value file_layer = Value::object();
    if (opts.file_path.has_value()) {
        logger()->debug("reading settings from {}", *opts.file_path);
        file_layer = load_settings_file(*opts.file_path);
    }

    // RULE P3
    Value env_layer = Value::object();
    if (!opts.prefix.empty()) {
        env_layer = load_env_layer(opts.prefix, base);
    }

    // RULE P4
    Value override_layer = Value::object();
    for (const auto& [key, value] : opts.overrides) {
        if (!contains_dot(base, key)) {
            throw SettingsError(key, "no such setting");
        }
        set_by_dot(override_layer, key, value);
    }

    return Settings(deep_merge_all({base, file_layer, env_layer, override_layer}));
}

const Value& Settings::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool Settings::contains(const std::string& path) const {
    return contains_dot(data_, path);
}

void Settings::set(const std::string& path, const Value& v) {
    set_by_dot(data_, path, v);
}

RenderContext Settings::render_context() const {
    RenderContext ctx;
    ctx.max_depth = non_negative(*this, "render.max_depth", ctx.max_depth);
    ctx.expand = get<int>("render.expand", ctx.expand);
    ctx.indent_size = non_negative(*this, "render.indent_size", ctx.indent_size);
    ctx.indent_char = indent_char_of(get<std::string>("render.indent_char", " "));
    ctx.strong = get<bool>("render.strong", ctx.strong);
    ctx.explore = get<bool>("render.explore", ctx.explore);
    ctx.newline = newline_of(get<std::string>("render.newline", ctx.newline));
    return ctx;
}

CompareOptions Settings::compare_options() const {
    CompareOptions opts;
    opts.skip_type_check = get<bool>("compare.skip_type_check", false);
    opts.sort_arrays = get<bool>("compare.sort_arrays", false);
    opts.reverse_check = get<bool>("compare.reverse_check", false);
    opts.exclude = get<std::vector<std::string>>("compare.exclude", {});
    return opts;
}

MessageCatalog Settings::message_catalog() const {
    std::map<std::string, std::string> overrides;
    if (contains("messages")) {
        const Value& messages = at("messages");
        if (!messages.is_object()) {
            throw SettingsError("messages", "must be a table of message templates");
        }
        for (auto it = messages.begin(); it != messages.end(); ++it) {
            if (!it.value().is_string()) {
                throw SettingsError("messages." + it.key(), "must be a string");
            }
            overrides[it.key()] = it.value().get<std::string>();
        }
    }
    return MessageCatalog(overrides);
}

std::string Settings::log_level() const {
    return get<std::string>("log.level", "warn");
}

std::string Settings::to_json_string(int indent) const {
    return data_.dump(indent);
}

std::pair<std::string, Value> parse_override(const std::string& text) {
    const size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw SettingsError(text, "expected key=value");
    }
    return {text.substr(0, eq), parse_value(text.substr(eq + 1))};
}

} // namespace recon
