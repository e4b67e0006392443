/**
 * @file Serialize.cpp
 * @brief Implementation of literal expression serialization
 */

#include "recon/Serialize.hpp"
#include "recon/Classify.hpp"
#include "recon/Extract.hpp"
#include "recon/Typed.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <vector>

namespace recon {

namespace {

/// Placeholder rendered instead of containers below max_depth (R1)
const char* const DEPTH_PLACEHOLDER = "'...'";

enum class CastKind {
    Essential,  ///< Omitting it changes what the literal reads back as
    Cosmetic    ///< Only shown for round-trip fidelity in strong mode
};

std::string render(const Value& val, const RenderContext& ctx);

/**
 * @brief Writer collecting pugixml output into a string
 */
struct StringWriter : pugi::xml_writer {
    std::string s;

    void write(const void* data, size_t size) override {
        if (data && size > 0) {
            s.append(static_cast<const char*>(data), size);
        }
    }
};

std::string cast(const std::string& type, CastKind kind, const RenderContext& ctx) {
    if (type.empty()) return "";
    if (ctx.strong) return "[" + type + "]";
    if (ctx.explore) return "";
    return kind == CastKind::Essential ? "[" + type + "]" : "";
}

std::string indent(const RenderContext& ctx, int level) {
    if (level <= 0 || ctx.indent_size <= 0) return "";
    return std::string(static_cast<size_t>(level) * static_cast<size_t>(ctx.indent_size),
                       ctx.indent_char);
}

RenderContext descend(const RenderContext& ctx, bool list_item) {
    RenderContext child = ctx;
    child.depth = ctx.depth + 1;
    child.list_item = list_item;
    return child;
}

/**
 * @brief True when a line of the text starts with the raw block terminator
 */
bool has_raw_terminator(const std::string& text) {
    if (text.compare(0, 2, "'@") == 0) return true;
    return text.find("\n'@") != std::string::npos;
}

std::string render_string(const std::string& text, const RenderContext& ctx) {
    if (text.find('\n') != std::string::npos && !has_raw_terminator(text)) {
        return "@'" + ctx.newline + text + ctx.newline + "'@";
    }
    return quote_literal(text);
}

std::string scalar_text(const Value& raw) {
    if (raw.is_string()) return raw.get<std::string>();
    if (raw.is_null()) return "";
    return raw.dump();
}

std::string member_text(const Value& val, const char* key) {
    auto it = val.find(key);
    if (it == val.end()) return "";
    return scalar_text(*it);
}

bool is_primitive_array(const Value& arr) {
    return std::all_of(arr.begin(), arr.end(), [](const Value& v) {
        return v.is_number() || v.is_boolean();
    });
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string render_markup(const std::string& xml, const RenderContext& ctx) {
    pugi::xml_document doc;
    const pugi::xml_parse_result res = doc.load_buffer(xml.data(), xml.size(),
                                                       pugi::parse_default,
                                                       pugi::encoding_utf8);
    if (!res) {
        return render_string(xml, ctx);
    }

    StringWriter wr;
    unsigned int flags = pugi::format_no_declaration;
    std::string unit;
    if (ctx.indent_size > 0 && ctx.expand >= 0) {
        flags |= pugi::format_indent;
        unit.assign(static_cast<size_t>(ctx.indent_size), ctx.indent_char);
    } else {
        flags |= pugi::format_raw;
    }
    doc.save(wr, unit.c_str(), flags, pugi::encoding_utf8);

    std::string text = std::move(wr.s);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (ctx.newline != "\n") {
        std::string converted;
        for (char c : text) {
            if (c == '\n') converted += ctx.newline;
            else converted += c;
        }
        text = std::move(converted);
    }
    return render_string(text, ctx);
}

std::string render_map(const Value& entries, const std::string& prefix,
                       const RenderContext& ctx) {
    if (ctx.depth >= ctx.max_depth) return DEPTH_PLACEHOLDER;
    if (!entries.is_object() || entries.empty()) return prefix + "@{}";

    const bool compact = ctx.expand < 0;
    const RenderContext child = descend(ctx, false);

    std::vector<std::string> pairs;
    pairs.reserve(entries.size());
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        pairs.push_back(quote_literal(it.key()) + (compact ? "=" : " = ") +
                        render(it.value(), child));
    }

    if (compact) {
        return prefix + "@{" + join(pairs, ";") + "}";
    }
    if (pairs.size() == 1 || ctx.depth >= ctx.expand - 1) {
        return prefix + "@{" + join(pairs, "; ") + "}";
    }

    std::string out = prefix + "@{";
    const std::string pad = indent(ctx, ctx.depth + 1);
    for (const auto& pair : pairs) {
        out += ctx.newline + pad + pair;
    }
    out += ctx.newline + indent(ctx, ctx.depth) + "}";
    return out;
}

std::string render_sequence(const Value& items, const std::string& prefix,
                            const RenderContext& ctx) {
    if (ctx.depth >= ctx.max_depth) return DEPTH_PLACEHOLDER;
    if (!items.is_array() || items.empty()) return prefix + "@()";

    const RenderContext child = descend(ctx, true);

    // R2: keep single-element sequences distinguishable from scalars
    const bool wrap = ctx.list_item || !prefix.empty();
    if (items.size() == 1) {
        std::string elem = "," + render(items[0], child);
        return wrap ? prefix + "(" + elem + ")" : elem;
    }

    std::vector<std::string> parts;
    parts.reserve(items.size());
    for (const auto& item : items) {
        parts.push_back(render(item, child));
    }

    const bool compact = ctx.expand < 0;
    if (compact || ctx.depth >= ctx.expand - 1 || is_primitive_array(items)) {
        std::string inline_text = join(parts, compact ? "," : ", ");
        return wrap ? prefix + "(" + inline_text + ")" : inline_text;
    }

    std::string out = prefix + "@(";
    const std::string pad = indent(ctx, ctx.depth + 1);
    for (const auto& part : parts) {
        out += ctx.newline + pad + part;
    }
    out += ctx.newline + indent(ctx, ctx.depth) + ")";
    return out;
}

std::string render_object(const Value& val, const RenderContext& ctx) {
    const std::string prefix = cast(typed::class_of(val), CastKind::Cosmetic, ctx);
    Value bag = typed::to_property_bag(val);
    if (bag.empty()) {
        auto items = val.find("items");
        if (items != val.end() && items->is_array()) {
            return render_sequence(*items, prefix, ctx);
        }
    }
    return render_map(bag, prefix, ctx);
}

std::string render(const Value& val, const RenderContext& ctx) {
    switch (classify(val)) {
        case Category::Null:
            return "null";

        case Category::Boolean:
            return val.get<bool>() ? "true" : "false";

        case Category::TaggedString:
        case Category::ValueScalar:
            return cast(typed::class_of(val), CastKind::Cosmetic, ctx) +
                   render_string(member_text(val, "value"), ctx);

        case Category::Number:
            return val.dump();

        case Category::String:
            return render_string(val.get<std::string>(), ctx);

        case Category::SecureValue:
            return "secure(" + quote_literal(member_text(val, "value")) + ")";

        case Category::Credential:
            return "credential(" + quote_literal(member_text(val, "username")) +
                   ", secure(" + quote_literal(member_text(val, "password")) + "))";

        case Category::DateTime:
            return cast("datetime", CastKind::Essential, ctx) +
                   quote_literal(member_text(val, "value"));

        case Category::Enumeration: {
            const std::string cls = typed::class_of(val);
            // Flags-like or unnamed enumerations print their numeric value
            if (cls.find('.') != std::string::npos) {
                return cast(cls, CastKind::Essential, ctx) + member_text(val, "value");
            }
            return cast(cls, CastKind::Essential, ctx) +
                   quote_literal(member_text(val, "name"));
        }

        case Category::CodeBlock: {
            const std::string source = member_text(val, "value");
            return "{" + source + (block_has_comment(source) ? ctx.newline : "") + "}";
        }

        case Category::Handle:
            return member_text(val, "value");

        case Category::Markup:
            return cast("xml", CastKind::Essential, ctx) +
                   render_markup(member_text(val, "value"), ctx);

        case Category::Table:
            return render_sequence(val.value("rows", Value::array()), "", ctx);

        case Category::OrderedMap:
            return render_map(val.value("entries", Value::object()),
                              cast("ordered", CastKind::Essential, ctx), ctx);

        case Category::Object:
            return render_object(val, ctx);

        case Category::Map:
            return render_map(val, "", ctx);

        case Category::Sequence:
            return render_sequence(val, "", ctx);
    }
    return "null";
}

} // anonymous namespace

std::string quote_literal(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string serialize(const Value& val, const RenderContext& ctx) {
    std::string text = render(val, ctx);
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return "";
    text.erase(end + 1);
    return text;
}

} // namespace recon
