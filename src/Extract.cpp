/**
 * @file Extract.cpp
 * @brief Restricted lexer and parser for literal argument text
 *
 * The parser builds values directly from tokens and never hands text to an
 * evaluator. Anything that would need evaluation is rejected.
 */

#include "recon/Extract.hpp"
#include "recon/Errors.hpp"
#include "recon/Typed.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace recon {

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// Characters that end a bare word or number
bool is_terminator(char c) {
    return is_space(c) || c == '\n' || c == ',' || c == ';' || c == '=' ||
           c == '(' || c == ')' || c == '{' || c == '}' || c == '[' ||
           c == ']' || c == '\'' || c == '"';
}

bool starts_comment(std::string_view text, size_t i) {
    if (text[i] != '#') return false;
    if (i == 0) return true;
    char prev = text[i - 1];
    return is_space(prev) || prev == '\n' || prev == ';' || prev == '{' || prev == '(';
}

/**
 * @brief Scan a brace-delimited block starting at @p start
 * @return Index one past the matching '}', or npos when unbalanced
 */
size_t scan_block(std::string_view text, size_t start) {
    int depth = 0;
    char quote = '\0';
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (quote != '\0') {
            if (c == quote) quote = '\0';
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (starts_comment(text, i)) {
            while (i + 1 < text.size() && text[i + 1] != '\n') ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return i + 1;
        }
    }
    return std::string_view::npos;
}

// ============================================================================
// Lexer
// ============================================================================

enum class Tok {
    End,
    String,
    DqString,
    Number,
    Word,
    Variable,
    SubExpr,
    AtBrace,
    AtParen,
    LParen,
    RParen,
    RBrace,
    Block,
    Cast,
    Comma,
    Semicolon,
    Equals,
    Newline
};

struct Token {
    Tok kind = Tok::End;
    std::string text;
    size_t offset = 0;
    bool spaced = false;      ///< Preceded by whitespace or a comment
    bool expandable = false;  ///< Double-quoted text containing '$'
};

class Lexer {
public:
    explicit Lexer(std::string_view text) : text_(text) {}

    Token next() {
        bool spaced = skip_blanks();
        Token tok;
        tok.offset = pos_;
        tok.spaced = spaced;
        if (pos_ >= text_.size()) return tok;

        const char c = text_[pos_];
        switch (c) {
            case '\n': return single(tok, Tok::Newline);
            case ',':  return single(tok, Tok::Comma);
            case ';':  return single(tok, Tok::Semicolon);
            case '=':  return single(tok, Tok::Equals);
            case '(':  return single(tok, Tok::LParen);
            case ')':  return single(tok, Tok::RParen);
            case '}':  return single(tok, Tok::RBrace);
            case '{':  return block(tok);
            case '[':  return cast(tok);
            case '\'': return single_quoted(tok);
            case '"':  return double_quoted(tok);
            case '@':
                if (peek(1) == '{') return pair(tok, Tok::AtBrace);
                if (peek(1) == '(') return pair(tok, Tok::AtParen);
                if (peek(1) == '\'') return raw_string(tok);
                break;
            case '$':
                if (peek(1) == '(') return pair(tok, Tok::SubExpr);
                ++pos_;
                tok.kind = Tok::Variable;
                tok.text = "$" + read_word();
                return tok;
            default:
                break;
        }
        return number_or_word(tok);
    }

private:
    std::string_view text_;
    size_t pos_ = 0;

    char peek(size_t ahead) const {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    bool skip_blanks() {
        bool skipped = false;
        while (pos_ < text_.size()) {
            if (is_space(text_[pos_])) {
                ++pos_;
            } else if (starts_comment(text_, pos_)) {
                while (pos_ < text_.size() && text_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
            skipped = true;
        }
        return skipped;
    }

    Token single(Token& tok, Tok kind) {
        tok.kind = kind;
        tok.text = std::string(1, text_[pos_]);
        ++pos_;
        return tok;
    }

    Token pair(Token& tok, Tok kind) {
        tok.kind = kind;
        tok.text = std::string(text_.substr(pos_, 2));
        pos_ += 2;
        return tok;
    }

    std::string read_word() {
        size_t start = pos_;
        while (pos_ < text_.size() && !is_terminator(text_[pos_])) ++pos_;
        return std::string(text_.substr(start, pos_ - start));
    }

    Token block(Token& tok) {
        size_t end = scan_block(text_, pos_);
        if (end == std::string_view::npos) {
            throw MalformedLiteral(pos_, "unterminated code block");
        }
        tok.kind = Tok::Block;
        tok.text = std::string(text_.substr(pos_, end - pos_));
        pos_ = end;
        return tok;
    }

    Token cast(Token& tok) {
        const size_t start = pos_;
        int depth = 0;
        for (; pos_ < text_.size(); ++pos_) {
            char c = text_[pos_];
            if (c == '\n') break;
            if (c == '[') ++depth;
            if (c == ']' && --depth == 0) break;
        }
        if (pos_ >= text_.size() || text_[pos_] != ']') {
            throw MalformedLiteral(start, "unterminated type name");
        }
        std::string name(text_.substr(start + 1, pos_ - start - 1));
        ++pos_;
        auto first = name.find_first_not_of(" \t");
        auto last = name.find_last_not_of(" \t");
        if (first == std::string::npos) {
            throw MalformedLiteral(start, "empty type name");
        }
        tok.kind = Tok::Cast;
        tok.text = name.substr(first, last - first + 1);
        return tok;
    }

    Token single_quoted(Token& tok) {
        const size_t start = pos_++;
        std::string out;
        for (;;) {
            if (pos_ >= text_.size()) {
                throw MalformedLiteral(start, "unterminated string");
            }
            char c = text_[pos_++];
            if (c == '\'') {
                if (peek(0) != '\'') break;
                ++pos_;
            }
            out += c;
        }
        tok.kind = Tok::String;
        tok.text = std::move(out);
        return tok;
    }

    Token double_quoted(Token& tok) {
        const size_t start = pos_++;
        std::string out;
        for (;;) {
            if (pos_ >= text_.size()) {
                throw MalformedLiteral(start, "unterminated string");
            }
            char c = text_[pos_++];
            if (c == '"') {
                if (peek(0) != '"') break;
                ++pos_;
            }
            if (c == '$') tok.expandable = true;
            out += c;
        }
        tok.kind = Tok::DqString;
        tok.text = std::move(out);
        return tok;
    }

    Token raw_string(Token& tok) {
        const size_t start = pos_;
        pos_ += 2;
        while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t')) ++pos_;
        if (pos_ < text_.size() && text_[pos_] == '\r') ++pos_;
        if (pos_ >= text_.size() || text_[pos_] != '\n') {
            throw MalformedLiteral(start, "raw string must begin on a new line");
        }
        const size_t open_nl = pos_;
        const bool crlf = open_nl > 0 && text_[open_nl - 1] == '\r';

        size_t close = text_.find("\n'@", open_nl);
        if (close == std::string_view::npos) {
            throw MalformedLiteral(start, "unterminated raw string");
        }

        std::string content;
        if (close > open_nl) {
            content = std::string(text_.substr(open_nl + 1, close - open_nl - 1));
            if (crlf && !content.empty() && content.back() == '\r') content.pop_back();
        }
        pos_ = close + 3;
        tok.kind = Tok::String;
        tok.text = std::move(content);
        return tok;
    }

    /**
     * @brief Number pattern: [+-]? (digits [. digits*] | . digits) ([eE] [+-]? digits)?
     * @return Length of the match, or 0 when the text is not a number
     */
    size_t match_number() const {
        size_t i = pos_;
        if (i < text_.size() && (text_[i] == '+' || text_[i] == '-')) ++i;
        size_t digits = 0;
        while (i < text_.size() && is_digit(text_[i])) { ++i; ++digits; }
        if (i < text_.size() && text_[i] == '.') {
            ++i;
            while (i < text_.size() && is_digit(text_[i])) { ++i; ++digits; }
        }
        if (digits == 0) return 0;
        if (i < text_.size() && (text_[i] == 'e' || text_[i] == 'E')) {
            size_t j = i + 1;
            if (j < text_.size() && (text_[j] == '+' || text_[j] == '-')) ++j;
            size_t exp_digits = 0;
            while (j < text_.size() && is_digit(text_[j])) { ++j; ++exp_digits; }
            if (exp_digits == 0) return 0;
            i = j;
        }
        if (i < text_.size() && !is_terminator(text_[i])) return 0;
        return i - pos_;
    }

    Token number_or_word(Token& tok) {
        size_t len = match_number();
        if (len > 0) {
            tok.kind = Tok::Number;
            tok.text = std::string(text_.substr(pos_, len));
            pos_ += len;
            return tok;
        }
        tok.kind = Tok::Word;
        tok.text = read_word();
        if (tok.text.empty()) {
            throw MalformedLiteral(pos_, std::string("unexpected character '") + text_[pos_] + "'");
        }
        // Splatted (@name) or embedded ($name) variables
        if (tok.text.front() == '@' || tok.text.find('$') != std::string::npos) {
            throw UnsupportedArgumentShape("variable", tok.offset);
        }
        return tok;
    }
};

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    explicit Parser(std::string_view text) : lexer_(text) {
        advance();
    }

    std::vector<Value> arguments() {
        std::vector<Value> out;
        skip_newlines();
        while (tok_.kind != Tok::End) {
            // X5: a block is never a literal argument on its own
            if (tok_.kind == Tok::Block) {
                throw UnsupportedArgumentShape("code-block", tok_.offset);
            }
            Value arg = expression(nullptr);
            // X1: list arguments contribute their elements
            if (arg.is_array()) {
                for (auto& elem : arg) out.push_back(std::move(elem));
            } else {
                out.push_back(std::move(arg));
            }
            if (tok_.kind != Tok::End && tok_.kind != Tok::Newline && !tok_.spaced) {
                throw MalformedLiteral(tok_.offset, "arguments must be separated by whitespace");
            }
            skip_newlines();
        }
        return out;
    }

    Value single() {
        skip_newlines();
        if (tok_.kind == Tok::End) {
            throw MalformedLiteral(tok_.offset, "empty expression");
        }
        if (tok_.kind == Tok::Block) {
            throw UnsupportedArgumentShape("code-block", tok_.offset);
        }
        Value val = expression(nullptr);
        skip_newlines();
        if (tok_.kind != Tok::End) {
            throw MalformedLiteral(tok_.offset, "unexpected trailing input");
        }
        return val;
    }

private:
    Lexer lexer_;
    Token tok_;
    int map_depth_ = 0;

    void advance() {
        tok_ = lexer_.next();
    }

    void skip_newlines() {
        while (tok_.kind == Tok::Newline) advance();
    }

    void skip_separators() {
        while (tok_.kind == Tok::Newline || tok_.kind == Tok::Semicolon) advance();
    }

    [[noreturn]] void unexpected(const char* expected) const {
        std::string found = tok_.kind == Tok::End ? "end of input"
                          : tok_.kind == Tok::Newline ? "new line"
                          : "'" + tok_.text + "'";
        throw MalformedLiteral(tok_.offset, std::string("expected ") + expected +
                                            ", found " + found);
    }

    /**
     * @brief element { ',' element }
     * @param listed Set when the value was built by a comma
     */
    Value expression(bool* listed) {
        bool unary = false;
        Value first = element(&unary);
        if (tok_.kind != Tok::Comma) {
            if (listed) *listed = unary;
            return first;
        }
        Value arr = Value::array();
        arr.push_back(std::move(first));
        while (tok_.kind == Tok::Comma) {
            advance();
            skip_newlines();
            arr.push_back(element(nullptr));
        }
        if (listed) *listed = true;
        return arr;
    }

    /// ',' element | primary
    Value element(bool* unary) {
        if (tok_.kind == Tok::Comma) {
            advance();
            skip_newlines();
            Value arr = Value::array();
            arr.push_back(element(nullptr));
            if (unary) *unary = true;
            return arr;
        }
        return primary();
    }

    Value primary() {
        const Token t = tok_;
        switch (t.kind) {
            case Tok::Cast: {
                advance();
                Value operand = primary();
                return apply_cast(t.text, std::move(operand), t.offset);
            }
            case Tok::String:
                advance();
                return Value(t.text);
            case Tok::DqString:
                if (t.expandable) {
                    throw UnsupportedArgumentShape("expandable-string", t.offset);
                }
                advance();
                return Value(t.text);
            case Tok::Number:
                advance();
                return parse_number(t);
            case Tok::Word:
                return word();
            case Tok::AtBrace:
                advance();
                return map_literal(t.offset);
            case Tok::AtParen:
                advance();
                return array_literal(t.offset);
            case Tok::LParen:
                advance();
                return group();
            case Tok::Block:
                if (map_depth_ == 0) {
                    throw UnsupportedArgumentShape("code-block", t.offset);
                }
                advance();
                return typed::script(normalize_block_text(t.text));
            case Tok::Variable:
                throw UnsupportedArgumentShape("variable", t.offset);
            case Tok::SubExpr:
                throw UnsupportedArgumentShape("sub-expression", t.offset);
            default:
                unexpected("a value");
        }
    }

    Value word() {
        const Token t = tok_;
        advance();
        if (tok_.kind == Tok::LParen && !tok_.spaced) {
            return call(t);
        }
        const std::string lower = to_lower(t.text);
        if (lower == "true") return true;
        if (lower == "false") return false;
        if (lower == "null") return nullptr;
        return Value(t.text);
    }

    Value call(const Token& name) {
        const std::string fn = to_lower(name.text);
        if (fn != "secure" && fn != "credential") {
            throw UnsupportedArgumentShape("call", name.offset);
        }

        advance();  // '('
        std::vector<Value> args;
        skip_newlines();
        while (tok_.kind != Tok::RParen) {
            args.push_back(element(nullptr));
            skip_newlines();
            if (tok_.kind == Tok::Comma) {
                advance();
                skip_newlines();
            } else if (tok_.kind != Tok::RParen) {
                unexpected("',' or ')'");
            }
        }
        advance();  // ')'

        if (fn == "secure") {
            if (args.size() != 1 || !args[0].is_string()) {
                throw MalformedLiteral(name.offset, "secure() takes one string argument");
            }
            return typed::secure(args[0].get<std::string>());
        }

        if (args.size() != 2 || !args[0].is_string() ||
            !(args[1].is_string() || typed::is(args[1], typed::kSecure))) {
            throw MalformedLiteral(name.offset,
                                   "credential() takes a user name and a secret");
        }
        const std::string secret = args[1].is_string()
            ? args[1].get<std::string>()
            : args[1].value("value", std::string());
        return typed::credential(args[0].get<std::string>(), secret);
    }

    Value map_literal(size_t offset) {
        Value map = Value::object();
        ++map_depth_;
        skip_separators();
        while (tok_.kind != Tok::RBrace) {
            if (tok_.kind == Tok::End) {
                throw MalformedLiteral(offset, "unterminated map literal");
            }
            const Token key = tok_;
            switch (key.kind) {
                case Tok::DqString:
                    if (key.expandable) {
                        throw UnsupportedArgumentShape("expandable-string", key.offset);
                    }
                    break;
                case Tok::String:
                case Tok::Word:
                case Tok::Number:
                    break;
                default:
                    unexpected("a map key");
            }
            advance();
            if (tok_.kind != Tok::Equals) unexpected("'='");
            advance();
            skip_newlines();
            if (map.contains(key.text)) {
                throw MalformedLiteral(key.offset, "duplicate key '" + key.text + "'");
            }
            map[key.text] = expression(nullptr);
            if (tok_.kind != Tok::Newline && tok_.kind != Tok::Semicolon &&
                tok_.kind != Tok::RBrace) {
                unexpected("';' or a new line");
            }
            skip_separators();
        }
        advance();  // '}'
        --map_depth_;
        return map;
    }

    Value array_literal(size_t offset) {
        std::vector<std::pair<Value, bool>> statements;
        skip_separators();
        while (tok_.kind != Tok::RParen) {
            if (tok_.kind == Tok::End) {
                throw MalformedLiteral(offset, "unterminated array literal");
            }
            bool listed = false;
            Value val = expression(&listed);
            statements.emplace_back(std::move(val), listed);
            if (tok_.kind != Tok::Newline && tok_.kind != Tok::Semicolon &&
                tok_.kind != Tok::RParen) {
                unexpected("a new line or ')'");
            }
            skip_separators();
        }
        advance();  // ')'

        // @('a', 'b') holds the elements of its single list
        if (statements.size() == 1 && statements[0].second) {
            return std::move(statements[0].first);
        }
        Value arr = Value::array();
        for (auto& stmt : statements) arr.push_back(std::move(stmt.first));
        return arr;
    }

    Value group() {
        skip_newlines();
        if (tok_.kind == Tok::RParen) unexpected("a value");
        Value val = expression(nullptr);
        skip_newlines();
        if (tok_.kind != Tok::RParen) unexpected("')'");
        advance();
        return val;
    }

    static Value parse_number(const Token& t) {
        std::string s = t.text;
        if (!s.empty() && s[0] == '+') s.erase(0, 1);
        const bool is_float = s.find_first_of(".eE") != std::string::npos;
        try {
            if (!is_float) {
                try {
                    return Value(static_cast<std::int64_t>(std::stoll(s)));
                } catch (const std::out_of_range&) {
                    if (s[0] != '-') {
                        try {
                            return Value(static_cast<std::uint64_t>(std::stoull(s)));
                        } catch (const std::out_of_range&) {
                            // too large for any integer; read as floating point
                        }
                    }
                }
            }
            return Value(std::stod(s));
        } catch (const std::exception&) {
            throw MalformedLiteral(t.offset, "number out of range: " + t.text);
        }
    }

    static std::string text_of(const Value& val) {
        if (val.is_string()) return val.get<std::string>();
        if (val.is_null()) return "";
        return val.dump();
    }

    static Value apply_cast(const std::string& type, Value val, size_t offset) {
        const std::string t = to_lower(type);

        if (t == "datetime") {
            if (!val.is_string()) {
                throw MalformedLiteral(offset, "[datetime] requires a string");
            }
            return typed::datetime(val.get<std::string>());
        }
        if (t == "xml") {
            if (!val.is_string()) {
                throw MalformedLiteral(offset, "[xml] requires a string");
            }
            return typed::markup(val.get<std::string>());
        }
        if (t == "ordered" || t == "hashtable") {
            if (!val.is_object() || typed::is_typed(val)) {
                throw MalformedLiteral(offset, "[" + type + "] requires a map literal");
            }
            return t == "ordered" ? typed::ordered(std::move(val)) : val;
        }
        if (t == "array") {
            if (val.is_array()) return val;
            Value arr = Value::array();
            arr.push_back(std::move(val));
            return arr;
        }
        if (t == "string") {
            if (typed::is_typed(val) || is_container(val)) {
                throw MalformedLiteral(offset, "[string] requires a scalar");
            }
            return Value(text_of(val));
        }
        if (t == "int" || t == "long" || t == "int32" || t == "int64") {
            if (val.is_number()) return Value(val.get<std::int64_t>());
            if (val.is_string()) {
                try {
                    return Value(static_cast<std::int64_t>(std::stoll(val.get<std::string>())));
                } catch (const std::exception&) {
                    throw MalformedLiteral(offset, "not an integer: " + val.get<std::string>());
                }
            }
            throw MalformedLiteral(offset, "[" + type + "] requires a number");
        }
        if (t == "double" || t == "float" || t == "single" || t == "decimal") {
            if (val.is_number()) return Value(val.get<double>());
            if (val.is_string()) {
                try {
                    return Value(std::stod(val.get<std::string>()));
                } catch (const std::exception&) {
                    throw MalformedLiteral(offset, "not a number: " + val.get<std::string>());
                }
            }
            throw MalformedLiteral(offset, "[" + type + "] requires a number");
        }
        if (t == "bool") {
            if (val.is_boolean()) return val;
            if (val.is_number()) return Value(val.get<double>() != 0.0);
            throw MalformedLiteral(offset, "[bool] requires a boolean or number");
        }

        // Unknown class: keep the tag on the value
        if (val.is_object() && !typed::is_typed(val)) {
            return typed::object(type, std::move(val));
        }
        if (val.is_array()) {
            return typed::collection(type, std::move(val));
        }
        if (typed::is_typed(val)) {
            throw MalformedLiteral(offset, "cannot cast a typed value to [" + type + "]");
        }
        return typed::scalar(type, std::move(val));
    }
};

} // anonymous namespace

bool block_has_comment(std::string_view source) {
    char quote = '\0';
    for (size_t i = 0; i < source.size(); ++i) {
        char c = source[i];
        if (quote != '\0') {
            if (c == quote) quote = '\0';
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (starts_comment(source, i)) {
            return true;
        }
    }
    return false;
}

std::string normalize_block_text(std::string_view text) {
    std::string source(text);
    if (source.size() >= 2 && source.front() == '{' &&
        scan_block(source, 0) == source.size()) {
        source = source.substr(1, source.size() - 2);
    }
    if (!source.empty() && source.back() == '\n' && block_has_comment(source)) {
        source.pop_back();
        if (!source.empty() && source.back() == '\r') source.pop_back();
    }
    return source;
}

std::vector<Value> extract_arguments(std::string_view text) {
    Parser parser(text);
    return parser.arguments();
}

Value extract_value(std::string_view text) {
    Parser parser(text);
    return parser.single();
}

} // namespace recon
