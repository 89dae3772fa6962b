// toml_adapter.cpp - TOML -> Value
//
// Tables are collected into a mutable tree first so that [table] and
// [[array of tables]] headers can reopen earlier entries; the finished
// tree is then frozen into a Value. Date-times stay strings.

#include <diffx/format_adapters.h>
#include <diffx/builders.h>
#include <diffx/error.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace diffx {

namespace {

struct TomlNode {
    enum class Kind { Leaf, Table, Array };

    Kind kind = Kind::Table;
    Value leaf;
    std::vector<std::pair<std::string, std::unique_ptr<TomlNode>>> table;
    std::vector<std::unique_ptr<TomlNode>> array;

    bool header_defined = false;    // opened by an explicit [header]
    bool dotted_defined = false;    // created through a dotted key
    bool frozen = false;            // inline table or static array
    bool table_array = false;       // created by [[header]]

    static std::unique_ptr<TomlNode> make(Kind kind) {
        auto node = std::make_unique<TomlNode>();
        node->kind = kind;
        return node;
    }

    TomlNode* find(const std::string& key) {
        for (auto& [k, v] : table) {
            if (k == key) return v.get();
        }
        return nullptr;
    }

    TomlNode* insert(const std::string& key, std::unique_ptr<TomlNode> node) {
        table.emplace_back(key, std::move(node));
        return table.back().second.get();
    }
};

Value freeze(const TomlNode& node)
{
    switch (node.kind) {
        case TomlNode::Kind::Leaf:
            return node.leaf;
        case TomlNode::Kind::Array: {
            VectorBuilder builder;
            for (const auto& item : node.array) {
                builder.push_back(freeze(*item));
            }
            return builder.finish();
        }
        case TomlNode::Kind::Table: {
            MapBuilder builder;
            for (const auto& [key, child] : node.table) {
                builder.set(key, freeze(*child));
            }
            return builder.finish();
        }
    }
    return Value{};
}

class TomlParser {
public:
    explicit TomlParser(std::string_view text) : text_(text) {}

    Value parse() {
        auto root = TomlNode::make(TomlNode::Kind::Table);
        TomlNode* current = root.get();

        while (true) {
            skip_blank_lines();
            if (at_end()) break;

            if (peek() == '[') {
                if (peek(1) == '[') {
                    current = parse_array_table_header(*root);
                } else {
                    current = parse_table_header(*root);
                }
            } else {
                parse_key_value(*current);
            }
            expect_line_end();
        }

        return freeze(*root);
    }

private:
    static constexpr int max_depth = 512;

    std::string_view text_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;

    [[noreturn]] void fail(const std::string& what) const {
        const std::string message = what + " at line " + std::to_string(line_);
        detail::log_access_error("parse_toml", message);
        throw ParseError("toml", message);
    }

    bool at_end() const { return pos_ >= text_.size(); }

    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    char consume() {
        if (at_end()) return '\0';
        const char c = text_[pos_++];
        if (c == '\n') ++line_;
        return c;
    }

    bool starts_with(std::string_view s) const {
        return text_.substr(pos_, s.size()) == s;
    }

    void skip_ws() {
        while (peek() == ' ' || peek() == '\t') ++pos_;
    }

    void skip_comment() {
        if (peek() != '#') return;
        while (!at_end() && peek() != '\n') {
            const auto c = static_cast<unsigned char>(peek());
            if ((c < 0x20 && c != '\t' && c != '\r') || c == 0x7f) {
                fail("control character in comment");
            }
            ++pos_;
        }
    }

    bool at_newline() const {
        return peek() == '\n' || (peek() == '\r' && peek(1) == '\n');
    }

    void consume_newline() {
        if (peek() == '\r') ++pos_;
        consume();
    }

    void skip_blank_lines() {
        while (!at_end()) {
            skip_ws();
            skip_comment();
            if (at_newline()) {
                consume_newline();
            } else {
                break;
            }
        }
    }

    // Whitespace, comments and newlines inside arrays
    void skip_ws_comments_newlines() {
        while (!at_end()) {
            skip_ws();
            skip_comment();
            if (at_newline()) {
                consume_newline();
            } else {
                break;
            }
        }
    }

    void expect_line_end() {
        skip_ws();
        skip_comment();
        if (at_end()) return;
        if (!at_newline()) {
            fail("expected newline after value");
        }
        consume_newline();
    }

    // ------------------------------------------------------------
    // Keys
    // ------------------------------------------------------------

    static bool is_bare_key_char(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    }

    std::string parse_simple_key() {
        if (peek() == '"') return parse_basic_string();
        if (peek() == '\'') return parse_literal_string();

        const std::size_t start = pos_;
        while (is_bare_key_char(peek())) ++pos_;
        if (pos_ == start) {
            fail("expected key");
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    std::vector<std::string> parse_key() {
        std::vector<std::string> parts;
        skip_ws();
        parts.push_back(parse_simple_key());
        skip_ws();
        while (peek() == '.') {
            ++pos_;
            skip_ws();
            parts.push_back(parse_simple_key());
            skip_ws();
        }
        return parts;
    }

    static std::string join(const std::vector<std::string>& parts) {
        std::string out;
        for (const auto& p : parts) {
            if (!out.empty()) out += '.';
            out += p;
        }
        return out;
    }

    // ------------------------------------------------------------
    // Tables
    // ------------------------------------------------------------

    // Walk the intermediate segments of a header, creating implicit tables
    TomlNode* walk_header(TomlNode& root, const std::vector<std::string>& parts) {
        TomlNode* node = &root;
        for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
            TomlNode* child = node->find(parts[i]);
            if (!child) {
                child = node->insert(parts[i], TomlNode::make(TomlNode::Kind::Table));
            } else if (child->kind == TomlNode::Kind::Array && child->table_array) {
                child = child->array.back().get();
            } else if (child->kind != TomlNode::Kind::Table || child->frozen) {
                fail("key '" + parts[i] + "' is not a table");
            }
            node = child;
        }
        return node;
    }

    TomlNode* parse_table_header(TomlNode& root) {
        ++pos_;  // '['
        const auto parts = parse_key();
        if (consume() != ']') {
            fail("expected ']' after table name");
        }

        TomlNode* parent = walk_header(root, parts);
        TomlNode* table = parent->find(parts.back());
        if (!table) {
            table = parent->insert(parts.back(), TomlNode::make(TomlNode::Kind::Table));
        } else if (table->kind != TomlNode::Kind::Table || table->frozen) {
            fail("duplicate key '" + join(parts) + "'");
        } else if (table->header_defined || table->dotted_defined) {
            fail("table '" + join(parts) + "' defined more than once");
        }
        table->header_defined = true;
        return table;
    }

    TomlNode* parse_array_table_header(TomlNode& root) {
        pos_ += 2;  // "[["
        const auto parts = parse_key();
        if (consume() != ']' || consume() != ']') {
            fail("expected ']]' after array table name");
        }

        TomlNode* parent = walk_header(root, parts);
        TomlNode* array = parent->find(parts.back());
        if (!array) {
            array = parent->insert(parts.back(), TomlNode::make(TomlNode::Kind::Array));
            array->table_array = true;
        } else if (array->kind != TomlNode::Kind::Array || !array->table_array) {
            fail("duplicate key '" + join(parts) + "'");
        }
        array->array.push_back(TomlNode::make(TomlNode::Kind::Table));
        TomlNode* table = array->array.back().get();
        table->header_defined = true;
        return table;
    }

    // ------------------------------------------------------------
    // Key/value pairs
    // ------------------------------------------------------------

    void parse_key_value(TomlNode& table, int depth = 0) {
        const auto parts = parse_key();
        if (consume() != '=') {
            fail("expected '=' after key '" + join(parts) + "'");
        }
        skip_ws();

        TomlNode* node = &table;
        for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
            TomlNode* child = node->find(parts[i]);
            if (!child) {
                child = node->insert(parts[i], TomlNode::make(TomlNode::Kind::Table));
                child->dotted_defined = true;
            } else if (child->kind != TomlNode::Kind::Table || child->frozen ||
                       (child->header_defined && !child->dotted_defined)) {
                fail("duplicate key '" + join(parts) + "'");
            }
            node = child;
        }

        if (node->find(parts.back())) {
            fail("duplicate key '" + join(parts) + "'");
        }
        node->insert(parts.back(), parse_value(depth));
    }

    // ------------------------------------------------------------
    // Values
    // ------------------------------------------------------------

    std::unique_ptr<TomlNode> leaf(Value v) {
        auto node = TomlNode::make(TomlNode::Kind::Leaf);
        node->leaf = std::move(v);
        return node;
    }

    std::unique_ptr<TomlNode> parse_value(int depth) {
        if (depth > max_depth) {
            fail("nesting too deep");
        }

        const char c = peek();
        if (c == '"') {
            return leaf(Value{starts_with("\"\"\"") ? parse_ml_basic_string() : parse_basic_string()});
        }
        if (c == '\'') {
            return leaf(Value{starts_with("'''") ? parse_ml_literal_string() : parse_literal_string()});
        }
        if (c == '[') return parse_array(depth);
        if (c == '{') return parse_inline_table(depth);
        if (starts_with("true") && !is_bare_key_char(peek(4))) {
            pos_ += 4;
            return leaf(Value{true});
        }
        if (starts_with("false") && !is_bare_key_char(peek(5))) {
            pos_ += 5;
            return leaf(Value{false});
        }
        if (c == '\0' || c == '\n' || c == '\r') {
            fail("missing value");
        }
        return leaf(parse_number_or_date());
    }

    std::unique_ptr<TomlNode> parse_array(int depth) {
        ++pos_;  // '['
        auto node = TomlNode::make(TomlNode::Kind::Array);
        node->frozen = true;

        skip_ws_comments_newlines();
        while (peek() != ']') {
            if (at_end()) fail("unterminated array");
            node->array.push_back(parse_value(depth + 1));
            skip_ws_comments_newlines();
            if (peek() == ',') {
                ++pos_;
                skip_ws_comments_newlines();
            } else if (peek() != ']') {
                fail("expected ',' or ']' in array");
            }
        }
        ++pos_;  // ']'
        return node;
    }

    std::unique_ptr<TomlNode> parse_inline_table(int depth) {
        ++pos_;  // '{'
        auto node = TomlNode::make(TomlNode::Kind::Table);

        skip_ws();
        if (peek() == '}') {
            ++pos_;
            node->frozen = true;
            return node;
        }
        while (true) {
            parse_key_value(*node, depth + 1);
            skip_ws();
            const char c = consume();
            if (c == '}') break;
            if (c != ',') {
                fail("expected ',' or '}' in inline table");
            }
            skip_ws();
        }
        node->frozen = true;
        return node;
    }

    // ------------------------------------------------------------
    // Strings
    // ------------------------------------------------------------

    static void append_utf8(std::string& out, unsigned long cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    void parse_escape(std::string& out) {
        const char e = consume();
        switch (e) {
            case 'b':  out += '\b'; break;
            case 't':  out += '\t'; break;
            case 'n':  out += '\n'; break;
            case 'f':  out += '\f'; break;
            case 'r':  out += '\r'; break;
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case 'u':
            case 'U': {
                const int digits = e == 'u' ? 4 : 8;
                unsigned long cp = 0;
                for (int i = 0; i < digits; ++i) {
                    const char h = consume();
                    cp <<= 4;
                    if (h >= '0' && h <= '9') cp |= static_cast<unsigned long>(h - '0');
                    else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned long>(h - 'a' + 10);
                    else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned long>(h - 'A' + 10);
                    else fail("invalid unicode escape");
                }
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                    fail("invalid unicode scalar value");
                }
                append_utf8(out, cp);
                break;
            }
            default:
                fail(std::string("invalid escape sequence \\") + e);
        }
    }

    std::string parse_basic_string() {
        ++pos_;  // '"'
        std::string result;
        while (true) {
            if (at_end() || at_newline()) fail("unterminated string");
            const char c = consume();
            if (c == '"') return result;
            if (c == '\\') {
                parse_escape(result);
            } else {
                result += c;
            }
        }
    }

    std::string parse_literal_string() {
        ++pos_;  // '\''
        std::string result;
        while (true) {
            if (at_end() || at_newline()) fail("unterminated string");
            const char c = consume();
            if (c == '\'') return result;
            result += c;
        }
    }

    std::string parse_ml_basic_string() {
        pos_ += 3;
        if (at_newline()) consume_newline();

        std::string result;
        while (true) {
            if (at_end()) fail("unterminated multi-line string");
            if (starts_with("\"\"\"")) {
                pos_ += 3;
                // Up to two quotes may sit right before the closing delimiter
                for (int i = 0; i < 2 && peek() == '"'; ++i) {
                    result += '"';
                    ++pos_;
                }
                return result;
            }
            const char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }
            // Line-ending backslash trims the newline and following whitespace
            std::size_t look = pos_;
            while (look < text_.size() && (text_[look] == ' ' || text_[look] == '\t')) ++look;
            if (look < text_.size() && (text_[look] == '\n' || text_[look] == '\r')) {
                while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
                    consume();
                }
                continue;
            }
            parse_escape(result);
        }
    }

    std::string parse_ml_literal_string() {
        pos_ += 3;
        if (at_newline()) consume_newline();

        std::string result;
        while (true) {
            if (at_end()) fail("unterminated multi-line string");
            if (starts_with("'''")) {
                pos_ += 3;
                for (int i = 0; i < 2 && peek() == '\''; ++i) {
                    result += '\'';
                    ++pos_;
                }
                return result;
            }
            result += consume();
        }
    }

    // ------------------------------------------------------------
    // Numbers and date-times
    // ------------------------------------------------------------

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    static bool looks_like_date(std::string_view s) {
        return s.size() >= 10 && is_digit(s[0]) && is_digit(s[1]) && is_digit(s[2]) &&
               is_digit(s[3]) && s[4] == '-' && is_digit(s[5]) && is_digit(s[6]) &&
               s[7] == '-' && is_digit(s[8]) && is_digit(s[9]);
    }

    static bool looks_like_time(std::string_view s) {
        return s.size() >= 8 && is_digit(s[0]) && is_digit(s[1]) && s[2] == ':' &&
               is_digit(s[3]) && is_digit(s[4]) && s[5] == ':' && is_digit(s[6]) && is_digit(s[7]);
    }

    std::string scan_token() {
        const std::size_t start = pos_;
        while (!at_end()) {
            const char c = peek();
            if (c == ',' || c == ']' || c == '}' || c == ' ' || c == '\t' ||
                c == '\n' || c == '\r' || c == '#') {
                break;
            }
            ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    Value parse_date_time(std::string token) {
        // "1979-05-27 07:32:00" uses a space separator
        if (token.size() == 10 && peek() == ' ' && looks_like_time(text_.substr(pos_ + 1))) {
            ++pos_;
            token += ' ';
            token += scan_token();
        }
        for (char c : token) {
            if (!(is_digit(c) || c == '-' || c == ':' || c == '.' || c == 'T' || c == 't' ||
                  c == 'Z' || c == 'z' || c == '+' || c == ' ')) {
                fail("invalid date-time '" + token + "'");
            }
        }
        return Value{std::move(token)};
    }

    // Digits with single underscores between them
    std::string strip_underscores(const std::string& digits, bool (*valid)(char)) {
        std::string out;
        char prev = '\0';
        for (std::size_t i = 0; i < digits.size(); ++i) {
            const char c = digits[i];
            if (c == '_') {
                if (i == 0 || i + 1 == digits.size() || !valid(prev) || !valid(digits[i + 1])) {
                    fail("invalid underscore in number");
                }
            } else if (!valid(c)) {
                fail("invalid digit '" + std::string(1, c) + "'");
            } else {
                out += c;
            }
            prev = c;
        }
        if (out.empty()) fail("missing digits");
        return out;
    }

    static double radix_value(const std::string& digits, int base) {
        double result = 0.0;
        for (char c : digits) {
            const int d = c <= '9' ? c - '0' : (c | 0x20) - 'a' + 10;
            result = result * base + d;
        }
        return result;
    }

    Value parse_number_or_date() {
        std::string token = scan_token();
        if (token.empty()) fail("missing value");

        if (looks_like_date(token) || looks_like_time(token)) {
            return parse_date_time(std::move(token));
        }

        if (token.size() > 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'o' || token[1] == 'b')) {
            const std::string body = token.substr(2);
            switch (token[1]) {
                case 'x':
                    return Value{radix_value(strip_underscores(body, [](char c) {
                        return is_digit(c) || ((c | 0x20) >= 'a' && (c | 0x20) <= 'f');
                    }), 16)};
                case 'o':
                    return Value{radix_value(strip_underscores(body, [](char c) {
                        return c >= '0' && c <= '7';
                    }), 8)};
                default:
                    return Value{radix_value(strip_underscores(body, [](char c) {
                        return c == '0' || c == '1';
                    }), 2)};
            }
        }

        std::size_t i = 0;
        bool negative = false;
        if (token[0] == '+' || token[0] == '-') {
            negative = token[0] == '-';
            i = 1;
        }
        const std::string unsigned_part = token.substr(i);

        if (unsigned_part == "inf") {
            return Value{negative ? -std::numeric_limits<double>::infinity()
                                  : std::numeric_limits<double>::infinity()};
        }
        if (unsigned_part == "nan") {
            return Value{std::numeric_limits<double>::quiet_NaN()};
        }

        // Split into integer part, fraction and exponent
        std::size_t int_end = 0;
        while (int_end < unsigned_part.size() &&
               (is_digit(unsigned_part[int_end]) || unsigned_part[int_end] == '_')) {
            ++int_end;
        }
        const std::string int_digits = strip_underscores(unsigned_part.substr(0, int_end), is_digit);
        if (int_digits.size() > 1 && int_digits[0] == '0') {
            fail("leading zero in number '" + token + "'");
        }

        std::string normalized = (negative ? "-" : "") + int_digits;
        std::size_t p = int_end;

        if (p < unsigned_part.size() && unsigned_part[p] == '.') {
            std::size_t frac_end = p + 1;
            while (frac_end < unsigned_part.size() &&
                   (is_digit(unsigned_part[frac_end]) || unsigned_part[frac_end] == '_')) {
                ++frac_end;
            }
            normalized += '.';
            normalized += strip_underscores(unsigned_part.substr(p + 1, frac_end - p - 1), is_digit);
            p = frac_end;
        }

        if (p < unsigned_part.size() && (unsigned_part[p] == 'e' || unsigned_part[p] == 'E')) {
            ++p;
            normalized += 'e';
            if (p < unsigned_part.size() && (unsigned_part[p] == '+' || unsigned_part[p] == '-')) {
                normalized += unsigned_part[p++];
            }
            normalized += strip_underscores(unsigned_part.substr(p), is_digit);
            p = unsigned_part.size();
        }

        if (p != unsigned_part.size()) {
            fail("invalid value '" + token + "'");
        }
        return Value{std::strtod(normalized.c_str(), nullptr)};
    }
};

} // anonymous namespace

Value parse_toml(std::string_view content)
{
    TomlParser parser(content);
    return parser.parse();
}

} // namespace diffx
