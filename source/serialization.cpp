// serialization.cpp - JSON serialization / deserialization

#include <diffx/serialization.h>
#include <diffx/error.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace diffx {

std::string number_to_string(double number)
{
    if (std::isnan(number)) return "nan";
    if (std::isinf(number)) return number < 0 ? "-inf" : "inf";

    // Integral values inside the exactly-representable range print as integers
    if (number == std::trunc(number) && std::fabs(number) < 1e15) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(0) << number;
        std::string text = oss.str();
        return text == "-0" ? "0" : text;
    }

    std::ostringstream oss;
    oss << std::setprecision(15) << number;
    std::string text = oss.str();
    if (std::strtod(text.c_str(), nullptr) != number) {
        oss.str({});
        oss << std::setprecision(17) << number;
        text = oss.str();
    }
    return text;
}

std::string json_quote(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);
    result += '"';

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    result += '"';
    return result;
}

namespace {

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(arg)) {
                oss << number_to_string(arg);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << json_quote(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& [k, v] : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << json_quote(k) << ":" << space_after_colon;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

// ============================================================
// JSON Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    Value parse() {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("empty input");
        }
        Value result = parse_value(0);
        skip_whitespace();
        if (pos_ < json_.size()) {
            fail("unexpected trailing content");
        }
        return result;
    }

private:
    static constexpr int max_depth = 512;

    std::string_view json_;
    std::size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        const std::string message = what + " at position " + std::to_string(pos_);
        detail::log_access_error("from_json", message);
        throw ParseError("json", message);
    }

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            const char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            fail(std::string("expected '") + c + "'");
        }
    }

    Value parse_value(int depth) {
        if (depth > max_depth) {
            fail("nesting too deep");
        }
        skip_whitespace();
        const char c = peek();

        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return Value{parse_string_raw()};
        if (c == 't' || c == 'f' || c == 'n') return parse_literal();
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();

        if (c == '\0') fail("unexpected end of input");
        fail(std::string("unexpected character '") + c + "'");
    }

    Value parse_object(int depth) {
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Value{ValueMap{}};
        }

        auto transient = ValueMap{}.transient();

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("expected string key");
            }
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value(depth + 1);
            // Duplicate keys: the last one wins, at the first one's position
            transient.set(key, ValueBox{std::move(val)});

            skip_whitespace();
            const char c = consume();
            if (c == '}') break;
            if (c != ',') {
                fail("expected ',' or '}' in object");
            }
        }

        return Value{transient.persistent()};
    }

    Value parse_array(int depth) {
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueVector{}};
        }

        auto transient = ValueVector{}.transient();

        while (true) {
            transient.push_back(ValueBox{parse_value(depth + 1)});

            skip_whitespace();
            const char c = consume();
            if (c == ']') break;
            if (c != ',') {
                fail("expected ',' or ']' in array");
            }
        }

        return Value{transient.persistent()};
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            fail("invalid unicode escape");
        }
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = json_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else fail("invalid unicode escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            const char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                break;
            }
            const char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned codepoint = parse_hex4();
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        // High surrogate must be followed by \uDC00-\uDFFF
                        if (consume() != '\\' || consume() != 'u') {
                            fail("unpaired surrogate");
                        }
                        const unsigned low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("unpaired surrogate");
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        fail("unpaired surrogate");
                    }
                    append_utf8(result, codepoint);
                    break;
                }
                default:
                    fail(std::string("invalid escape sequence \\") + escaped);
            }
        }

        fail("unterminated string");
    }

    Value parse_number() {
        const std::size_t start = pos_;
        auto is_digit = [this] { return peek() >= '0' && peek() <= '9'; };

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
            if (is_digit()) fail("leading zero in number");
        } else if (is_digit()) {
            while (is_digit()) consume();
        } else {
            fail("invalid number");
        }

        if (peek() == '.') {
            consume();
            if (!is_digit()) fail("expected digit after decimal point");
            while (is_digit()) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!is_digit()) fail("expected digit in exponent");
            while (is_digit()) consume();
        }

        const std::string num_str{json_.substr(start, pos_ - start)};
        return Value{std::strtod(num_str.c_str(), nullptr)};
    }

    Value parse_literal() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        fail("invalid literal");
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json_str) {
    JsonParser parser(json_str);
    return parser.parse();
}

} // namespace diffx
