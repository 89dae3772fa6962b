// yaml_adapter.cpp - YAML -> Value via yaml-cpp

#include <diffx/format_adapters.h>
#include <diffx/builders.h>
#include <diffx/error.h>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>
#include <string>

namespace diffx {

namespace {

constexpr int max_depth = 512;

[[noreturn]] void fail(const std::string& message)
{
    detail::log_access_error("parse_yaml", message);
    throw ParseError("yaml", message);
}

double digits_to_number(std::string_view digits, int base)
{
    double result = 0.0;
    for (char c : digits) {
        const int d = c <= '9' ? c - '0' : (c | 0x20) - 'a' + 10;
        result = result * base + d;
    }
    return result;
}

// Plain scalar resolution, YAML 1.2 core schema
Value resolve_plain(const std::string& text)
{
    static const std::regex bool_true{"true|True|TRUE"};
    static const std::regex bool_false{"false|False|FALSE"};
    static const std::regex null_re{"null|Null|NULL|~|"};
    static const std::regex int_dec{"[-+]?[0-9]+"};
    static const std::regex int_oct{"0o[0-7]+"};
    static const std::regex int_hex{"0x[0-9a-fA-F]+"};
    static const std::regex float_re{R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)"};
    static const std::regex inf_re{R"([-+]?(\.inf|\.Inf|\.INF))"};
    static const std::regex nan_re{R"(\.nan|\.NaN|\.NAN)"};

    if (std::regex_match(text, null_re)) return Value{};
    if (std::regex_match(text, bool_true)) return Value{true};
    if (std::regex_match(text, bool_false)) return Value{false};
    if (std::regex_match(text, int_dec) || std::regex_match(text, float_re)) {
        return Value{std::strtod(text.c_str(), nullptr)};
    }
    if (std::regex_match(text, int_oct)) {
        return Value{digits_to_number(std::string_view(text).substr(2), 8)};
    }
    if (std::regex_match(text, int_hex)) {
        return Value{digits_to_number(std::string_view(text).substr(2), 16)};
    }
    if (std::regex_match(text, inf_re)) {
        return Value{text[0] == '-' ? -std::numeric_limits<double>::infinity()
                                    : std::numeric_limits<double>::infinity()};
    }
    if (std::regex_match(text, nan_re)) {
        return Value{std::numeric_limits<double>::quiet_NaN()};
    }
    return Value{text};
}

// Explicit core tags (!!int, !!float, !!bool, !!null) resolve like plain
// scalars; anything else tagged or quoted stays a string
Value resolve_scalar(const YAML::Node& node)
{
    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();

    if (tag == "?") {
        return resolve_plain(text);
    }
    if (tag == "tag:yaml.org,2002:int" || tag == "tag:yaml.org,2002:float" ||
        tag == "tag:yaml.org,2002:bool" || tag == "tag:yaml.org,2002:null") {
        Value resolved = resolve_plain(text);
        if (resolved.is_string()) {
            fail("value '" + text + "' does not match tag " + tag);
        }
        return resolved;
    }
    return Value{text};
}

Value convert(const YAML::Node& node, int depth)
{
    if (depth > max_depth) {
        fail("nesting too deep");
    }

    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value{};

        case YAML::NodeType::Scalar:
            return resolve_scalar(node);

        case YAML::NodeType::Sequence: {
            VectorBuilder builder;
            for (const auto& child : node) {
                builder.push_back(convert(child, depth + 1));
            }
            return builder.finish();
        }

        case YAML::NodeType::Map: {
            MapBuilder builder;
            for (const auto& kv : node) {
                const YAML::Node& key = kv.first;
                std::string key_text;
                if (key.IsScalar()) {
                    key_text = key.Scalar();
                } else if (key.IsNull()) {
                    key_text = "null";
                } else {
                    const auto mark = key.Mark();
                    fail("non-scalar mapping key at line " + std::to_string(mark.line + 1));
                }
                builder.set(key_text, convert(kv.second, depth + 1));
            }
            return builder.finish();
        }
    }
    return Value{};
}

} // anonymous namespace

Value parse_yaml(std::string_view content)
{
    YAML::Node root;
    try {
        // First document only
        root = YAML::Load(std::string(content));
    } catch (const YAML::Exception& e) {
        fail(e.msg + " at line " + std::to_string(e.mark.line + 1) +
             ", column " + std::to_string(e.mark.column + 1));
    }
    return convert(root, 0);
}

} // namespace diffx
