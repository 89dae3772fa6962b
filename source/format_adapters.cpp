// format_adapters.cpp - Format names, detection and parse dispatch

#include <diffx/format_adapters.h>
#include <diffx/error.h>
#include <diffx/serialization.h>

#include <cctype>
#include <string>

namespace diffx {

namespace {

std::string to_lower(std::string_view s)
{
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // anonymous namespace

std::string_view to_string(InputFormat format) noexcept
{
    switch (format) {
        case InputFormat::Json: return "json";
        case InputFormat::Yaml: return "yaml";
        case InputFormat::Toml: return "toml";
        case InputFormat::Csv:  return "csv";
        case InputFormat::Ini:  return "ini";
        case InputFormat::Xml:  return "xml";
    }
    return "json";
}

InputFormat parse_input_format(std::string_view name)
{
    const std::string lower = to_lower(name);
    if (lower == "json") return InputFormat::Json;
    if (lower == "yaml" || lower == "yml") return InputFormat::Yaml;
    if (lower == "toml") return InputFormat::Toml;
    if (lower == "csv")  return InputFormat::Csv;
    if (lower == "ini")  return InputFormat::Ini;
    if (lower == "xml")  return InputFormat::Xml;
    detail::log_access_error("parse_input_format", "unknown format '" + std::string(name) + "'");
    throw UnsupportedFormat(std::string(name));
}

InputFormat detect_format(std::string_view filename)
{
    const auto dot = filename.rfind('.');
    const auto slash = filename.find_last_of("/\\");
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        detail::log_access_error("detect_format", "no extension in '" + std::string(filename) + "'");
        throw UnsupportedFormat(std::string(filename));
    }

    const std::string ext = to_lower(filename.substr(dot + 1));
    if (ext == "json") return InputFormat::Json;
    if (ext == "yaml" || ext == "yml") return InputFormat::Yaml;
    if (ext == "toml") return InputFormat::Toml;
    if (ext == "csv")  return InputFormat::Csv;
    if (ext == "ini" || ext == "cfg") return InputFormat::Ini;
    if (ext == "xml")  return InputFormat::Xml;

    detail::log_access_error("detect_format", "unknown extension '." + ext + "'");
    throw UnsupportedFormat(ext);
}

Value parse_json(std::string_view content)
{
    return from_json(content);
}

Value parse(std::string_view content, InputFormat format)
{
    switch (format) {
        case InputFormat::Json: return parse_json(content);
        case InputFormat::Yaml: return parse_yaml(content);
        case InputFormat::Toml: return parse_toml(content);
        case InputFormat::Csv:  return parse_csv(content);
        case InputFormat::Ini:  return parse_ini(content);
        case InputFormat::Xml:  return parse_xml(content);
    }
    throw UnsupportedFormat(std::to_string(static_cast<int>(format)));
}

} // namespace diffx
