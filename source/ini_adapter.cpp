// ini_adapter.cpp - INI -> Value via Boost.PropertyTree

#include <diffx/format_adapters.h>
#include <diffx/builders.h>
#include <diffx/error.h>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace diffx {

namespace pt = boost::property_tree;

namespace {

std::string_view trim(std::string_view s)
{
    const auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(first, last - first + 1);
}

// Section names in text order, read the way read_ini reads a header:
// a trimmed line starting with '[', name up to the first ']'.
// read_ini drops sections without keys, so these restore them.
std::vector<std::string> section_names(std::string_view content)
{
    std::vector<std::string> names;
    std::size_t start = 0;
    while (start <= content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) end = content.size();
        const auto line = trim(content.substr(start, end - start));
        if (!line.empty() && line.front() == '[') {
            const auto close = line.find(']');
            if (close != std::string_view::npos) {
                names.emplace_back(trim(line.substr(1, close - 1)));
            }
        }
        start = end + 1;
    }
    return names;
}

Value convert_section(const pt::ptree& section)
{
    MapBuilder builder;
    for (const auto& [key, leaf] : section) {
        builder.set(key, Value{leaf.data()});
    }
    return builder.finish();
}

} // anonymous namespace

Value parse_ini(std::string_view content)
{
    pt::ptree tree;
    try {
        std::istringstream is{std::string(content)};
        pt::ini_parser::read_ini(is, tree);
    } catch (const pt::ini_parser_error& e) {
        const std::string message = e.message() + " at line " + std::to_string(e.line());
        detail::log_access_error("parse_ini", message);
        throw ParseError("ini", message);
    }

    MapBuilder root;

    // Top-level keys: read_ini only accepts them before the first section
    for (const auto& [name, node] : tree) {
        if (node.empty()) {
            root.set(name, Value{node.data()});
        }
    }

    // Sections in text order, empty ones included
    for (const auto& name : section_names(content)) {
        auto found = tree.find(name);
        if (found != tree.not_found() && !found->second.empty()) {
            root.set(name, convert_section(found->second));
        } else {
            root.set(name, Value{ValueMap{}});
        }
    }
    return root.finish();
}

} // namespace diffx
