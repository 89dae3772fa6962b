// xml_adapter.cpp - XML -> Value via Boost.PropertyTree
//
// <user id="1"><name>Alice</name><tag>a</tag><tag>b</tag></user>
// becomes
// {"user": {"@id": "1", "name": "Alice", "tag": ["a", "b"]}}

#include <diffx/format_adapters.h>
#include <diffx/builders.h>
#include <diffx/error.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace diffx {

namespace pt = boost::property_tree;

namespace {

constexpr const char* attr_key    = "<xmlattr>";
constexpr const char* comment_key = "<xmlcomment>";

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

Value convert_element(const pt::ptree& element)
{
    const std::string text = trim(element.data());

    // Group child elements by tag, in first-appearance order
    std::vector<std::pair<std::string, std::vector<const pt::ptree*>>> groups;
    const pt::ptree* attrs = nullptr;
    for (const auto& [tag, child] : element) {
        if (tag == attr_key) {
            attrs = &child;
            continue;
        }
        if (tag == comment_key) continue;

        auto it = std::find_if(groups.begin(), groups.end(),
                               [&tag](const auto& g) { return g.first == tag; });
        if (it == groups.end()) {
            groups.emplace_back(tag, std::vector<const pt::ptree*>{&child});
        } else {
            it->second.push_back(&child);
        }
    }

    if (!attrs && groups.empty()) {
        return Value{text};
    }

    MapBuilder builder;
    if (attrs) {
        for (const auto& [name, attr] : *attrs) {
            builder.set("@" + name, Value{attr.data()});
        }
    }
    for (const auto& [tag, children] : groups) {
        if (children.size() == 1) {
            builder.set(tag, convert_element(*children.front()));
            continue;
        }
        VectorBuilder items;
        for (const auto* child : children) {
            items.push_back(convert_element(*child));
        }
        builder.set(tag, items.finish());
    }
    if (!text.empty()) {
        builder.set("#text", Value{text});
    }
    return builder.finish();
}

[[noreturn]] void fail(const std::string& message)
{
    detail::log_access_error("parse_xml", message);
    throw ParseError("xml", message);
}

} // anonymous namespace

Value parse_xml(std::string_view content)
{
    pt::ptree tree;
    try {
        std::istringstream is{std::string(content)};
        pt::read_xml(is, tree, pt::xml_parser::no_comments);
    } catch (const pt::xml_parser_error& e) {
        fail(e.message() + " at line " + std::to_string(e.line()));
    }

    const pt::ptree* root = nullptr;
    std::string root_name;
    for (const auto& [tag, child] : tree) {
        if (tag == comment_key) continue;
        if (root) {
            fail("multiple root elements");
        }
        root = &child;
        root_name = tag;
    }
    if (!root) {
        fail("no root element");
    }

    return MapBuilder().set(root_name, convert_element(*root)).finish();
}

} // namespace diffx
