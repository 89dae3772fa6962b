// main.cpp
// diffx demo - comparing two configuration documents
//
// Walks through the main entry points:
//
// 1: diff() with default options, printed in each output format
// 2: DiffOptions (epsilon, ignore regex, array id key, path filter)
// 3: Cross-format comparison (YAML vs TOML)
// 4: Brief mode and exit status

#include <diffx/error.h>
#include <diffx/format_adapters.h>
#include <diffx/formatter.h>
#include <diffx/options.h>
#include <diffx/serialization.h>
#include <diffx/value_diff.h>

#include <iostream>
#include <string>

using namespace diffx;

namespace {

const char* old_config = R"({
  "service": "billing",
  "version": 3,
  "timeout": 1.0,
  "_revision": "a1b2",
  "users": [
    {"id": 1, "name": "Alice", "role": "admin"},
    {"id": 2, "name": "Bob", "role": "viewer"}
  ]
})";

const char* new_config = R"({
  "service": "billing",
  "version": "3",
  "timeout": 1.0004,
  "_revision": "c3d4",
  "users": [
    {"id": 2, "name": "Bob", "role": "editor"},
    {"id": 1, "name": "Alice", "role": "admin"},
    {"id": 3, "name": "Carol", "role": "viewer"}
  ],
  "region": "eu-west"
})";

void print_section(const std::string& title)
{
    std::cout << "\n=== " << title << " ===\n";
}

void demo_default_options(const Value& a, const Value& b)
{
    print_section("Default options");

    auto records = diff(a, b);
    std::cout << format_output(records, OutputFormat::Diffx);

    print_section("Same result as JSON");
    std::cout << format_output(records, OutputFormat::Json) << "\n";
}

void demo_options(const Value& a, const Value& b)
{
    print_section("epsilon=0.001, ignore '^_', match users by id");

    DiffOptionsOverrides o;
    o.epsilon = 0.001;
    o.ignore_keys_regex = "^_";
    o.array_id_key = "id";

    DiffCollector collector(DiffOptions::from(o));
    collector.diff(a, b);
    collector.print_diffs();

    print_section("Only paths containing 'users'");
    o.path_filter = "users";
    std::cout << render(diff(a, b, o), DiffOptions::from(o));
}

void demo_cross_format()
{
    print_section("YAML vs TOML");

    Value yaml_doc = parse("server:\n  host: localhost\n  port: 8080\n", InputFormat::Yaml);
    Value toml_doc = parse("[server]\nhost = \"localhost\"\nport = 8081\n", InputFormat::Toml);

    std::cout << format_output(diff(yaml_doc, toml_doc), OutputFormat::Yaml) << "\n";
}

void demo_brief(const Value& a, const Value& b)
{
    print_section("Brief mode");

    DiffOptionsOverrides o;
    o.brief_mode = true;
    const auto options = DiffOptions::from(o);

    auto records = diff(a, b, options);
    std::cout << render(records, options);
    std::cout << "exit status: " << static_cast<int>(exit_status(records)) << "\n";
}

} // anonymous namespace

int main()
{
    try {
        const Value a = from_json(old_config);
        const Value b = from_json(new_config);

        demo_default_options(a, b);
        demo_options(a, b);
        demo_cross_format();
        demo_brief(a, b);
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return static_cast<int>(ExitStatus::Error);
    }
    return 0;
}
