// test_parsers.cpp - Tests for the YAML / TOML / CSV / INI / XML adapters
// and format detection

#include <catch2/catch_all.hpp>
#include <diffx/error.h>
#include <diffx/format_adapters.h>
#include <diffx/value_diff.h>

#include <cmath>
#include <string>
#include <vector>

using namespace diffx;

namespace {

std::vector<std::string> keys_of(const Value& v) {
    std::vector<std::string> keys;
    for (const auto& entry : v.as_map()) {
        keys.push_back(entry.key);
    }
    return keys;
}

template <typename Fn>
std::string parse_error_format(Fn&& fn) {
    try {
        fn();
    } catch (const ParseError& e) {
        return e.format();
    }
    return {};
}

} // namespace

// ============================================================
// Format names and detection
// ============================================================

TEST_CASE("detect_format by extension", "[parsers][detect]") {
    REQUIRE(detect_format("config.json") == InputFormat::Json);
    REQUIRE(detect_format("a/b/c.yaml") == InputFormat::Yaml);
    REQUIRE(detect_format("c.yml") == InputFormat::Yaml);
    REQUIRE(detect_format("Cargo.TOML") == InputFormat::Toml);
    REQUIRE(detect_format("data.csv") == InputFormat::Csv);
    REQUIRE(detect_format("setup.ini") == InputFormat::Ini);
    REQUIRE(detect_format("setup.cfg") == InputFormat::Ini);
    REQUIRE(detect_format("pom.xml") == InputFormat::Xml);

    REQUIRE_THROWS_AS(detect_format("notes.txt"), UnsupportedFormat);
    REQUIRE_THROWS_AS(detect_format("Makefile"), UnsupportedFormat);
    REQUIRE_THROWS_AS(detect_format("dir.d/Makefile"), UnsupportedFormat);

    try {
        (void)detect_format("notes.txt");
        FAIL("expected UnsupportedFormat");
    } catch (const UnsupportedFormat& e) {
        REQUIRE(e.format_name() == "txt");
    }
}

TEST_CASE("input format names", "[parsers][detect]") {
    REQUIRE(parse_input_format("json") == InputFormat::Json);
    REQUIRE(parse_input_format("YAML") == InputFormat::Yaml);
    REQUIRE(parse_input_format("yml") == InputFormat::Yaml);
    REQUIRE(to_string(InputFormat::Toml) == "toml");
    REQUIRE(to_string(InputFormat::Xml) == "xml");
    REQUIRE_THROWS_AS(parse_input_format("protobuf"), UnsupportedFormat);
}

TEST_CASE("parse dispatches on format", "[parsers][detect]") {
    const Value expected = Value::map({{"a", Value{1}}});
    REQUIRE(parse(R"({"a": 1})", InputFormat::Json) == expected);
    REQUIRE(parse("a: 1\n", InputFormat::Yaml) == expected);
    REQUIRE(parse("a = 1\n", InputFormat::Toml) == expected);
    REQUIRE(parse("a = 1\n", InputFormat::Ini) == Value::map({{"a", Value{"1"}}}));
}

// ============================================================
// YAML
// ============================================================

TEST_CASE("YAML core schema scalars", "[parsers][yaml]") {
    Value v = parse_yaml(
        "i: 42\n"
        "neg: -7\n"
        "f: 1.5\n"
        "exp: 1e3\n"
        "hex: 0x1F\n"
        "oct: 0o17\n"
        "t: true\n"
        "f2: False\n"
        "n1: null\n"
        "n2: ~\n"
        "n3:\n"
        "inf: .inf\n"
        "ninf: -.inf\n"
        "nan: .nan\n"
        "s: hello world\n"
        "yes_is_text: yes\n");

    REQUIRE(v.at("i").as_number() == 42);
    REQUIRE(v.at("neg").as_number() == -7);
    REQUIRE(v.at("f").as_number() == 1.5);
    REQUIRE(v.at("exp").as_number() == 1000);
    REQUIRE(v.at("hex").as_number() == 31);
    REQUIRE(v.at("oct").as_number() == 15);
    REQUIRE(v.at("t").as_bool());
    REQUIRE(v.at("f2").is_bool());
    REQUIRE_FALSE(v.at("f2").as_bool(true));
    REQUIRE(v.at("n1").is_null());
    REQUIRE(v.at("n2").is_null());
    REQUIRE(v.at("n3").is_null());
    REQUIRE(std::isinf(v.at("inf").as_number()));
    REQUIRE(v.at("ninf").as_number() < 0);
    REQUIRE(std::isnan(v.at("nan").as_number()));
    REQUIRE(v.at("s").as_string() == "hello world");
    REQUIRE(v.at("yes_is_text").as_string() == "yes");
}

TEST_CASE("YAML quoted scalars stay strings", "[parsers][yaml]") {
    Value v = parse_yaml("a: \"30\"\nb: 'true'\nc: \"null\"\n");
    REQUIRE(v.at("a").as_string() == "30");
    REQUIRE(v.at("b").as_string() == "true");
    REQUIRE(v.at("c").as_string() == "null");

    // Which makes "30" vs 30 a type change
    auto diffs = diff(v, parse_yaml("a: 30\nb: 'true'\nc: \"null\"\n"));
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0].type == DiffRecord::Type::TypeChanged);
}

TEST_CASE("YAML explicit tags", "[parsers][yaml]") {
    Value v = parse_yaml("a: !!str 30\nb: !!int \"42\"\n");
    REQUIRE(v.at("a").as_string() == "30");
    REQUIRE(v.at("b").as_number() == 42);
    REQUIRE_THROWS_AS(parse_yaml("a: !!int abc\n"), ParseError);
}

TEST_CASE("YAML structure", "[parsers][yaml]") {
    Value v = parse_yaml(
        "zeta: 1\n"
        "alpha:\n"
        "  - x\n"
        "  - {k: v}\n"
        "mid: [1, 2]\n");
    REQUIRE(keys_of(v) == std::vector<std::string>{"zeta", "alpha", "mid"});
    REQUIRE(v.at("alpha").size() == 2);
    REQUIRE(v.at("alpha").at(std::size_t{1}).at("k").as_string() == "v");
    REQUIRE(v.at("mid").at(std::size_t{1}).as_number() == 2);

    SECTION("empty document is null") {
        REQUIRE(parse_yaml("").is_null());
        REQUIRE(parse_yaml("# only a comment\n").is_null());
    }

    SECTION("only the first document is read") {
        Value first = parse_yaml("a: 1\n---\na: 2\n");
        REQUIRE(first.at("a").as_number() == 1);
    }

    SECTION("scalar root") {
        REQUIRE(parse_yaml("hello").as_string() == "hello");
    }
}

TEST_CASE("YAML errors", "[parsers][yaml][error]") {
    REQUIRE_THROWS_AS(parse_yaml("a: [1, 2\n"), ParseError);
    REQUIRE_THROWS_AS(parse_yaml("a: \"unterminated\n"), ParseError);
    REQUIRE_THROWS_AS(parse_yaml("? [a, b]\n: 1\n"), ParseError);
    REQUIRE(parse_error_format([] { (void)parse_yaml("{a: 1"); }) == "yaml");
}

// ============================================================
// TOML
// ============================================================

TEST_CASE("TOML tables and keys", "[parsers][toml]") {
    Value v = parse_toml(
        "# comment\n"
        "title = \"TOML Example\"\n"
        "\n"
        "[owner]\n"
        "name = \"Tom\"\n"
        "dob = 1979-05-27T07:32:00-08:00\n"
        "\n"
        "[database]\n"
        "ports = [ 8000, 8001, 8002 ]\n"
        "enabled = true\n"
        "\n"
        "[servers.alpha]\n"
        "ip = \"10.0.0.1\"\n"
        "\"quoted key\" = 1\n"
        "site.\"google.com\" = true\n");

    REQUIRE(keys_of(v) == std::vector<std::string>{"title", "owner", "database", "servers"});
    REQUIRE(v.at("title").as_string() == "TOML Example");
    REQUIRE(v.at("owner").at("dob").as_string() == "1979-05-27T07:32:00-08:00");
    REQUIRE(v.at("database").at("ports").size() == 3);
    REQUIRE(v.at("database").at("ports").at(std::size_t{2}).as_number() == 8002);
    REQUIRE(v.at("database").at("enabled").as_bool());
    REQUIRE(v.at("servers").at("alpha").at("ip").as_string() == "10.0.0.1");
    REQUIRE(v.at("servers").at("alpha").at("quoted key").as_number() == 1);
    REQUIRE(v.at("servers").at("alpha").at("site").at("google.com").as_bool());
}

TEST_CASE("TOML arrays of tables and inline tables", "[parsers][toml]") {
    Value v = parse_toml(
        "[[products]]\n"
        "name = \"Hammer\"\n"
        "sku = 738594937\n"
        "\n"
        "[[products]]\n"
        "\n"
        "[[products]]\n"
        "name = \"Nail\"\n"
        "point = { x = 1, y = 2 }\n"
        "nested = [ [1, 2], [\"a\"] ]\n");

    const Value& products = v.at("products");
    REQUIRE(products.is_sequence());
    REQUIRE(products.size() == 3);
    REQUIRE(products.at(std::size_t{0}).at("name").as_string() == "Hammer");
    REQUIRE(products.at(std::size_t{1}).is_mapping());
    REQUIRE(products.at(std::size_t{1}).size() == 0);
    REQUIRE(products.at(std::size_t{2}).at("point").at("y").as_number() == 2);
    REQUIRE(products.at(std::size_t{2}).at("nested").at(std::size_t{1}).at(std::size_t{0}).as_string() == "a");
}

TEST_CASE("TOML numbers", "[parsers][toml]") {
    Value v = parse_toml(
        "a = 1_000\n"
        "b = 0xDEAD_BEEF\n"
        "c = 0o755\n"
        "d = 0b1101\n"
        "e = -3.5e2\n"
        "f = +inf\n"
        "g = nan\n"
        "h = 6.626e-34\n"
        "i = -0\n");
    REQUIRE(v.at("a").as_number() == 1000);
    REQUIRE(v.at("b").as_number() == 3735928559.0);
    REQUIRE(v.at("c").as_number() == 493);
    REQUIRE(v.at("d").as_number() == 13);
    REQUIRE(v.at("e").as_number() == -350);
    REQUIRE(std::isinf(v.at("f").as_number()));
    REQUIRE(std::isnan(v.at("g").as_number()));
    REQUIRE(v.at("h").as_number() == Catch::Approx(6.626e-34));
    REQUIRE(v.at("i").as_number() == 0);
}

TEST_CASE("TOML strings and date-times", "[parsers][toml]") {
    Value v = parse_toml(
        "basic = \"tab\\there \\u00e9\"\n"
        "literal = 'C:\\Users\\x'\n"
        "multi = \"\"\"\n"
        "line one\n"
        "line two\"\"\"\n"
        "date = 1979-05-27\n"
        "spaced = 1979-05-27 07:32:00\n"
        "time = 07:32:00\n");
    REQUIRE(v.at("basic").as_string() == "tab\there \xC3\xA9");
    REQUIRE(v.at("literal").as_string() == "C:\\Users\\x");
    REQUIRE(v.at("multi").as_string() == "line one\nline two");
    REQUIRE(v.at("date").as_string() == "1979-05-27");
    REQUIRE(v.at("spaced").as_string() == "1979-05-27 07:32:00");
    REQUIRE(v.at("time").as_string() == "07:32:00");
}

TEST_CASE("TOML errors", "[parsers][toml][error]") {
    const char* bad[] = {
        "a = 1\na = 2\n",
        "[t]\nx = 1\n[t]\ny = 2\n",
        "a = 1\n[a]\n",
        "a = \n",
        "a = 01\n",
        "a = 1__0\n",
        "a = \"unterminated\n",
        "a = [1, 2\n",
        "a = { x = 1\n",
        "= 1\n",
        "a = 1 b = 2\n",
        "p = { x = 1 }\n[p]\ny = 2\n",
    };
    for (const char* text : bad) {
        INFO("input: " << text);
        REQUIRE_THROWS_AS(parse_toml(text), ParseError);
    }

    REQUIRE_THROWS_WITH(parse_toml("a = 1\na = 2\n"), Catch::Matchers::ContainsSubstring("line 2"));
    REQUIRE(parse_error_format([] { (void)parse_toml("a = 1\na = 2\n"); }) == "toml");
}

// ============================================================
// CSV
// ============================================================

TEST_CASE("CSV rows keyed by header", "[parsers][csv]") {
    Value v = parse_csv("name,age,city\nAlice,30,Paris\nBob,25,\"New York, NY\"\n");
    REQUIRE(v.is_sequence());
    REQUIRE(v.size() == 2);

    const Value& alice = v.at(std::size_t{0});
    REQUIRE(keys_of(alice) == std::vector<std::string>{"name", "age", "city"});
    // Cells are never inferred
    REQUIRE(alice.at("age").as_string() == "30");
    REQUIRE(v.at(std::size_t{1}).at("city").as_string() == "New York, NY");
}

TEST_CASE("CSV quoting and line endings", "[parsers][csv]") {
    Value v = parse_csv("a,b\r\n\"say \"\"hi\"\"\",\"multi\nline\"\r\n\r\n,x\r\n");
    REQUIRE(v.size() == 2);
    REQUIRE(v.at(std::size_t{0}).at("a").as_string() == "say \"hi\"");
    REQUIRE(v.at(std::size_t{0}).at("b").as_string() == "multi\nline");
    REQUIRE(v.at(std::size_t{1}).at("a").as_string().empty());
    REQUIRE(v.at(std::size_t{1}).at("b").as_string() == "x");

    SECTION("no trailing newline") {
        REQUIRE(parse_csv("a\n1").size() == 1);
    }

    SECTION("header only and empty input") {
        REQUIRE(parse_csv("a,b\n").size() == 0);
        REQUIRE(parse_csv("").is_sequence());
        REQUIRE(parse_csv("").size() == 0);
    }
}

TEST_CASE("CSV bare carriage return at end of input", "[parsers][csv]") {
    Value v = parse_csv("a,b\r\n1,2\r");
    REQUIRE(v.size() == 1);
    REQUIRE(v.at(std::size_t{0}).at("b").as_string() == "2");

    Value quoted = parse_csv("a\r\n\"x\"\r");
    REQUIRE(quoted.at(std::size_t{0}).at("a").as_string() == "x");
}

TEST_CASE("CSV errors", "[parsers][csv][error]") {
    REQUIRE_THROWS_AS(parse_csv("a,b\n1,2,3\n"), ParseError);
    REQUIRE_THROWS_AS(parse_csv("a,b\n1\n"), ParseError);
    REQUIRE_THROWS_AS(parse_csv("a\n\"open\n"), ParseError);
    REQUIRE_THROWS_AS(parse_csv("a\n\"x\"y\n"), ParseError);
    REQUIRE(parse_error_format([] { (void)parse_csv("a,b\n1\n"); }) == "csv");
}

// ============================================================
// INI
// ============================================================

TEST_CASE("INI sections and keys", "[parsers][ini]") {
    Value v = parse_ini(
        "; comment\n"
        "top = level\n"
        "\n"
        "[server]\n"
        "host = localhost\n"
        "port = 8080\n"
        "\n"
        "[empty]\n"
        "\n"
        "[client]\n"
        "timeout = 30\n");

    REQUIRE(keys_of(v) == std::vector<std::string>{"top", "server", "empty", "client"});
    REQUIRE(v.at("top").as_string() == "level");
    REQUIRE(v.at("server").at("host").as_string() == "localhost");
    REQUIRE(v.at("server").at("port").as_string() == "8080");
    REQUIRE(v.at("empty").is_mapping());
    REQUIRE(v.at("empty").size() == 0);
    REQUIRE(v.at("client").at("timeout").as_string() == "30");

    auto diffs = diff(v, parse_ini("top = level\n[server]\nhost = localhost\nport = 9090\n[empty]\n[client]\ntimeout = 30\n"));
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0].path == "server.port");
}

TEST_CASE("INI section headers with trailing text", "[parsers][ini]") {
    Value v = parse_ini("[db] ; primary\nhost = a\n\n[cache]   # local\n");
    REQUIRE(keys_of(v) == std::vector<std::string>{"db", "cache"});
    REQUIRE(v.at("db").is_mapping());
    REQUIRE(v.at("db").at("host").as_string() == "a");
    REQUIRE(v.at("cache").is_mapping());
    REQUIRE(v.at("cache").size() == 0);
}

TEST_CASE("INI empty sections keep their position", "[parsers][ini]") {
    Value v = parse_ini("[first]\n[second]\nk = v\n[last]\n");
    REQUIRE(keys_of(v) == std::vector<std::string>{"first", "second", "last"});
    REQUIRE(v.at("first").is_mapping());
    REQUIRE(v.at("first").size() == 0);
    REQUIRE(v.at("second").at("k").as_string() == "v");
    REQUIRE(v.at("last").is_mapping());

    REQUIRE(parse_ini("").is_mapping());
    REQUIRE(parse_ini("").size() == 0);
}

TEST_CASE("INI errors", "[parsers][ini][error]") {
    REQUIRE_THROWS_AS(parse_ini("[a]\nx = 1\nx = 2\n"), ParseError);
    REQUIRE_THROWS_AS(parse_ini("[a\n"), ParseError);
    REQUIRE_THROWS_AS(parse_ini("novalue\n"), ParseError);
    REQUIRE(parse_error_format([] { (void)parse_ini("[a]\nx = 1\nx = 2\n"); }) == "ini");
}

// ============================================================
// XML
// ============================================================

TEST_CASE("XML elements, attributes and repeats", "[parsers][xml]") {
    Value v = parse_xml(
        "<?xml version=\"1.0\"?>\n"
        "<user id=\"1\">\n"
        "  <!-- ignored -->\n"
        "  <name>Alice</name>\n"
        "  <tag>a</tag>\n"
        "  <email/>\n"
        "  <tag>b</tag>\n"
        "</user>\n");

    REQUIRE(keys_of(v) == std::vector<std::string>{"user"});
    const Value& user = v.at("user");
    REQUIRE(keys_of(user) == std::vector<std::string>{"@id", "name", "tag", "email"});
    REQUIRE(user.at("@id").as_string() == "1");
    REQUIRE(user.at("name").as_string() == "Alice");
    REQUIRE(user.at("tag").is_sequence());
    REQUIRE(user.at("tag").at(std::size_t{1}).as_string() == "b");
    REQUIRE(user.at("email").as_string().empty());
}

TEST_CASE("XML text beside attributes", "[parsers][xml]") {
    Value v = parse_xml("<price currency=\"EUR\"> 9.99 </price>");
    REQUIRE(v.at("price").at("@currency").as_string() == "EUR");
    REQUIRE(v.at("price").at("#text").as_string() == "9.99");

    REQUIRE(parse_xml("<a>  text  </a>").at("a").as_string() == "text");
}

TEST_CASE("XML errors", "[parsers][xml][error]") {
    REQUIRE_THROWS_AS(parse_xml("<a><b></a>"), ParseError);
    REQUIRE_THROWS_AS(parse_xml("<a>"), ParseError);
    REQUIRE_THROWS_AS(parse_xml(""), ParseError);
    REQUIRE(parse_error_format([] { (void)parse_xml("<a><b></a>"); }) == "xml");
}

// ============================================================
// Cross-format
// ============================================================

TEST_CASE("same document in different formats", "[parsers][diff]") {
    const Value from_json_text = parse(R"({"server": {"host": "localhost", "debug": true}})", InputFormat::Json);
    const Value from_yaml_text = parse("server:\n  host: localhost\n  debug: true\n", InputFormat::Yaml);
    const Value from_toml_text = parse("[server]\nhost = \"localhost\"\ndebug = true\n", InputFormat::Toml);

    REQUIRE(diff(from_json_text, from_yaml_text).empty());
    REQUIRE(diff(from_yaml_text, from_toml_text).empty());
}
