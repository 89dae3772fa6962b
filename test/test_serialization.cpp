// test_serialization.cpp - Tests for JSON reading and writing

#include <catch2/catch_all.hpp>
#include <diffx/builders.h>
#include <diffx/error.h>
#include <diffx/serialization.h>

#include <cmath>
#include <limits>
#include <string>

using namespace diffx;

TEST_CASE("from_json scalars", "[serialization][json]") {
    REQUIRE(from_json("null").is_null());
    REQUIRE(from_json("true").as_bool());
    REQUIRE_FALSE(from_json("false").as_bool(true));
    REQUIRE(from_json("42").as_number() == 42);
    REQUIRE(from_json("-0.5e2").as_number() == -50);
    REQUIRE(from_json("  \"hi\"  ").as_string() == "hi");
}

TEST_CASE("from_json containers keep key order", "[serialization][json]") {
    Value v = from_json(R"({"b": 1, "a": [true, null, "x"], "c": {}})");
    REQUIRE(v.is_mapping());

    const auto& m = v.as_map();
    REQUIRE(m.entry(0).key == "b");
    REQUIRE(m.entry(1).key == "a");
    REQUIRE(m.entry(2).key == "c");
    REQUIRE(v.at("a").size() == 3);
    REQUIRE(v.at("a").at(std::size_t{1}).is_null());
    REQUIRE(v.at("c").is_mapping());
}

TEST_CASE("from_json string escapes", "[serialization][json]") {
    REQUIRE(from_json(R"("a\"b\\c\/d\n")").as_string() == "a\"b\\c/d\n");
    REQUIRE(from_json(R"("\u00e9")").as_string() == "\xC3\xA9");
    // U+1F600 as a surrogate pair
    REQUIRE(from_json(R"("\ud83d\ude00")").as_string() == "\xF0\x9F\x98\x80");
}

TEST_CASE("from_json rejects malformed input", "[serialization][json][error]") {
    const char* bad[] = {
        "",
        "{",
        "[1, 2",
        "{\"a\" 1}",
        "{\"a\": 1,}",
        "01",
        "1.",
        "tru",
        "\"unterminated",
        "\"\\ud83d\"",
        "{} extra",
        "[1] [2]",
        "'single'",
    };
    for (const char* text : bad) {
        INFO("input: " << text);
        REQUIRE_THROWS_AS(from_json(text), ParseError);
    }

    try {
        (void)from_json("[1, 2");
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        REQUIRE(e.format() == "json");
        REQUIRE(std::string(e.what()).starts_with("json parse error: "));
    }
}

TEST_CASE("to_json output", "[serialization][json]") {
    Value v = MapBuilder()
        .set("name", "Alice")
        .set("age", 30)
        .set("tags", VectorBuilder().push_back("a").push_back("b").finish())
        .finish();

    SECTION("compact") {
        REQUIRE(to_json(v, true) == R"({"name":"Alice","age":30,"tags":["a","b"]})");
    }

    SECTION("pretty uses two-space indentation") {
        const std::string expected =
            "{\n"
            "  \"name\": \"Alice\",\n"
            "  \"age\": 30,\n"
            "  \"tags\": [\n"
            "    \"a\",\n"
            "    \"b\"\n"
            "  ]\n"
            "}";
        REQUIRE(to_json(v) == expected);
    }

    SECTION("empty containers") {
        REQUIRE(to_json(Value{ValueVector{}}) == "[]");
        REQUIRE(to_json(Value{ValueMap{}}) == "{}");
    }

    SECTION("non-finite numbers become null") {
        REQUIRE(to_json(Value{std::numeric_limits<double>::quiet_NaN()}) == "null");
        REQUIRE(to_json(Value{std::numeric_limits<double>::infinity()}) == "null");
    }

    SECTION("control characters are escaped") {
        REQUIRE(to_json(Value{"a\tb\x01"}) == "\"a\\tb\\u0001\"");
    }

    SECTION("written text reads back equal") {
        REQUIRE(from_json(to_json(v)) == v);
        REQUIRE(from_json(to_json(v, true)) == v);
    }
}

TEST_CASE("number_to_string", "[serialization][number]") {
    REQUIRE(number_to_string(30) == "30");
    REQUIRE(number_to_string(-2) == "-2");
    REQUIRE(number_to_string(-0.0) == "0");
    REQUIRE(number_to_string(1.5) == "1.5");
    REQUIRE(number_to_string(0.1) == "0.1");
    REQUIRE(number_to_string(1.001) == "1.001");
    REQUIRE(std::stod(number_to_string(0.1 + 0.2)) == 0.1 + 0.2);
    REQUIRE(number_to_string(std::numeric_limits<double>::infinity()) == "inf");
    REQUIRE(number_to_string(-std::numeric_limits<double>::infinity()) == "-inf");
    REQUIRE(number_to_string(std::numeric_limits<double>::quiet_NaN()) == "nan");
}
