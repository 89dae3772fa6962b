// test_formatter.cpp - Tests for json / yaml / diffx rendering

#include <catch2/catch_all.hpp>
#include <diffx/error.h>
#include <diffx/formatter.h>
#include <diffx/serialization.h>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

using namespace diffx;

namespace {

std::vector<DiffRecord> sample_records() {
    return {
        DiffRecord::added("email", Value{"bob@test.com"}),
        DiffRecord::removed("items[2]", Value{3}),
        DiffRecord::modified("age", Value{30}, Value{31}),
        DiffRecord::type_changed("flag", Value{"true"}, Value{true}),
    };
}

} // namespace

TEST_CASE("format_output json", "[formatter][json]") {
    SECTION("empty input is exactly []") {
        REQUIRE(format_output({}, OutputFormat::Json) == "[]");
        REQUIRE(format_output({}, "json") == "[]");
    }

    SECTION("field names per record type") {
        Value parsed = from_json(format_output(sample_records(), "json"));
        REQUIRE(parsed.size() == 4);

        Value added = parsed.at(std::size_t{0});
        REQUIRE(added.at("diffType").as_string() == "Added");
        REQUIRE(added.at("path").as_string() == "email");
        REQUIRE(added.at("newValue").as_string() == "bob@test.com");
        REQUIRE_FALSE(added.contains("oldValue"));
        REQUIRE_FALSE(added.contains("value"));

        Value removed = parsed.at(std::size_t{1});
        REQUIRE(removed.at("diffType").as_string() == "Removed");
        REQUIRE(removed.at("value").as_number() == 3);
        REQUIRE_FALSE(removed.contains("oldValue"));
        REQUIRE_FALSE(removed.contains("newValue"));

        Value modified = parsed.at(std::size_t{2});
        REQUIRE(modified.at("diffType").as_string() == "Modified");
        REQUIRE(modified.at("oldValue").as_number() == 30);
        REQUIRE(modified.at("newValue").as_number() == 31);

        Value changed = parsed.at(std::size_t{3});
        REQUIRE(changed.at("diffType").as_string() == "TypeChanged");
        REQUIRE(changed.at("oldValue").as_string() == "true");
        REQUIRE(changed.at("newValue").as_bool());
    }

    SECTION("diffType comes first") {
        const std::string text = format_output({DiffRecord::modified("a", Value{1}, Value{2})}, "json");
        REQUIRE(text.find("\"diffType\"") < text.find("\"path\""));
        REQUIRE(text.find("\"path\"") < text.find("\"oldValue\""));
    }
}

TEST_CASE("records_from_json round trip", "[formatter][json][roundtrip]") {
    auto records = sample_records();
    records.push_back(DiffRecord::modified("", Value::map({{"a", Value{1}}}), Value::map({{"a", Value{2}}})));
    records.push_back(DiffRecord::added("users[id=1].tags", Value::vector({Value{"x"}, Value{}})));

    auto back = records_from_json(format_output(records, OutputFormat::Json));
    REQUIRE(back.size() == records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        REQUIRE(back[i].type == records[i].type);
        REQUIRE(back[i].path == records[i].path);
    }
    REQUIRE(back == records);

    REQUIRE(records_from_json("[]").empty());
}

TEST_CASE("records_from_json validation", "[formatter][json][error]") {
    SECTION("malformed json") {
        REQUIRE_THROWS_AS(records_from_json("[{"), ParseError);
    }

    SECTION("not an array") {
        REQUIRE_THROWS_AS(records_from_json(R"({"diffType": "Added"})"), ParseError);
    }

    SECTION("missing fields") {
        REQUIRE_THROWS_WITH(records_from_json(R"([{"diffType": "Added", "path": "a"}])"),
                            Catch::Matchers::ContainsSubstring("Added result must have newValue"));
        REQUIRE_THROWS_WITH(records_from_json(R"([{"diffType": "Removed", "path": "a", "oldValue": 1}])"),
                            Catch::Matchers::ContainsSubstring("Removed result must have value"));
        REQUIRE_THROWS_WITH(records_from_json(R"([{"diffType": "Modified", "path": "a", "newValue": 1}])"),
                            Catch::Matchers::ContainsSubstring("Modified result must have oldValue"));
        REQUIRE_THROWS_WITH(records_from_json(R"([{"path": "a"}])"),
                            Catch::Matchers::ContainsSubstring("must have diffType"));
        REQUIRE_THROWS_WITH(records_from_json(R"([{"diffType": "Added", "newValue": 1}])"),
                            Catch::Matchers::ContainsSubstring("must have path"));
    }

    SECTION("unknown diffType") {
        REQUIRE_THROWS_WITH(records_from_json(R"([{"diffType": "Moved", "path": "a"}])"),
                            Catch::Matchers::ContainsSubstring("unknown diffType"));
    }

    SECTION("errors are reported as json parse errors") {
        try {
            (void)records_from_json(R"([{"diffType": "Added", "path": "a"}])");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.format() == "json");
        }
    }
}

TEST_CASE("format_output diffx", "[formatter][diffx]") {
    const std::string expected =
        "+ email: \"bob@test.com\"\n"
        "- items[2]: 3\n"
        "~ age: 30 -> 31\n"
        "! flag: \"true\" -> true\n";
    REQUIRE(format_output(sample_records(), "diffx") == expected);

    SECTION("root path and containers") {
        const auto text = format_output({DiffRecord::modified("", Value::vector({Value{1}}), Value::vector({}))},
                                        OutputFormat::Diffx);
        REQUIRE(text == "~ (root): [1] -> []\n");
    }

    SECTION("empty input is empty text") {
        REQUIRE(format_output({}, "diffx").empty());
    }
}

TEST_CASE("format_output yaml", "[formatter][yaml]") {
    SECTION("empty input") {
        REQUIRE(format_output({}, "yaml") == "[]");
    }

    SECTION("same content as json") {
        const std::string text = format_output(sample_records(), OutputFormat::Yaml);
        YAML::Node doc = YAML::Load(text);
        REQUIRE(doc.IsSequence());
        REQUIRE(doc.size() == 4);
        REQUIRE(doc[0]["diffType"].as<std::string>() == "Added");
        REQUIRE(doc[0]["newValue"].as<std::string>() == "bob@test.com");
        REQUIRE(doc[1]["value"].as<int>() == 3);
        REQUIRE(doc[2]["oldValue"].as<int>() == 30);
        REQUIRE(doc[3]["newValue"].as<bool>());
        // Strings that look like scalars stay quoted
        REQUIRE(doc[3]["oldValue"].Tag() == "!");
    }
}

TEST_CASE("format_output rejects unknown formats", "[formatter][error]") {
    REQUIRE_THROWS_AS(format_output(sample_records(), "invalid"), UnsupportedFormat);
    REQUIRE_THROWS_AS(format_output({}, "xml"), UnsupportedFormat);
}

TEST_CASE("render honours quiet, brief and output format", "[formatter][render]") {
    const auto records = sample_records();

    SECTION("default is diffx") {
        REQUIRE(render(records, DiffOptions{}) == format_output(records, "diffx"));
    }

    SECTION("output format from options") {
        DiffOptionsOverrides o;
        o.output_format = "json";
        REQUIRE(render(records, DiffOptions::from(o)) == format_output(records, "json"));
    }

    SECTION("unsupported output format fails at render time") {
        DiffOptionsOverrides o;
        o.output_format = "html";
        const auto opts = DiffOptions::from(o);
        REQUIRE_THROWS_AS(render(records, opts), UnsupportedFormat);
    }

    SECTION("quiet mode renders nothing") {
        DiffOptionsOverrides o;
        o.quiet_mode = true;
        o.brief_mode = true;
        REQUIRE(render(records, DiffOptions::from(o)).empty());
    }

    SECTION("brief mode") {
        DiffOptionsOverrides o;
        o.brief_mode = true;
        const auto opts = DiffOptions::from(o);
        REQUIRE(render(records, opts) == "Objects differ\n");
        REQUIRE(render({}, opts).empty());
    }
}

TEST_CASE("exit_status", "[formatter][exit]") {
    REQUIRE(exit_status({}) == ExitStatus::NoDifferences);
    REQUIRE(exit_status(sample_records()) == ExitStatus::DifferencesFound);
    REQUIRE(static_cast<int>(ExitStatus::NoDifferences) == 0);
    REQUIRE(static_cast<int>(ExitStatus::DifferencesFound) == 1);
    REQUIRE(static_cast<int>(ExitStatus::Error) == 2);
}
