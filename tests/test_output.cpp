// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <catch2/catch.hpp>

#include "arialens/output.hpp"
#include "arialens/parser.hpp"
#include "arialens/serializer.hpp"

using namespace arialens;

TEST_CASE("Output - format selection") {
    REQUIRE(parse_output_format("json") == OutputFormat::Json);
    REQUIRE(parse_output_format("JSON") == OutputFormat::Json);
    REQUIRE(parse_output_format("yaml") == OutputFormat::Yaml);
    REQUIRE(parse_output_format("xml") == OutputFormat::Yaml);
    REQUIRE(parse_output_format("") == OutputFormat::Yaml);
    REQUIRE(std::string(output_format_name(OutputFormat::Json)) == "json");
}

TEST_CASE("Output - JSON") {
    json data = json::parse(R"({"role": "button", "name": {"value": "Café"}})");
    std::string text = format_output(data, OutputFormat::Json);

    REQUIRE(text.find("\n  \"role\": \"button\"") != std::string::npos);
    REQUIRE(text.find("Café") != std::string::npos);
    REQUIRE(text.find("role") < text.find("name"));
    REQUIRE(json::parse(text) == data);
}

TEST_CASE("Output - YAML") {
    SECTION("Block style with key order") {
        json data = json::parse(R"([{"role": "link", "name": {"value": "Home", "is_regex": false},
                                     "children": []}])");
        std::string text = format_output(data, OutputFormat::Yaml);

        REQUIRE(text.find("- role: link") == 0);
        REQUIRE(text.find("role") < text.find("name"));
        REQUIRE(text.find("is_regex: false") != std::string::npos);
        REQUIRE(text.find("children: []") != std::string::npos);
        REQUIRE(text.back() == '\n');
    }

    SECTION("Non-ASCII text is written as is") {
        std::string text = format_output(json::parse(R"({"name": "日本語"})"), OutputFormat::Yaml);
        REQUIRE(text.find("日本語") != std::string::npos);
    }

    SECTION("Ambiguous strings are quoted") {
        json data = json::parse(R"({"a": "true", "b": "123", "c": "null", "d": "", "e": "1.5",
                                    "f": "plain", "g": "no"})");
        std::string text = format_output(data, OutputFormat::Yaml);
        REQUIRE(text.find("a: \"true\"") != std::string::npos);
        REQUIRE(text.find("b: \"123\"") != std::string::npos);
        REQUIRE(text.find("c: \"null\"") != std::string::npos);
        REQUIRE(text.find("d: \"\"") != std::string::npos);
        REQUIRE(text.find("f: plain") != std::string::npos);
        REQUIRE(load_yaml(text) == data);
    }

    SECTION("Reloads to equal data") {
        json data = json::parse(R"({
            "success": true, "count": 3, "ratio": 0.25, "missing": null,
            "items": [{"role": "heading", "level": 2}, "text leaf", "yes", "-7"],
            "empty": {}, "multi": "line one\nline two\n", "colon": "a: b", "hash": "# not a comment"
        })");
        REQUIRE(load_yaml(format_output(data, OutputFormat::Yaml)) == data);
    }

    SECTION("Serialized snapshot survives the YAML path") {
        const char *snapshot = "- main [ref=e1]:\n"
                               "  - heading \"Title\" [level=1]\n"
                               "  - checkbox \"Opt in\" [checked=mixed]\n"
                               "  - link \"Docs\":\n"
                               "    - /url: https://example.com\n"
                               "  - text: \"true\"\n";
        Tree tree = *parse_snapshot(snapshot).tree;
        std::string yaml = format_output(to_json(tree), OutputFormat::Yaml);
        REQUIRE((tree_from_json(load_yaml(yaml)) == tree));
    }
}

TEST_CASE("Output - load_yaml") {
    REQUIRE(load_yaml("a: 1\nb: [x, 'y']\n") == json::parse(R"({"a": 1, "b": ["x", "y"]})"));
    REQUIRE(load_yaml("").is_null());
    REQUIRE(load_yaml("'007'") == "007");
    REQUIRE(load_yaml("007") == 7);
    REQUIRE_THROWS_AS(load_yaml("a: [1, 2"), OutputError);
    REQUIRE_THROWS_AS(load_yaml("a: b: c"), OutputError);
}
