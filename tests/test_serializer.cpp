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

#include "arialens/parser.hpp"
#include "arialens/serializer.hpp"

using namespace arialens;

TEST_CASE("Serializer - to_json") {
    SECTION("Field order and omitted fields") {
        auto result = parse_snapshot("- heading \"Title\" [level=2] [ref=e5]");
        json data = to_json(*result.tree);

        REQUIRE(data.is_array());
        REQUIRE(data.size() == 1);
        const json &heading = data[0];

        std::vector<std::string> keys;
        for (auto it = heading.begin(); it != heading.end(); ++it)
            keys.push_back(it.key());
        REQUIRE(keys == std::vector<std::string>{"role", "name", "ref", "level", "children"});

        REQUIRE(heading["name"]["value"] == "Title");
        REQUIRE(heading["name"]["is_regex"] == false);
        REQUIRE(heading["level"] == 2);
        REQUIRE(heading["children"] == json::array());
        REQUIRE_FALSE(heading.contains("props"));
        REQUIRE_FALSE(heading.contains("checked"));
    }

    SECTION("Tri-state and boolean values") {
        auto result = parse_snapshot("- checkbox [checked=mixed] [disabled=false] [pressed]");
        json node = to_json(*result.tree)[0];
        REQUIRE(node["checked"] == "mixed");
        REQUIRE(node["pressed"] == true);
        REQUIRE(node["disabled"] == false);
    }

    SECTION("Props and text children") {
        const char *text = "- link \"Docs\" [cursor=pointer]:\n"
                           "  - /url: https://example.com/docs\n"
                           "  - text: Read the docs\n";
        json node = to_json(*parse_snapshot(text).tree)[0];
        REQUIRE(node["props"]["cursor"] == "pointer");
        REQUIRE(node["props"]["url"] == "https://example.com/docs");
        REQUIRE(node["children"] == json::array({"Read the docs"}));
    }

    SECTION("Props keep source order") {
        const char *text = "- link [zeta=1] [cursor=pointer] [alpha=2]:\n"
                           "  - /url: /x\n";
        json props = to_json(*parse_snapshot(text).tree)[0]["props"];

        std::vector<std::string> keys;
        for (auto it = props.begin(); it != props.end(); ++it)
            keys.push_back(it.key());
        REQUIRE(keys == std::vector<std::string>{"zeta", "cursor", "alpha", "url"});

        Tree rebuilt = tree_from_json(json::array({to_json(*parse_snapshot(text).tree)[0]}));
        REQUIRE(rebuilt[0].node().props.begin()->first == "zeta");
    }
}

TEST_CASE("Serializer - tree_from_json") {
    SECTION("Inverse of to_json") {
        const char *text = "- main [ref=e1]:\n"
                           "  - heading \"Welcome\" [level=1]\n"
                           "  - checkbox /Accept.*/ [checked=mixed] [selected=false]\n"
                           "  - text: plain words\n";
        Tree tree = *parse_snapshot(text).tree;
        REQUIRE((tree_from_json(to_json(tree)) == tree));
    }

    SECTION("Shape violations throw") {
        REQUIRE_THROWS_AS(tree_from_json(json::object()), Error);
        REQUIRE_THROWS_AS(tree_from_json(json::array({json::object()})), Error);
        REQUIRE_THROWS_AS(node_from_json(json::parse(R"({"role": "x", "checked": "maybe"})")),
                          Error);
        REQUIRE_THROWS_AS(node_from_json(json::parse(R"({"role": "x", "level": "2"})")), Error);
        REQUIRE_THROWS_AS(node_from_json(json::parse(R"({"role": "x", "children": {}})")), Error);
    }
}

TEST_CASE("Serializer - render_snapshot") {
    SECTION("Renders the snapshot grammar") {
        Tree tree = *parse_snapshot("- link \"Home\" [ref=e2]:\n  - /url: /\n").tree;
        REQUIRE(render_snapshot(tree) == "- link \"Home\" [ref=e2]:\n  - /url: /\n");
    }

    SECTION("Parsing the rendered text gives the same tree") {
        const char *text =
            "- generic [ref=e2]:\n"
            "  - navigation \"Main\" [ref=e3]:\n"
            "    - link /Home|About/ [active] [cursor=pointer]:\n"
            "      - /url: /https:.*/\n"
            "    - button \"Say \\\"hi\\\"\" [pressed=mixed] [disabled=false]\n"
            "  - heading \"Title\" [level=2] [expanded]\n"
            "  - checkbox [checked=false] [data-x=\"a b\"]\n"
            "  - paragraph:\n"
            "    - text: \"  spaced  \"\n"
            "    - text: Some text: with colon\n"
            "- text: root text\n";
        auto parsed = parse_snapshot(text);
        REQUIRE(parsed.errors.empty());

        Tree tree = *parsed.tree;
        auto reparsed = parse_snapshot(render_snapshot(tree));
        REQUIRE(reparsed.errors.empty());
        REQUIRE((*reparsed.tree == tree));
    }

    SECTION("Reserved prop names survive as property lines") {
        TemplateNode node;
        node.role = "widget";
        node.props["level"] = "high";
        node.props["odd key"] = "v";
        Tree tree{Child(node)};

        auto reparsed = parse_snapshot(render_snapshot(tree));
        REQUIRE(reparsed.errors.empty());
        REQUIRE((*reparsed.tree == tree));
    }
}
