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

#include "arialens/flatten.hpp"
#include "arialens/parser.hpp"
#include "arialens/serializer.hpp"

using namespace arialens;

TEST_CASE("Flatten") {
    SECTION("Two levels") {
        json tree = json::parse(R"([
            {"role": "document", "children": [
                {"role": "button", "name": {"value": "Submit"}},
                {"role": "link", "name": {"value": "Home"}}
            ]}
        ])");
        json flat = flatten(tree);

        REQUIRE(flat.size() == 3);
        REQUIRE(flat[0]["role"] == "document");
        REQUIRE(flat[0]["_depth"] == 0);
        REQUIRE(flat[0]["_parent_role"].is_null());
        REQUIRE(flat[0]["_index"] == 0);
        REQUIRE_FALSE(flat[0].contains("children"));

        REQUIRE(flat[1]["role"] == "button");
        REQUIRE(flat[1]["_depth"] == 1);
        REQUIRE(flat[1]["_parent_role"] == "document");
        REQUIRE(flat[1]["_index"] == 1);
        REQUIRE(flat[2]["role"] == "link");
        REQUIRE(flat[2]["_index"] == 2);
    }

    SECTION("Depth-first order with siblings") {
        const char *text = "- document:\n"
                           "  - banner:\n"
                           "    - heading \"Welcome\"\n"
                           "    - navigation\n"
                           "  - main:\n"
                           "    - heading \"Content\"\n"
                           "    - paragraph\n";
        json flat = flatten(to_json(*parse_snapshot(text).tree));

        std::vector<std::string> roles;
        for (const auto &entry : flat)
            roles.push_back(entry["role"].get<std::string>());
        REQUIRE(roles == std::vector<std::string>{"document", "banner", "heading", "navigation",
                                                  "main", "heading", "paragraph"});
        REQUIRE(flat[3]["_parent_role"] == "banner");
        REQUIRE(flat[5]["_parent_role"] == "main");
        REQUIRE(flat[6]["_depth"] == 2);
        for (size_t i = 0; i < flat.size(); ++i)
            REQUIRE(flat[i]["_index"] == i);
    }

    SECTION("Text leaves") {
        json tree = json::parse(R"([{"role": "paragraph", "children": ["Hello", "World"]}])");
        json flat = flatten(tree);

        REQUIRE(flat.size() == 3);
        REQUIRE(flat[1] == json::parse(
                               R"({"text": "Hello", "_depth": 1, "_parent_role": "paragraph",
                                   "_index": 1})"));
        REQUIRE(flat[2]["text"] == "World");
    }

    SECTION("Single object input") {
        json flat = flatten(json::parse(R"({"role": "main", "children": []})"));
        REQUIRE(flat.size() == 1);
        REQUIRE(flat[0]["_depth"] == 0);
    }

    SECTION("Scalars yield an empty list") {
        REQUIRE(flatten(json(42)) == json::array());
        REQUIRE(flatten(json("text")) == json::array());
        REQUIRE(flatten(json(nullptr)) == json::array());
        REQUIRE(flatten(json::array()) == json::array());
    }
}
