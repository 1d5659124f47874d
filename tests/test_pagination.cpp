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

#include "arialens/pagination.hpp"

using namespace arialens;

TEST_CASE("Pagination") {
    json items = json::array({0, 1, 2, 3, 4, 5, 6, 7, 8, 9});

    SECTION("First page") {
        Page page = paginate(items, 0, 4);
        REQUIRE(page.items == json::array({0, 1, 2, 3}));
        REQUIRE(page.total == 10);
        REQUIRE(page.offset == 0);
        REQUIRE(page.limit == 4);
        REQUIRE(page.has_more);
    }

    SECTION("Last partial page") {
        Page page = paginate(items, 8, 4);
        REQUIRE(page.items == json::array({8, 9}));
        REQUIRE_FALSE(page.has_more);
    }

    SECTION("Exact end") {
        Page page = paginate(items, 6, 4);
        REQUIRE(page.items.size() == 4);
        REQUIRE_FALSE(page.has_more);
    }

    SECTION("Offset past the end") {
        Page page = paginate(items, 10, 5);
        REQUIRE(page.items == json::array());
        REQUIRE(page.total == 10);
        REQUIRE_FALSE(page.has_more);

        REQUIRE(paginate(items, 50, 5).items.empty());
    }

    SECTION("Non-array result is one item") {
        Page page = paginate(json("only"), 0, 10);
        REQUIRE(page.items == json::array({"only"}));
        REQUIRE(page.total == 1);

        Page object_page = paginate(json::parse(R"({"a": 1})"), 0, 10);
        REQUIRE(object_page.total == 1);
        REQUIRE(object_page.items[0]["a"] == 1);
    }

    SECTION("Pages cover the whole result") {
        json seen = json::array();
        size_t offset = 0;
        while (true) {
            Page page = paginate(items, offset, 3);
            for (const auto &item : page.items)
                seen.push_back(item);
            if (!page.has_more)
                break;
            offset += 3;
        }
        REQUIRE(seen == items);
    }
}
