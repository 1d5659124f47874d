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

#include "arialens/cache.hpp"
#include <regex>
#include <set>
#include <thread>

using namespace arialens;
using namespace std::chrono_literals;

namespace {

// Manually advanced clock shared with the cache under test
struct FakeClock {
    Clock::time_point now = Clock::time_point{} + 1000s;

    ClockFn fn() {
        return [this] { return now; };
    }
};

} // namespace

TEST_CASE("Cache - create and get") {
    FakeClock clock;
    SnapshotCache cache(300s, clock.fn());

    std::string key = cache.create("https://example.com", json::array({"a"}));
    REQUIRE(std::regex_match(key, std::regex("nav_[0-9a-f]{8}")));
    REQUIRE(cache.size() == 1);

    auto entry = cache.get(key);
    REQUIRE(entry.has_value());
    REQUIRE(entry->key == key);
    REQUIRE(entry->source_url == "https://example.com");
    REQUIRE(*entry->snapshot == json::array({"a"}));
    REQUIRE(entry->ttl == 300s);
    REQUIRE(entry->created_at == clock.now);

    REQUIRE_FALSE(cache.get("nav_00000000").has_value());
}

TEST_CASE("Cache - keys are unique") {
    SnapshotCache cache;
    std::set<std::string> keys;
    for (int i = 0; i < 200; ++i)
        keys.insert(cache.create("", json::array()));
    REQUIRE(keys.size() == 200);
    REQUIRE(cache.size() == 200);
}

TEST_CASE("Cache - sliding expiration") {
    FakeClock clock;
    SnapshotCache cache(300s, clock.fn());
    std::string key = cache.create("u", json::object());

    SECTION("Entry lives until ttl passes without access") {
        clock.now += 300s;
        REQUIRE(cache.get(key).has_value());
        clock.now += 301s;
        REQUIRE_FALSE(cache.get(key).has_value());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Each get refreshes the entry") {
        for (int i = 0; i < 5; ++i) {
            clock.now += 200s;
            auto entry = cache.get(key);
            REQUIRE(entry.has_value());
            REQUIRE(entry->last_accessed_at == clock.now);
        }
    }

    SECTION("Custom ttl") {
        std::string short_key = cache.create("u", json::object(), 10s);
        clock.now += 11s;
        REQUIRE_FALSE(cache.get(short_key).has_value());
        REQUIRE(cache.get(key).has_value());
    }

    SECTION("Expired entries are swept by create") {
        clock.now += 301s;
        REQUIRE(cache.size() == 1);
        cache.create("u", json::object());
        REQUIRE(cache.size() == 1);
    }
}

TEST_CASE("Cache - remove and clear") {
    SnapshotCache cache;
    std::string a = cache.create("a", json::array());
    std::string b = cache.create("b", json::array());

    REQUIRE(cache.remove(a));
    REQUIRE_FALSE(cache.remove(a));
    REQUIRE_FALSE(cache.get(a).has_value());
    REQUIRE(cache.get(b).has_value());

    cache.clear();
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.get(b).has_value());
}

TEST_CASE("Cache - concurrent access") {
    SnapshotCache cache;
    std::vector<std::thread> workers;
    std::vector<std::vector<std::string>> keys(4);

    for (size_t t = 0; t < keys.size(); ++t) {
        workers.emplace_back([&cache, &keys, t] {
            for (int i = 0; i < 50; ++i) {
                std::string key = cache.create("t", json::array({i}));
                if (cache.get(key))
                    keys[t].push_back(key);
            }
        });
    }
    for (auto &worker : workers)
        worker.join();

    size_t found = 0;
    for (const auto &list : keys)
        found += list.size();
    REQUIRE(found == 200);
    REQUIRE(cache.size() == 200);
}
