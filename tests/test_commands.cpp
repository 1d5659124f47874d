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

#include "arialens/commands.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace arialens;

namespace {

// Snapshot file under the temp directory, removed on scope exit
struct TempSnapshot {
    std::filesystem::path path;

    explicit TempSnapshot(const std::string &name, const std::string &content)
        : path(std::filesystem::temp_directory_path() / name) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }
    ~TempSnapshot() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

std::vector<json> read_responses(const std::string &output) {
    std::vector<json> responses;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line))
        responses.push_back(json::parse(line));
    return responses;
}

} // namespace

TEST_CASE("Commands - read_input") {
    REQUIRE_THROWS_AS(read_input("/nonexistent/arialens/snapshot.yaml"), Error);

    TempSnapshot file("arialens_read_input.yaml", "- button \"OK\"\n");
    REQUIRE(read_input(file.path.string()) == "- button \"OK\"\n");
}

TEST_CASE("Commands - parse and render") {
    TempSnapshot file("arialens_parse.yaml",
                      "- navigation:\n  - link \"Docs\" [ref=e7]\n  - text: v1.0\n");

    SECTION("Parse to JSON") {
        std::ostringstream out;
        REQUIRE(cmd_parse(file.path.string(), OutputFormat::Json, out) == 0);
        json data = json::parse(out.str());
        REQUIRE(data[0]["role"] == "navigation");
        REQUIRE(data[0]["children"][0]["ref"] == "e7");
        REQUIRE(data[0]["children"][1] == "v1.0");
    }

    SECTION("Parse to YAML") {
        std::ostringstream out;
        REQUIRE(cmd_parse(file.path.string(), OutputFormat::Yaml, out) == 0);
        REQUIRE(out.str().find("- role: navigation") == 0);
    }

    SECTION("Render back to snapshot text") {
        std::ostringstream out;
        REQUIRE(cmd_render(file.path.string(), out) == 0);
        REQUIRE(out.str() == "- navigation:\n  - link \"Docs\" [ref=e7]\n  - text: v1.0\n");
    }

    SECTION("Parse errors fail the command") {
        TempSnapshot bad("arialens_parse_bad.yaml", "- heading [level=high]\n");
        std::ostringstream out;
        REQUIRE(cmd_render(bad.path.string(), out) == 1);
        REQUIRE(out.str().empty());
    }
}

TEST_CASE("Commands - navigate") {
    TempSnapshot file("arialens_navigate.yaml", "- list:\n  - listitem: One\n  - listitem: Two\n");
    SnapshotCache cache;
    SnapshotNavigator navigator(cache);

    NavigateRequest request;
    request.source_url = "file://list";
    request.query = "[0].children[].role";
    request.output_format = OutputFormat::Json;

    std::ostringstream out;
    REQUIRE(cmd_navigate(navigator, file.path.string(), request, out) == 0);
    json response = json::parse(out.str());
    REQUIRE(response["success"] == true);
    REQUIRE(response["snapshot"] == json::array({"listitem", "listitem"}));

    request.query = "[0].children[";
    std::ostringstream failed;
    REQUIRE(cmd_navigate(navigator, file.path.string(), request, failed) == 1);
    REQUIRE(json::parse(failed.str())["success"] == false);
}

TEST_CASE("Commands - request file") {
    SnapshotCache cache;
    SnapshotNavigator navigator(cache);

    SECTION("YAML request") {
        const char *request = "url: https://example.com/menu\n"
                              "flatten: true\n"
                              "query: \"[?role == 'menuitem'].name.value\"\n"
                              "output_format: json\n"
                              "snapshot: |\n"
                              "  - menu:\n"
                              "    - menuitem \"Open\"\n"
                              "    - menuitem \"Save\"\n";
        TempSnapshot file("arialens_request.yaml", request);
        std::ostringstream out;
        REQUIRE(cmd_request(navigator, file.path.string(), OutputFormat::Json, out) == 0);
        json response = json::parse(out.str());
        REQUIRE(response["url"] == "https://example.com/menu");
        REQUIRE(response["snapshot"] == json::array({"Open", "Save"}));
        REQUIRE(cache.size() == 1);
    }

    SECTION("JSON request that fails") {
        TempSnapshot file("arialens_request.json", R"({"action": "delete"})");
        std::ostringstream out;
        REQUIRE(cmd_request(navigator, file.path.string(), OutputFormat::Json, out) == 1);
        REQUIRE(json::parse(out.str())["success"] == false);
    }
}

TEST_CASE("Commands - serve") {
    SnapshotCache cache;
    SnapshotNavigator navigator(cache);

    json first = json::object();
    first["url"] = "https://example.com/form";
    first["snapshot"] = "- form:\n  - textbox \"Email\"\n  - button \"Send\" [disabled]\n";
    first["flatten"] = true;
    first["output_format"] = "json";

    std::istringstream in(first.dump() + "\n\n   \n{not json}\n");
    std::ostringstream out;
    REQUIRE(cmd_serve(navigator, in, out) == 0);

    std::vector<json> responses = read_responses(out.str());
    REQUIRE(responses.size() == 2);
    REQUIRE(responses[0]["success"] == true);
    REQUIRE(responses[0]["total_items"] == 3);
    REQUIRE(responses[1]["success"] == false);
    REQUIRE(responses[1]["error"].get<std::string>().find("Invalid JSON request") == 0);

    std::string key = responses[0]["cache_key"];
    json again = json::object();
    again["cache_key"] = key;
    again["flatten"] = true;
    again["query"] = "[?disabled].name.value";
    again["output_format"] = "json";
    json remove = json::object();
    remove["action"] = "delete";
    remove["cache_key"] = key;

    std::istringstream session(again.dump() + "\n" + remove.dump() + "\n" + again.dump() + "\n");
    std::ostringstream replies;
    REQUIRE(cmd_serve(navigator, session, replies) == 0);

    responses = read_responses(replies.str());
    REQUIRE(responses.size() == 3);
    REQUIRE(responses[0]["url"] == "https://example.com/form");
    REQUIRE(responses[0]["snapshot"] == json::array({"Send"}));
    REQUIRE(responses[1]["deleted"] == true);
    REQUIRE(responses[2]["success"] == false);
    REQUIRE(responses[2]["error"] == "Cache key not found or expired: " + key);
}
