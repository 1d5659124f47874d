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

#include <cxxopts.hpp>
#include <iostream>

#include "arialens/commands.hpp"
#include "arialens/log.hpp"
#include "arialens/version.hpp"

using namespace arialens;

void print_banner() {
    std::cout << "\n  arialens - ARIA Snapshot Navigator v" << VERSION_STRING << "\n" << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "arialens", "ARIA Snapshot Navigator - Parse, query and page through accessibility trees");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("verbose", "Log debug diagnostics to stderr");
    opts("parse", "Snapshot file to read ('-' for stdin)", cxxopts::value<std::string>());
    opts("render", "Print the parsed snapshot back as snapshot text");
    opts("q,query", "JMESPath expression applied to the snapshot", cxxopts::value<std::string>());
    opts("flatten", "Flatten the tree into a depth-first list before querying");
    opts("offset", "Index of the first item of the page",
         cxxopts::value<size_t>()->default_value("0"));
    opts("limit", "Maximum items per page", cxxopts::value<size_t>());
    opts("f,format", "Output format (json or yaml)",
         cxxopts::value<std::string>()->default_value("yaml"));
    opts("url", "Source URL recorded with the snapshot",
         cxxopts::value<std::string>()->default_value(""));
    opts("ttl", "Cache lifetime in seconds", cxxopts::value<unsigned int>()->default_value("300"));
    opts("request", "Run one JSON or YAML request file ('-' for stdin)",
         cxxopts::value<std::string>());
    opts("serve", "Answer JSON-lines requests from stdin");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  arialens --parse page.yml                 Print the parsed tree as YAML"
                      << std::endl;
            std::cout << "  arialens --parse page.yml -f json         Print the parsed tree as JSON"
                      << std::endl;
            std::cout << "  arialens --parse page.yml --render        Normalize snapshot text"
                      << std::endl;
            std::cout << "  arialens --parse page.yml --flatten -q \"[?role=='link']\""
                      << std::endl;
            std::cout << "  arialens --parse - --limit 20 --offset 40  Page through stdin"
                      << std::endl;
            std::cout << "  arialens --request req.yml -f json        Run a request file"
                      << std::endl;
            std::cout << "  arialens --serve                          JSON-lines requests on stdin"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "arialens v" << VERSION_STRING << std::endl;
            return 0;
        }

        NavigatorConfig config;
        config.verbose = result.count("verbose") > 0;
        config.default_ttl = std::chrono::seconds(result["ttl"].as<unsigned int>());
        if (config.verbose)
            Logger::instance().set_level(LogLevel::Debug);

        OutputFormat format = parse_output_format(result["format"].as<std::string>());
        SnapshotCache cache(config.default_ttl);
        SnapshotNavigator navigator(cache, config);

        if (result.count("serve"))
            return cmd_serve(navigator);

        if (result.count("request"))
            return cmd_request(navigator, result["request"].as<std::string>(), format);

        if (result.count("parse")) {
            std::string path = result["parse"].as<std::string>();

            if (result.count("render"))
                return cmd_render(path);

            bool navigate = result.count("query") || result.count("flatten") ||
                            result.count("limit") || result.count("offset");
            if (!navigate)
                return cmd_parse(path, format);

            NavigateRequest request;
            request.source_url = result["url"].as<std::string>();
            if (result.count("query"))
                request.query = result["query"].as<std::string>();
            request.flatten = result.count("flatten") > 0;
            request.offset = result["offset"].as<size_t>();
            if (result.count("limit"))
                request.limit = result["limit"].as<size_t>();
            request.output_format = format;
            return cmd_navigate(navigator, path, request);
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
