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

#include "arialens/commands.hpp"
#include "arialens/log.hpp"
#include "arialens/parser.hpp"
#include "arialens/serializer.hpp"
#include <fstream>
#include <sstream>

namespace arialens {

namespace {

void report_parse_errors(const ParseResult &result) {
    for (const auto &error : result.errors)
        std::cerr << "Error: " << error.to_string() << std::endl;
}

} // namespace

// Read a whole file, or stdin for "-"
std::string read_input(const std::string &path) {
    std::ostringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw Error("Cannot open file: " + path);
    buffer << file.rdbuf();
    if (file.bad())
        throw Error("Failed to read file: " + path);
    return buffer.str();
}

std::string format_response(const json &response, OutputFormat format) {
    if (format == OutputFormat::Json)
        return format_output(response, OutputFormat::Json) + "\n";
    return format_output(response, OutputFormat::Yaml);
}

int cmd_parse(const std::string &path, OutputFormat format, std::ostream &out) {
    ParseResult result = parse_snapshot(read_input(path));
    report_parse_errors(result);
    if (!result.tree && !result.errors.empty())
        return 1;

    json data = result.tree ? to_json(*result.tree) : json::array();
    std::string text = format_output(data, format);
    out << text;
    if (format == OutputFormat::Json)
        out << '\n';
    log_info("Parsed " + std::to_string(data.size()) + " root item(s) from " + path);
    return result.errors.empty() ? 0 : 1;
}

int cmd_render(const std::string &path, std::ostream &out) {
    ParseResult result = parse_snapshot(read_input(path));
    report_parse_errors(result);
    if (!result.errors.empty())
        return 1;
    if (result.tree)
        out << render_snapshot(*result.tree);
    return 0;
}

int cmd_navigate(SnapshotNavigator &navigator, const std::string &path, NavigateRequest request,
                 std::ostream &out) {
    if (!path.empty())
        request.snapshot_text = read_input(path);

    json response = navigator.navigate(request);
    out << format_response(response, request.output_format);
    if (!response.value("success", false)) {
        std::cerr << "Error: " << response.value("error", std::string("navigation failed"))
                  << std::endl;
        return 1;
    }
    return 0;
}

// A single request object read from a JSON or YAML file
int cmd_request(SnapshotNavigator &navigator, const std::string &path, OutputFormat format,
                std::ostream &out) {
    std::string text = read_input(path);
    json request = json::parse(text, nullptr, false);
    if (request.is_discarded())
        request = load_yaml(text);

    json response = navigator.handle_request(request);
    out << format_response(response, format);
    if (!response.value("success", false)) {
        std::cerr << "Error: " << response.value("error", std::string("request failed"))
                  << std::endl;
        return 1;
    }
    return 0;
}

// One JSON request per line in, one JSON response per line out
int cmd_serve(SnapshotNavigator &navigator, std::istream &in, std::ostream &out) {
    std::string line;
    size_t handled = 0;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        json response;
        try {
            response = navigator.handle_request(json::parse(line));
        } catch (const json::parse_error &e) {
            log_warn(std::string("Rejected request: ") + e.what());
            response = json::object();
            response["success"] = false;
            response["error"] = std::string("Invalid JSON request: ") + e.what();
        }
        out << response.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
        ++handled;
    }
    log_info("Served " + std::to_string(handled) + " request(s)");
    return 0;
}

} // namespace arialens
