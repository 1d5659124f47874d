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

#include "arialens/navigator.hpp"
#include "arialens/flatten.hpp"
#include "arialens/log.hpp"
#include "arialens/pagination.hpp"
#include "arialens/parser.hpp"
#include "arialens/query.hpp"
#include "arialens/serializer.hpp"

namespace arialens {

namespace {

std::optional<std::string> optional_string(const json &j, const char *field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw Error(std::string("Field '") + field + "' must be a string");
    return it->get<std::string>();
}

std::optional<size_t> optional_count(const json &j, const char *field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (!it->is_number_integer() || it->get<int64_t>() < 0)
        throw Error(std::string("Field '") + field + "' must be a non-negative integer");
    return it->get<size_t>();
}

} // namespace

NavigateRequest NavigateRequest::from_json(const json &j) {
    if (!j.is_object())
        throw Error(std::string("Request must be an object, got ") + j.type_name());

    NavigateRequest request;
    request.source_url = optional_string(j, "url").value_or("");
    request.snapshot_text = optional_string(j, "snapshot");
    request.cache_key = optional_string(j, "cache_key");
    request.query = optional_string(j, "query");

    if (auto flatten = j.find("flatten"); flatten != j.end() && !flatten->is_null()) {
        if (!flatten->is_boolean())
            throw Error("Field 'flatten' must be a boolean");
        request.flatten = flatten->get<bool>();
    }
    request.offset = optional_count(j, "offset").value_or(0);
    request.limit = optional_count(j, "limit");
    if (auto format = optional_string(j, "output_format"))
        request.output_format = parse_output_format(*format);
    if (auto ttl = optional_count(j, "ttl"))
        request.ttl = std::chrono::seconds(*ttl);
    return request;
}

SnapshotNavigator::SnapshotNavigator(SnapshotCache &cache, NavigatorConfig config)
    : cache_(cache), config_(config) {}

json SnapshotNavigator::failure(const NavigateRequest &request, const std::string &error) const {
    json response = json::object();
    response["success"] = false;
    response["url"] = request.source_url;
    response["error"] = error;
    return response;
}

json SnapshotNavigator::navigate(const NavigateRequest &request) {
    std::string key;
    std::string url = request.source_url;
    std::shared_ptr<const json> data;

    if (request.cache_key) {
        auto entry = cache_.get(*request.cache_key);
        if (!entry) {
            log_info("Cache miss for " + *request.cache_key);
            return failure(request, "Cache key not found or expired: " + *request.cache_key);
        }
        key = entry->key;
        data = entry->snapshot;
        if (url.empty())
            url = entry->source_url;
    } else if (request.snapshot_text) {
        ParseResult parsed = parse_snapshot(*request.snapshot_text);
        if (!parsed.errors.empty()) {
            std::string joined;
            for (const auto &error : parsed.errors) {
                if (!joined.empty())
                    joined += "; ";
                joined += error.to_string();
            }
            log_warn("Snapshot has " + std::to_string(parsed.errors.size()) + " parse error(s)");
            return failure(request, "Failed to parse snapshot: " + joined);
        }
        data = std::make_shared<const json>(parsed.tree ? to_json(*parsed.tree) : json::array());
        key = cache_.create(url, data, request.ttl.value_or(config_.default_ttl));
    } else {
        return failure(request, "Either snapshot text or a cache key is required");
    }

    json view = request.flatten ? flatten(*data) : *data;

    if (request.query) {
        QueryResult result = apply_query(view, *request.query);
        if (!result.ok()) {
            json response = failure(request, *result.error);
            response["url"] = url;
            response["cache_key"] = key;
            response["output_format"] = output_format_name(request.output_format);
            response["snapshot"] = request.output_format == OutputFormat::Json
                                       ? json::array()
                                       : json(std::string());
            return response;
        }
        view = result.value.is_null() ? json::array() : std::move(result.value);
    }

    size_t limit = config_.clamp_limit(request.limit.value_or(config_.default_limit));
    Page page = paginate(view, request.offset, limit);
    if (Logger::instance().enabled(LogLevel::Debug))
        log_debug("Page " + std::to_string(page.offset) + "+" +
                  std::to_string(page.items.size()) + " of " + std::to_string(page.total) +
                  " from " + key);

    json response = json::object();
    response["success"] = true;
    response["url"] = url;
    response["cache_key"] = key;
    response["total_items"] = page.total;
    response["offset"] = page.offset;
    response["limit"] = page.limit;
    response["has_more"] = page.has_more;
    if (request.query)
        response["query_applied"] = *request.query;
    response["flattened"] = request.flatten;
    response["output_format"] = output_format_name(request.output_format);
    if (request.output_format == OutputFormat::Json)
        response["snapshot"] = std::move(page.items);
    else
        response["snapshot"] = format_output(page.items, OutputFormat::Yaml);
    return response;
}

json SnapshotNavigator::handle_request(const json &request) {
    try {
        std::string action = "navigate";
        if (request.is_object() && request.contains("action")) {
            if (!request["action"].is_string())
                throw Error("Field 'action' must be a string");
            action = request["action"].get<std::string>();
        }

        if (action == "navigate")
            return navigate(NavigateRequest::from_json(request));

        json response = json::object();
        if (action == "delete") {
            auto key = optional_string(request, "cache_key");
            if (!key)
                throw Error("Action 'delete' requires a 'cache_key'");
            response["success"] = true;
            response["cache_key"] = *key;
            response["deleted"] = cache_.remove(*key);
            return response;
        }
        if (action == "clear") {
            size_t count = cache_.size();
            cache_.clear();
            response["success"] = true;
            response["cleared"] = count;
            return response;
        }
        throw Error("Unknown action: " + action);
    } catch (const Error &e) {
        log_warn(e.what());
        json response = json::object();
        response["success"] = false;
        response["error"] = e.what();
        return response;
    }
}

} // namespace arialens
