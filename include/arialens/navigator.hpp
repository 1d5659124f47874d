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

#pragma once

#include "cache.hpp"
#include "config.hpp"
#include "output.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace arialens {

// One navigation call: fresh snapshot text or the key of a cached one,
// plus the view to produce from it.
struct NavigateRequest {
    std::string source_url;
    std::optional<std::string> snapshot_text;
    std::optional<std::string> cache_key;
    std::optional<std::string> query;
    bool flatten = false;
    size_t offset = 0;
    std::optional<size_t> limit;
    OutputFormat output_format = OutputFormat::Yaml;
    std::optional<std::chrono::seconds> ttl;

    // Build from a request object. Throws arialens::Error on bad field types.
    static NavigateRequest from_json(const json &j);
};

class SnapshotNavigator {
public:

    SnapshotNavigator(SnapshotCache &cache, NavigatorConfig config = NavigatorConfig{});

    // Parse (or fetch), flatten, query, paginate and format. Failures are
    // reported in the response with success=false; never throws for bad
    // snapshot text or queries.
    json navigate(const NavigateRequest &request);

    // Dispatch a request object by its "action": navigate (default),
    // delete or clear.
    json handle_request(const json &request);

private:

    SnapshotCache &cache_;
    NavigatorConfig config_;

    json failure(const NavigateRequest &request, const std::string &error) const;
};

} // namespace arialens
