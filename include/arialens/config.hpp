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

#include <algorithm>
#include <chrono>
#include <cstddef>

namespace arialens {

// Navigator configuration
struct NavigatorConfig {
    std::chrono::seconds default_ttl{300};
    size_t default_limit = 50;
    size_t max_limit = 1000;
    bool verbose = false;

    // Limit actually used for a page: 0 and oversized values are clamped
    size_t clamp_limit(size_t requested) const {
        return std::clamp<size_t>(requested, 1, std::max<size_t>(max_limit, 1));
    }
};

} // namespace arialens
