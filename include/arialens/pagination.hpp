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

#include "types.hpp"
#include <cstddef>

namespace arialens {

struct Page {
    json items = json::array();
    size_t total = 0;
    size_t offset = 0;
    size_t limit = 0;
    bool has_more = false;
};

// Slice a query result into one page. A non-array result counts as a
// single item; an offset past the end yields an empty page.
Page paginate(const json &result, size_t offset, size_t limit);

} // namespace arialens
