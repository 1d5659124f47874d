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

#include "arialens/pagination.hpp"
#include <algorithm>

namespace arialens {

Page paginate(const json &result, size_t offset, size_t limit) {
    json wrapped = result.is_array() ? result : json::array({result});

    Page page;
    page.total = wrapped.size();
    page.offset = offset;
    page.limit = limit;

    if (offset < page.total) {
        size_t end = offset + std::min(limit, page.total - offset);
        for (size_t i = offset; i < end; ++i)
            page.items.push_back(wrapped[i]);
    }
    page.has_more = offset < page.total && limit < page.total - offset;
    return page;
}

} // namespace arialens
