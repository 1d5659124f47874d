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

#include "arialens/flatten.hpp"

namespace arialens {

namespace {

void flatten_into(const json &item, int64_t depth, const json &parent_role, json &out) {
    if (item.is_array()) {
        for (const auto &entry : item)
            flatten_into(entry, depth, parent_role, out);
        return;
    }

    json entry = json::object();
    const json *children = nullptr;

    if (item.is_object()) {
        for (auto it = item.begin(); it != item.end(); ++it) {
            if (it.key() == "children")
                children = &it.value();
            else
                entry[it.key()] = it.value();
        }
    } else if (item.is_string()) {
        entry["text"] = item;
    } else {
        return;
    }

    entry["_depth"] = depth;
    entry["_parent_role"] = parent_role;
    entry["_index"] = out.size();
    out.push_back(std::move(entry));

    if (children && !children->empty()) {
        auto role = item.find("role");
        flatten_into(*children, depth + 1, role != item.end() ? *role : json(nullptr), out);
    }
}

} // namespace

json flatten(const json &data) {
    json out = json::array();
    if (data.is_array() || data.is_object())
        flatten_into(data, 0, nullptr, out);
    return out;
}

} // namespace arialens
