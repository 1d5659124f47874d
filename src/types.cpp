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

#include "arialens/types.hpp"

namespace arialens {

namespace {

// Same keys and values; order is presentation only
bool same_props(const Props &a, const Props &b) {
    if (a.size() != b.size())
        return false;
    for (const auto &[key, value] : a) {
        auto it = b.find(key);
        if (it == b.end() || it->second != value)
            return false;
    }
    return true;
}

} // namespace

bool operator==(const TemplateNode &a, const TemplateNode &b) {
    return a.role == b.role && a.name == b.name && a.ref == b.ref && a.checked == b.checked &&
           a.pressed == b.pressed && a.disabled == b.disabled && a.expanded == b.expanded &&
           a.active == b.active && a.selected == b.selected && a.level == b.level &&
           same_props(a.props, b.props) && a.children == b.children;
}

bool operator==(const Child &a, const Child &b) {
    if (a.is_text() != b.is_text())
        return false;
    if (a.is_text())
        return a.text() == b.text();
    return a.node() == b.node();
}

} // namespace arialens
