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
#include <string>

namespace arialens {

// Serialize a node to plain data. Only fields that are set are emitted;
// "children" is always present and holds nested objects or bare strings.
json to_json(const TemplateNode &node);

// Serialize a whole snapshot (array of root entries)
json to_json(const Tree &tree);

// Rebuild a tree from plain data produced by to_json.
// Throws arialens::Error on shape violations.
Tree tree_from_json(const json &j);
TemplateNode node_from_json(const json &j);

// Render a tree back to snapshot text (two-space indentation). Parsing the
// result yields a structurally equal tree.
std::string render_snapshot(const Tree &tree);

} // namespace arialens
