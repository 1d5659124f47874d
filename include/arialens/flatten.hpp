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

namespace arialens {

// Depth-first pre-order list of every node and text leaf in serialized
// snapshot data. Each entry is copied without "children" and annotated
// with _depth (root 0), _parent_role (null at the root) and _index.
// Text leaves become {"text": ...}. Scalars yield an empty list.
json flatten(const json &data);

} // namespace arialens
