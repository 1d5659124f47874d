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

class OutputError : public Error {
public:
    using Error::Error;
};

enum class OutputFormat { Json, Yaml };

// "json" (any case) selects JSON; everything else falls back to YAML
OutputFormat parse_output_format(const std::string &name);
const char *output_format_name(OutputFormat format);

// Render data as indented JSON or block-style YAML. Key order and UTF-8
// text are preserved; YAML strings that would read back as another type
// are double-quoted.
std::string format_output(const json &data, OutputFormat format);

// Read YAML text into plain data. Throws OutputError on malformed input.
json load_yaml(const std::string &text);

} // namespace arialens
