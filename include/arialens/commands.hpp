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

#include "navigator.hpp"
#include "output.hpp"
#include <iostream>
#include <string>

namespace arialens {

// Command handlers. Each returns a process exit code; results go to `out`,
// diagnostics to stderr.
int cmd_parse(const std::string &path, OutputFormat format, std::ostream &out = std::cout);
int cmd_render(const std::string &path, std::ostream &out = std::cout);
int cmd_navigate(SnapshotNavigator &navigator, const std::string &path, NavigateRequest request,
                 std::ostream &out = std::cout);
int cmd_request(SnapshotNavigator &navigator, const std::string &path, OutputFormat format,
                std::ostream &out = std::cout);
int cmd_serve(SnapshotNavigator &navigator, std::istream &in = std::cin,
              std::ostream &out = std::cout);

// Helper functions
std::string read_input(const std::string &path);
std::string format_response(const json &response, OutputFormat format);

} // namespace arialens
