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

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace arialens {

// Plain data exchanged between pipeline stages. ordered_json keeps keys in
// insertion order so serialized nodes read role-first.
using json = nlohmann::ordered_json;

// Role-specific extras (url, cursor, ...) in the order they were written
using Props = nlohmann::ordered_map<std::string, std::string>;

// Base class for errors raised on internal/IO failures. Malformed snapshot
// text and bad query expressions are reported through return values instead.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Snapshot tree
// ============================================================================

// Three-valued state used by checked/pressed
enum class TriState { False, True, Mixed };

inline const char *tristate_to_string(TriState state) {
    switch (state) {
    case TriState::True:
        return "true";
    case TriState::False:
        return "false";
    case TriState::Mixed:
        return "mixed";
    }
    return "false";
}

// Parse "true" / "false" / "mixed"; anything else is rejected
inline std::optional<TriState> tristate_from_string(const std::string &text) {
    if (text == "true")
        return TriState::True;
    if (text == "false")
        return TriState::False;
    if (text == "mixed")
        return TriState::Mixed;
    return std::nullopt;
}

// Accessible name of a node. A regex name keeps its inner text verbatim.
struct NameMatcher {
    std::string value;
    bool is_regex = false;

    bool operator==(const NameMatcher &other) const {
        return value == other.value && is_regex == other.is_regex;
    }
    bool operator!=(const NameMatcher &other) const { return !(*this == other); }
};

// Literal text content under a node
using TextLeaf = std::string;

struct Child;

struct TemplateNode {
    std::string role;
    std::optional<NameMatcher> name;
    std::optional<std::string> ref;
    std::optional<TriState> checked;
    std::optional<TriState> pressed;
    std::optional<bool> disabled;
    std::optional<bool> expanded;
    std::optional<bool> active;
    std::optional<bool> selected;
    std::optional<int64_t> level;
    Props props;
    std::vector<Child> children; // Document order
};

// One entry of a node's children: either a nested node or a text leaf
struct Child {
    std::variant<TemplateNode, TextLeaf> value;

    Child(TemplateNode node) : value(std::move(node)) {}
    Child(TextLeaf text) : value(std::move(text)) {}

    bool is_node() const { return std::holds_alternative<TemplateNode>(value); }
    bool is_text() const { return std::holds_alternative<TextLeaf>(value); }

    const TemplateNode &node() const { return std::get<TemplateNode>(value); }
    TemplateNode &node() { return std::get<TemplateNode>(value); }
    const TextLeaf &text() const { return std::get<TextLeaf>(value); }
};

// Root-level entries of a snapshot
using Tree = std::vector<Child>;

// Structural equality (field by field, children recursively)
bool operator==(const TemplateNode &a, const TemplateNode &b);
bool operator==(const Child &a, const Child &b);

inline bool operator!=(const TemplateNode &a, const TemplateNode &b) { return !(a == b); }
inline bool operator!=(const Child &a, const Child &b) { return !(a == b); }

// ============================================================================
// Parse diagnostics
// ============================================================================

struct ParseError {
    std::optional<size_t> line; // 1-based, within the extracted snapshot region
    std::string message;

    // "Line N: message" when the line is known
    std::string to_string() const {
        if (line)
            return "Line " + std::to_string(*line) + ": " + message;
        return message;
    }
};

struct ParseResult {
    std::optional<Tree> tree; // Absent for empty input or when nothing parsed
    std::vector<ParseError> errors;

    bool ok() const { return errors.empty(); }
};

} // namespace arialens
