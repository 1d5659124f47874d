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
#include <vector>

namespace arialens {

// Recursive-descent parser for ARIA snapshot text:
//
//   - ROLE ["name" | /regex/] [attr, key=value]* [:[ inline text]]
//     - text: literal
//     - /prop: value
//
// Nesting comes from indentation only. Malformed lines are reported as
// ParseError entries and skipped together with everything indented under
// them; parse() itself never throws on bad input.
class SnapshotParser {
public:

    // Parse raw snapshot text (preamble and code fences are stripped first)
    ParseResult parse(const std::string &text) const;

    // Locate the list region inside decorated text. Returns the text
    // unchanged when no "- " list can be found.
    static std::string extract_snapshot_region(const std::string &text);

private:

    // One non-blank source line
    struct Line {
        size_t number;       // 1-based
        size_t indent;       // Leading whitespace columns
        std::string content; // Trimmed text
    };

    // Parsed form of a single "- ..." line
    struct LineItem {
        enum class Kind { Node, Text, Property };
        Kind kind = Kind::Node;
        TemplateNode node;         // Kind::Node
        std::string text;          // Kind::Text, or inline text of a node
        bool has_inline = false;   // Node line carried text after ':'
        std::string prop_key;      // Kind::Property
        std::string prop_value;    // Kind::Property
    };

    static std::vector<Line> split_lines(const std::string &text);

    // Parse every line indented deeper than parent_indent into out. owner is
    // the node receiving property lines (null at the root); depth counts the
    // enclosing nodes and is capped at MAX_DEPTH.
    void parse_block(const std::vector<Line> &lines, size_t &pos, long parent_indent, Tree &out,
                     TemplateNode *owner, size_t depth, std::vector<ParseError> &errors) const;

    // Skip the lines nested under lines[pos - 1]
    static void skip_nested(const std::vector<Line> &lines, size_t &pos, size_t indent);

    // Grammar for one line. Returns false and fills error on mismatch.
    bool parse_line(const std::string &content, LineItem &item, std::string &error) const;
    bool parse_node(const std::string &body, LineItem &item, std::string &error) const;
    bool parse_attributes(const std::string &list, TemplateNode &node, std::string &error) const;
    bool apply_attribute(const std::string &key, const std::string &value, bool has_value,
                         TemplateNode &node, std::string &error) const;
};

// Convenience wrapper around SnapshotParser::parse
ParseResult parse_snapshot(const std::string &text);

// Remove surrounding double quotes and resolve \" and \\ escapes
std::string unquote(const std::string &text);

} // namespace arialens
