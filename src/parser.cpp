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

#include "arialens/parser.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace arialens {

namespace {

constexpr const char *LIST_MARKER = "- ";
constexpr const char *FENCE = "```";
constexpr size_t MAX_DEPTH = 512;

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

std::string trim(const std::string &s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start]))
        ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1]))
        --end;
    return s.substr(start, end - start);
}

std::string ltrim(const std::string &s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start]))
        ++start;
    return s.substr(start);
}

bool starts_with(const std::string &s, const std::string &prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_raw_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::string current;
    std::istringstream stream(text);
    while (std::getline(stream, current)) {
        if (!current.empty() && current.back() == '\r')
            current.pop_back();
        lines.push_back(current);
    }
    return lines;
}

std::string join_lines(const std::vector<std::string> &lines, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin)
            out += '\n';
        out += lines[i];
    }
    return out;
}

// Contents of the first ```yaml / ```yml / ``` block, or empty
std::string extract_fenced_block(const std::vector<std::string> &lines) {
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string stripped = trim(lines[i]);
        if (!starts_with(stripped, FENCE))
            continue;

        std::string info = to_lower(trim(stripped.substr(3)));

        size_t end = i + 1;
        while (end < lines.size() && trim(lines[end]) != FENCE)
            ++end;

        if (info != "yaml" && info != "yml" && !info.empty()) {
            i = end;
            continue;
        }

        std::string raw = join_lines(lines, i + 1, end);
        while (!raw.empty() && raw.back() == '\n')
            raw.pop_back();
        if (!raw.empty())
            return raw;
        i = end;
    }
    return "";
}

// Split an attribute list on commas/whitespace, keeping quoted values whole
std::vector<std::string> tokenize_attributes(const std::string &list) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < list.size(); ++i) {
        char c = list[i];
        if (in_quotes) {
            current += c;
            if (c == '\\' && i + 1 < list.size()) {
                current += list[++i];
            } else if (c == '"') {
                in_quotes = false;
            }
            continue;
        }
        if (c == '"') {
            in_quotes = true;
            current += c;
        } else if (c == ',' || is_space(c)) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty())
        tokens.push_back(current);
    return tokens;
}

// Position of the ']' closing the attribute list opened at open, or npos
size_t find_closing_bracket(const std::string &body, size_t open) {
    bool in_quotes = false;
    for (size_t i = open + 1; i < body.size(); ++i) {
        char c = body[i];
        if (in_quotes) {
            if (c == '\\')
                ++i;
            else if (c == '"')
                in_quotes = false;
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ']') {
            return i;
        }
    }
    return std::string::npos;
}

// Boolean flags that may appear as bare words in an attribute list
const std::pair<const char *, std::optional<bool> TemplateNode::*> BOOL_FLAGS[] = {
    {"disabled", &TemplateNode::disabled},
    {"expanded", &TemplateNode::expanded},
    {"active", &TemplateNode::active},
    {"selected", &TemplateNode::selected},
};

const std::pair<const char *, std::optional<TriState> TemplateNode::*> TRISTATE_FLAGS[] = {
    {"checked", &TemplateNode::checked},
    {"pressed", &TemplateNode::pressed},
};

} // namespace

std::string unquote(const std::string &text) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"')
        return text;

    std::string out;
    out.reserve(text.size() - 2);
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 2 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
            out += text[++i];
        } else {
            out += c;
        }
    }
    return out;
}

std::string SnapshotParser::extract_snapshot_region(const std::string &text) {
    // Plain snapshot: nothing to strip
    if (starts_with(ltrim(text), LIST_MARKER))
        return text;

    auto lines = split_raw_lines(text);

    std::string fenced = extract_fenced_block(lines);
    if (!fenced.empty())
        return fenced;

    // Skip preamble, then collect the list until a fence or unindented prose
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!starts_with(ltrim(lines[i]), LIST_MARKER))
            continue;

        size_t end = i;
        for (; end < lines.size(); ++end) {
            const std::string &line = lines[end];
            std::string content = trim(line);
            if (content == FENCE)
                break;
            bool listish = starts_with(content, LIST_MARKER) || starts_with(line, "  ") ||
                           starts_with(line, "\t");
            if (!content.empty() && !listish && end > i)
                break;
        }
        return join_lines(lines, i, end);
    }

    return text;
}

std::vector<SnapshotParser::Line> SnapshotParser::split_lines(const std::string &text) {
    std::vector<Line> lines;
    auto raw = split_raw_lines(text);
    for (size_t i = 0; i < raw.size(); ++i) {
        const std::string &line = raw[i];
        size_t indent = 0;
        while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t'))
            ++indent;
        std::string content = trim(line);
        if (content.empty())
            continue;
        lines.push_back({i + 1, indent, std::move(content)});
    }
    return lines;
}

ParseResult SnapshotParser::parse(const std::string &text) const {
    ParseResult result;

    auto lines = split_lines(extract_snapshot_region(text));
    if (lines.empty())
        return result;

    Tree tree;
    size_t pos = 0;
    parse_block(lines, pos, -1, tree, nullptr, 0, result.errors);

    if (!tree.empty())
        result.tree = std::move(tree);
    return result;
}

void SnapshotParser::skip_nested(const std::vector<Line> &lines, size_t &pos, size_t indent) {
    while (pos < lines.size() && lines[pos].indent > indent)
        ++pos;
}

void SnapshotParser::parse_block(const std::vector<Line> &lines, size_t &pos, long parent_indent,
                                 Tree &out, TemplateNode *owner, size_t depth,
                                 std::vector<ParseError> &errors) const {
    while (pos < lines.size()) {
        const Line &line = lines[pos];
        if (static_cast<long>(line.indent) <= parent_indent)
            return;

        LineItem item;
        std::string error;
        if (!parse_line(line.content, item, error)) {
            errors.push_back({line.number, error});
            ++pos;
            skip_nested(lines, pos, line.indent);
            continue;
        }
        ++pos;

        switch (item.kind) {
        case LineItem::Kind::Text:
            out.emplace_back(std::move(item.text));
            break;

        case LineItem::Kind::Property:
            if (!owner) {
                errors.push_back(
                    {line.number, "Property '/" + item.prop_key + "' is not attached to a node"});
            } else {
                owner->props[item.prop_key] = item.prop_value;
            }
            break;

        case LineItem::Kind::Node: {
            if (depth >= MAX_DEPTH) {
                errors.push_back({line.number, "Nesting deeper than " +
                                                   std::to_string(MAX_DEPTH) + " levels"});
                skip_nested(lines, pos, line.indent);
                continue;
            }
            TemplateNode node = std::move(item.node);
            if (item.has_inline) {
                bool regex = item.text.size() >= 2 && item.text.front() == '/' &&
                             item.text.back() == '/';
                if (!node.name && regex)
                    node.name = NameMatcher{item.text.substr(1, item.text.size() - 2), true};
                else if (!node.name)
                    node.name = NameMatcher{item.text, false};
                else
                    node.children.emplace_back(std::move(item.text));
            }
            parse_block(lines, pos, static_cast<long>(line.indent), node.children, &node,
                        depth + 1, errors);
            out.emplace_back(std::move(node));
            continue;
        }
        }

        // Text and property entries are leaves
        if (pos < lines.size() && lines[pos].indent > line.indent) {
            errors.push_back({lines[pos].number, "Unexpected nested content under line " +
                                                     std::to_string(line.number)});
            skip_nested(lines, pos, line.indent);
        }
    }
}

bool SnapshotParser::parse_line(const std::string &content, LineItem &item,
                                std::string &error) const {
    if (starts_with(content, "text:")) {
        item.kind = LineItem::Kind::Text;
        item.text = unquote(trim(content.substr(5)));
        return true;
    }

    if (!starts_with(content, LIST_MARKER)) {
        error = content == "-" ? "Empty list item" : "Expected '- ' list item: " + content;
        return false;
    }

    std::string body = trim(content.substr(2));

    if (starts_with(body, "text:")) {
        item.kind = LineItem::Kind::Text;
        item.text = unquote(trim(body.substr(5)));
        return true;
    }

    if (starts_with(body, "/")) {
        // "/key: value" - the first ':' followed by a space (or line end) ends the key
        size_t colon = body.find(':');
        while (colon != std::string::npos && colon + 1 < body.size() && body[colon + 1] != ' ')
            colon = body.find(':', colon + 1);
        if (colon == std::string::npos || colon == 1) {
            error = "Malformed property entry: " + body;
            return false;
        }
        item.kind = LineItem::Kind::Property;
        item.prop_key = body.substr(1, colon - 1);
        item.prop_value = unquote(trim(body.substr(colon + 1)));
        return true;
    }

    item.kind = LineItem::Kind::Node;
    return parse_node(body, item, error);
}

bool SnapshotParser::parse_node(const std::string &body, LineItem &item,
                                std::string &error) const {
    TemplateNode &node = item.node;
    const size_t n = body.size();
    size_t i = 0;

    auto skip_ws = [&]() {
        while (i < n && is_space(body[i]))
            ++i;
    };

    // Role
    while (i < n && !is_space(body[i]) && body[i] != '"' && body[i] != '/' && body[i] != '[' &&
           body[i] != ':')
        ++i;
    node.role = body.substr(0, i);
    if (node.role.empty()) {
        error = "Expected role: " + body;
        return false;
    }
    skip_ws();

    // Optional name
    if (i < n && body[i] == '"') {
        std::string value;
        size_t j = i + 1;
        for (; j < n && body[j] != '"'; ++j) {
            if (body[j] == '\\' && j + 1 < n) {
                char next = body[j + 1];
                if (next != '"' && next != '\\')
                    value += '\\';
                value += next;
                ++j;
            } else {
                value += body[j];
            }
        }
        if (j >= n) {
            error = "Unterminated quoted name for role '" + node.role + "'";
            return false;
        }
        node.name = NameMatcher{value, false};
        i = j + 1;
    } else if (i < n && body[i] == '/') {
        size_t j = i + 1;
        while (j < n && body[j] != '/') {
            if (body[j] == '\\' && j + 1 < n)
                ++j;
            ++j;
        }
        if (j >= n) {
            error = "Unterminated regex name for role '" + node.role + "'";
            return false;
        }
        node.name = NameMatcher{body.substr(i + 1, j - i - 1), true};
        i = j + 1;
    }
    skip_ws();

    // Attribute lists: [ref=e1] [cursor=pointer] or [checked, level=2]
    while (i < n && body[i] == '[') {
        size_t close = find_closing_bracket(body, i);
        if (close == std::string::npos) {
            error = "Unterminated attribute list for role '" + node.role + "'";
            return false;
        }
        if (!parse_attributes(body.substr(i + 1, close - i - 1), node, error))
            return false;
        i = close + 1;
        skip_ws();
    }

    if (i < n && body[i] == ':') {
        std::string rest = trim(body.substr(i + 1));
        if (!rest.empty()) {
            item.has_inline = true;
            item.text = unquote(rest);
        }
        return true;
    }

    if (i < n) {
        error = "Unexpected '" + body.substr(i) + "' after role '" + node.role + "'";
        return false;
    }
    return true;
}

bool SnapshotParser::parse_attributes(const std::string &list, TemplateNode &node,
                                      std::string &error) const {
    for (const auto &token : tokenize_attributes(list)) {
        size_t eq = token.find('=');
        bool ok = eq == std::string::npos
                      ? apply_attribute(token, "", false, node, error)
                      : apply_attribute(token.substr(0, eq), unquote(token.substr(eq + 1)), true,
                                        node, error);
        if (!ok)
            return false;
    }
    return true;
}

bool SnapshotParser::apply_attribute(const std::string &key, const std::string &value,
                                     bool has_value, TemplateNode &node,
                                     std::string &error) const {
    if (key.empty()) {
        error = "Empty attribute name";
        return false;
    }

    if (key == "ref") {
        if (!has_value || value.empty()) {
            error = "Attribute 'ref' requires a value";
            return false;
        }
        node.ref = value;
        return true;
    }

    for (const auto &[flag, member] : TRISTATE_FLAGS) {
        if (key != flag)
            continue;
        std::optional<TriState> state = TriState::True;
        if (has_value)
            state = tristate_from_string(value);
        if (!state) {
            error = "Invalid value for '" + key + "': '" + value +
                    "' (expected true, false or mixed)";
            return false;
        }
        node.*member = state;
        return true;
    }

    for (const auto &[flag, member] : BOOL_FLAGS) {
        if (key != flag)
            continue;
        if (!has_value || value == "true") {
            node.*member = true;
        } else if (value == "false") {
            node.*member = false;
        } else {
            error = "Invalid value for '" + key + "': '" + value + "' (expected true or false)";
            return false;
        }
        return true;
    }

    if (key == "level") {
        try {
            size_t consumed = 0;
            long long level = std::stoll(value, &consumed);
            if (!has_value || consumed != value.size())
                throw std::invalid_argument(value);
            node.level = static_cast<int64_t>(level);
            return true;
        } catch (const std::logic_error &) {
            error = "Invalid value for 'level': '" + value + "' (expected an integer)";
            return false;
        }
    }

    node.props[key] = has_value ? value : "";
    return true;
}

ParseResult parse_snapshot(const std::string &text) { return SnapshotParser().parse(text); }

} // namespace arialens
