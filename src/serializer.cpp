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

#include "arialens/serializer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace arialens {

namespace {

const std::pair<const char *, std::optional<bool> TemplateNode::*> BOOL_FIELDS[] = {
    {"disabled", &TemplateNode::disabled},
    {"expanded", &TemplateNode::expanded},
    {"active", &TemplateNode::active},
    {"selected", &TemplateNode::selected},
};

// Attribute names with a dedicated field; props using them are written as
// property lines so they do not turn into flags when parsed back.
const char *const RESERVED_ATTRIBUTES[] = {"ref",    "checked",  "pressed",  "disabled",
                                           "active", "expanded", "selected", "level"};

json tristate_to_json(TriState state) {
    if (state == TriState::Mixed)
        return "mixed";
    return state == TriState::True;
}

TriState tristate_from_json(const json &j, const char *field) {
    if (j.is_boolean())
        return j.get<bool>() ? TriState::True : TriState::False;
    if (j.is_string() && j.get<std::string>() == "mixed")
        return TriState::Mixed;
    throw Error(std::string("Field '") + field + "' must be true, false or \"mixed\"");
}

json child_to_json(const Child &child) {
    if (child.is_text())
        return child.text();
    return to_json(child.node());
}

Child child_from_json(const json &j) {
    if (j.is_string())
        return Child(j.get<std::string>());
    return Child(node_from_json(j));
}

// ---------------------------------------------------------------------------
// Snapshot text rendering
// ---------------------------------------------------------------------------

std::string quote(const std::string &value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

// Keys written inline as [key=value]; the rest become "- /key: value" lines
bool is_inline_key(const std::string &key) {
    if (key.empty() || key == "url")
        return false;
    for (const char *reserved : RESERVED_ATTRIBUTES) {
        if (key == reserved)
            return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

// Value usable inside [key=value] without quoting
bool is_bare_value(const std::string &value) {
    return std::none_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == ',' || c == '[' || c == ']' || c == '"';
    });
}

// Literal after "text:" or "/prop:" that would not survive trimming/unquoting
std::string render_literal(const std::string &value) {
    bool needs_quotes = !value.empty() &&
                        (std::isspace(static_cast<unsigned char>(value.front())) ||
                         std::isspace(static_cast<unsigned char>(value.back())) ||
                         value.front() == '"');
    return needs_quotes ? quote(value) : value;
}

void render_node(const TemplateNode &node, size_t depth, std::ostringstream &out);

void render_children(const std::vector<Child> &children, size_t depth, std::ostringstream &out) {
    std::string indent(depth * 2, ' ');
    for (const auto &child : children) {
        if (child.is_text()) {
            out << indent << "- text:";
            if (!child.text().empty())
                out << ' ' << render_literal(child.text());
            else
                out << " \"\"";
            out << '\n';
        } else {
            render_node(child.node(), depth, out);
        }
    }
}

void render_node(const TemplateNode &node, size_t depth, std::ostringstream &out) {
    std::string indent(depth * 2, ' ');
    out << indent << "- " << node.role;

    if (node.name) {
        if (node.name->is_regex)
            out << " /" << node.name->value << '/';
        else
            out << ' ' << quote(node.name->value);
    }

    if (node.checked)
        out << " [checked=" << tristate_to_string(*node.checked) << ']';
    for (const auto &[field, member] : BOOL_FIELDS) {
        if (node.*member)
            out << " [" << field << '=' << (*(node.*member) ? "true" : "false") << ']';
    }
    if (node.level)
        out << " [level=" << *node.level << ']';
    if (node.pressed)
        out << " [pressed=" << tristate_to_string(*node.pressed) << ']';
    if (node.ref)
        out << " [ref=" << (is_bare_value(*node.ref) ? *node.ref : quote(*node.ref)) << ']';

    std::vector<std::pair<std::string, std::string>> property_lines;
    for (const auto &[key, value] : node.props) {
        if (!is_inline_key(key)) {
            property_lines.emplace_back(key, value);
        } else if (value.empty()) {
            out << " [" << key << ']';
        } else {
            out << " [" << key << '=' << (is_bare_value(value) ? value : quote(value)) << ']';
        }
    }

    if (node.children.empty() && property_lines.empty()) {
        out << '\n';
        return;
    }
    out << ":\n";

    std::string child_indent((depth + 1) * 2, ' ');
    for (const auto &[key, value] : property_lines) {
        out << child_indent << "- /" << key << ':';
        if (!value.empty())
            out << ' ' << render_literal(value);
        out << '\n';
    }
    render_children(node.children, depth + 1, out);
}

} // namespace

json to_json(const TemplateNode &node) {
    json j = json::object();
    j["role"] = node.role;

    if (node.name) {
        j["name"] = json::object();
        j["name"]["value"] = node.name->value;
        j["name"]["is_regex"] = node.name->is_regex;
    }
    if (node.ref)
        j["ref"] = *node.ref;
    if (node.checked)
        j["checked"] = tristate_to_json(*node.checked);
    if (node.pressed)
        j["pressed"] = tristate_to_json(*node.pressed);
    for (const auto &[field, member] : BOOL_FIELDS) {
        if (node.*member)
            j[field] = *(node.*member);
    }
    if (node.level)
        j["level"] = *node.level;

    if (!node.props.empty()) {
        json props = json::object();
        for (const auto &[key, value] : node.props)
            props[key] = value;
        j["props"] = std::move(props);
    }

    json children = json::array();
    for (const auto &child : node.children)
        children.push_back(child_to_json(child));
    j["children"] = std::move(children);

    return j;
}

json to_json(const Tree &tree) {
    json j = json::array();
    for (const auto &child : tree)
        j.push_back(child_to_json(child));
    return j;
}

TemplateNode node_from_json(const json &j) {
    if (!j.is_object())
        throw Error(std::string("Expected a node object, got ") + j.type_name());

    auto role = j.find("role");
    if (role == j.end() || !role->is_string())
        throw Error("Node is missing a string 'role'");

    TemplateNode node;
    node.role = role->get<std::string>();

    if (auto name = j.find("name"); name != j.end()) {
        if (!name->is_object() || !name->contains("value") || !(*name)["value"].is_string())
            throw Error("Field 'name' of role '" + node.role + "' must be {value, is_regex}");
        NameMatcher matcher;
        matcher.value = (*name)["value"].get<std::string>();
        matcher.is_regex = name->value("is_regex", false);
        node.name = std::move(matcher);
    }
    if (auto ref = j.find("ref"); ref != j.end()) {
        if (!ref->is_string())
            throw Error("Field 'ref' must be a string");
        node.ref = ref->get<std::string>();
    }
    if (auto checked = j.find("checked"); checked != j.end())
        node.checked = tristate_from_json(*checked, "checked");
    if (auto pressed = j.find("pressed"); pressed != j.end())
        node.pressed = tristate_from_json(*pressed, "pressed");
    for (const auto &[field, member] : BOOL_FIELDS) {
        auto it = j.find(field);
        if (it == j.end())
            continue;
        if (!it->is_boolean())
            throw Error(std::string("Field '") + field + "' must be a boolean");
        node.*member = it->get<bool>();
    }
    if (auto level = j.find("level"); level != j.end()) {
        if (!level->is_number_integer())
            throw Error("Field 'level' must be an integer");
        node.level = level->get<int64_t>();
    }
    if (auto props = j.find("props"); props != j.end()) {
        if (!props->is_object())
            throw Error("Field 'props' must be an object");
        for (auto it = props->begin(); it != props->end(); ++it) {
            node.props[it.key()] =
                it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }
    if (auto children = j.find("children"); children != j.end()) {
        if (!children->is_array())
            throw Error("Field 'children' must be an array");
        for (const auto &child : *children)
            node.children.push_back(child_from_json(child));
    }
    return node;
}

Tree tree_from_json(const json &j) {
    if (!j.is_array())
        throw Error(std::string("Expected an array of snapshot entries, got ") + j.type_name());

    Tree tree;
    tree.reserve(j.size());
    for (const auto &child : j)
        tree.push_back(child_from_json(child));
    return tree;
}

std::string render_snapshot(const Tree &tree) {
    std::ostringstream out;
    render_children(tree, 0, out);
    return out.str();
}

} // namespace arialens
