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

#include "arialens/output.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace arialens {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_null_word(const std::string &s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> bool_word(const std::string &s) {
    std::string lower = lowercase(s);
    if (lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<int64_t> integer_word(const std::string &s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
        return std::nullopt;
    try {
        size_t consumed = 0;
        long long value = std::stoll(s, &consumed, 10);
        if (consumed == s.size())
            return static_cast<int64_t>(value);
    } catch (const std::logic_error &) {
    }
    return std::nullopt;
}

std::optional<double> float_word(const std::string &s) {
    std::string lower = lowercase(s);
    if (lower == ".inf" || lower == "+.inf")
        return HUGE_VAL;
    if (lower == "-.inf")
        return -HUGE_VAL;
    if (lower == ".nan")
        return std::nan("");
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
        return std::nullopt;
    if (lower.find_first_of("0123456789") == std::string::npos ||
        lower.find("0x") != std::string::npos)
        return std::nullopt;
    try {
        size_t consumed = 0;
        double value = std::stod(s, &consumed);
        if (consumed == s.size())
            return value;
    } catch (const std::logic_error &) {
    }
    return std::nullopt;
}

// Strings a YAML reader would resolve to null, bool or a number
bool needs_quoting(const std::string &s) {
    return is_null_word(s) || bool_word(s) || lowercase(s) == "y" || lowercase(s) == "n" ||
           integer_word(s) || float_word(s);
}

// Multi-line text that a "|" block reproduces exactly
bool is_block_text(const std::string &s) {
    if (s.size() < 2 || s.back() != '\n' || s[s.size() - 2] == '\n')
        return false;
    if (s.find('\n') == s.size() - 1 || std::isspace(static_cast<unsigned char>(s.front())))
        return false;
    return s.find_first_of("\r\t") == std::string::npos;
}

void emit_value(YAML::Emitter &out, const json &value) {
    switch (value.type()) {
    case json::value_t::null:
        out << YAML::Null;
        break;
    case json::value_t::boolean:
        out << value.get<bool>();
        break;
    case json::value_t::number_integer:
        out << value.get<int64_t>();
        break;
    case json::value_t::number_unsigned:
        out << value.get<uint64_t>();
        break;
    case json::value_t::number_float:
        out << value.get<double>();
        break;
    case json::value_t::string: {
        const auto &s = value.get_ref<const std::string &>();
        if (is_block_text(s))
            out << YAML::Literal << s;
        else if (needs_quoting(s))
            out << YAML::DoubleQuoted << s;
        else
            out << s;
        break;
    }
    case json::value_t::array:
        if (value.empty()) {
            out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
            break;
        }
        out << YAML::BeginSeq;
        for (const auto &item : value)
            emit_value(out, item);
        out << YAML::EndSeq;
        break;
    case json::value_t::object:
        if (value.empty()) {
            out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
            break;
        }
        out << YAML::BeginMap;
        for (auto it = value.begin(); it != value.end(); ++it) {
            out << YAML::Key;
            if (needs_quoting(it.key()))
                out << YAML::DoubleQuoted;
            out << it.key() << YAML::Value;
            emit_value(out, it.value());
        }
        out << YAML::EndMap;
        break;
    default:
        throw OutputError(std::string("Cannot format value of type ") + value.type_name());
    }
}

// Plain scalars resolve by the YAML core schema; quoted ones stay strings
json scalar_to_json(const YAML::Node &node) {
    const std::string &text = node.Scalar();
    if (node.Tag() != "?")
        return text;
    if (is_null_word(text))
        return nullptr;
    if (auto b = bool_word(text))
        return *b;
    if (auto i = integer_word(text))
        return *i;
    if (auto d = float_word(text))
        return *d;
    return text;
}

json node_to_json(const YAML::Node &node) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return nullptr;
    case YAML::NodeType::Scalar:
        return scalar_to_json(node);
    case YAML::NodeType::Sequence: {
        json out = json::array();
        for (const auto &item : node)
            out.push_back(node_to_json(item));
        return out;
    }
    case YAML::NodeType::Map: {
        json out = json::object();
        for (const auto &pair : node)
            out[pair.first.as<std::string>()] = node_to_json(pair.second);
        return out;
    }
    }
    return nullptr;
}

} // namespace

OutputFormat parse_output_format(const std::string &name) {
    return lowercase(name) == "json" ? OutputFormat::Json : OutputFormat::Yaml;
}

const char *output_format_name(OutputFormat format) {
    return format == OutputFormat::Json ? "json" : "yaml";
}

std::string format_output(const json &data, OutputFormat format) {
    if (format == OutputFormat::Json)
        return data.dump(2, ' ', false, json::error_handler_t::replace);

    YAML::Emitter out;
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    emit_value(out, data);
    if (!out.good())
        throw OutputError("YAML emitter failed: " + out.GetLastError());

    std::string text = out.c_str();
    if (text.empty() || text.back() != '\n')
        text += '\n';
    return text;
}

json load_yaml(const std::string &text) {
    try {
        return node_to_json(YAML::Load(text));
    } catch (const YAML::Exception &e) {
        throw OutputError(std::string("Malformed YAML: ") + e.what());
    }
}

} // namespace arialens
