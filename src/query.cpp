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

#include "arialens/query.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace arialens {

// ============================================================================
// Expression tree
// ============================================================================

enum class NodeType {
    Identity,
    Current,
    Field,
    Subexpression,
    Index,
    Slice,
    IndexExpression,
    Projection,
    ValueProjection,
    FilterProjection, // children: left, right, condition
    Flatten,
    Comparator,
    And,
    Or,
    Not,
    Literal,
    MultiSelectList,
    MultiSelectHash,
    KeyValPair,
    Pipe,
    Function,
    ExpressionRef
};

using NodePtr = std::shared_ptr<QueryNode>;

struct QueryNode {
    NodeType type;
    std::string name; // Field name, function name, comparator or hash key
    json literal;
    int64_t index = 0;
    std::array<std::optional<int64_t>, 3> slice;
    std::vector<NodePtr> children;
    size_t height = 1; // Longest path to a leaf, counting this node

    explicit QueryNode(NodeType t) : type(t) {}
};

namespace {

void adopt(QueryNode &parent, NodePtr child) {
    parent.height = std::max(parent.height, child->height + 1);
    parent.children.push_back(std::move(child));
}

NodePtr make_node(NodeType type, std::vector<NodePtr> children = {}) {
    auto node = std::make_shared<QueryNode>(type);
    for (auto &child : children)
        adopt(*node, std::move(child));
    return node;
}

// ============================================================================
// Lexer
// ============================================================================

enum class TokenType {
    UnquotedIdentifier,
    QuotedIdentifier,
    Literal,
    Number,
    Dot,
    Star,
    Flatten,
    Filter,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    LParen,
    RParen,
    Comma,
    Colon,
    Pipe,
    Or,
    And,
    Not,
    Eq,
    Ne,
    Lt,
    Lte,
    Gt,
    Gte,
    Current,
    Expref,
    Eof
};

struct Token {
    TokenType type;
    std::string text;
    json value;
    size_t pos;
};

class Lexer {
public:

    explicit Lexer(const std::string &expression) : src_(expression) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            size_t start = pos_;

            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                while (pos_ < src_.size() &&
                       (std::isalnum(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_'))
                    ++pos_;
                tokens.push_back({TokenType::UnquotedIdentifier, src_.substr(start, pos_ - start),
                                  nullptr, start});
            } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                       (c == '-' && peek_is_digit(1))) {
                tokens.push_back(read_number());
            } else if (c == '[') {
                if (peek(1) == ']') {
                    tokens.push_back({TokenType::Flatten, "[]", nullptr, start});
                    pos_ += 2;
                } else if (peek(1) == '?') {
                    tokens.push_back({TokenType::Filter, "[?", nullptr, start});
                    pos_ += 2;
                } else {
                    tokens.push_back({TokenType::LBracket, "[", nullptr, start});
                    ++pos_;
                }
            } else if (c == '"') {
                tokens.push_back(read_quoted_identifier());
            } else if (c == '\'') {
                tokens.push_back(read_raw_string());
            } else if (c == '`') {
                tokens.push_back(read_literal());
            } else if (c == '|') {
                tokens.push_back(two_char('|', TokenType::Or, TokenType::Pipe));
            } else if (c == '&') {
                tokens.push_back(two_char('&', TokenType::And, TokenType::Expref));
            } else if (c == '<') {
                tokens.push_back(two_char('=', TokenType::Lte, TokenType::Lt));
            } else if (c == '>') {
                tokens.push_back(two_char('=', TokenType::Gte, TokenType::Gt));
            } else if (c == '!') {
                tokens.push_back(two_char('=', TokenType::Ne, TokenType::Not));
            } else if (c == '=') {
                if (peek(1) != '=')
                    throw QueryError("Unknown token '=' at position " + std::to_string(start) +
                                     " (did you mean '=='?)");
                tokens.push_back({TokenType::Eq, "==", nullptr, start});
                pos_ += 2;
            } else {
                TokenType type = single_char_token(c);
                tokens.push_back({type, std::string(1, c), nullptr, start});
                ++pos_;
            }
        }
        tokens.push_back({TokenType::Eof, "", nullptr, src_.size()});
        return tokens;
    }

private:

    const std::string &src_;
    size_t pos_ = 0;

    char peek(size_t ahead) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    bool peek_is_digit(size_t ahead) const {
        return std::isdigit(static_cast<unsigned char>(peek(ahead))) != 0;
    }

    TokenType single_char_token(char c) const {
        switch (c) {
        case '.':
            return TokenType::Dot;
        case '*':
            return TokenType::Star;
        case ']':
            return TokenType::RBracket;
        case '{':
            return TokenType::LBrace;
        case '}':
            return TokenType::RBrace;
        case '(':
            return TokenType::LParen;
        case ')':
            return TokenType::RParen;
        case ',':
            return TokenType::Comma;
        case ':':
            return TokenType::Colon;
        case '@':
            return TokenType::Current;
        default:
            throw QueryError(std::string("Unknown character '") + c + "' at position " +
                             std::to_string(pos_));
        }
    }

    Token two_char(char second, TokenType doubled, TokenType single) {
        size_t start = pos_;
        if (peek(1) == second) {
            pos_ += 2;
            return {doubled, src_.substr(start, 2), nullptr, start};
        }
        ++pos_;
        return {single, src_.substr(start, 1), nullptr, start};
    }

    Token read_number() {
        size_t start = pos_;
        if (src_[pos_] == '-')
            ++pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_])))
            ++pos_;
        std::string text = src_.substr(start, pos_ - start);
        try {
            return {TokenType::Number, text, std::stoll(text), start};
        } catch (const std::out_of_range &) {
            throw QueryError("Number out of range at position " + std::to_string(start));
        }
    }

    // Text between delimiters, leaving escapes in place
    std::string consume_until(char delim) {
        size_t start = pos_;
        ++pos_;
        while (pos_ < src_.size() && src_[pos_] != delim) {
            if (src_[pos_] == '\\' && pos_ + 1 < src_.size())
                ++pos_;
            ++pos_;
        }
        if (pos_ >= src_.size())
            throw QueryError(std::string("Unclosed ") + delim + " delimiter at position " +
                             std::to_string(start));
        ++pos_;
        return src_.substr(start + 1, pos_ - start - 2);
    }

    Token read_quoted_identifier() {
        size_t start = pos_;
        std::string raw = consume_until('"');
        try {
            json decoded = json::parse("\"" + raw + "\"");
            return {TokenType::QuotedIdentifier, raw, decoded.get<std::string>(), start};
        } catch (const json::parse_error &) {
            throw QueryError("Invalid quoted identifier at position " + std::to_string(start));
        }
    }

    Token read_raw_string() {
        size_t start = pos_;
        std::string raw = consume_until('\'');
        std::string value;
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == '\'')
                ++i;
            value += raw[i];
        }
        return {TokenType::Literal, raw, value, start};
    }

    Token read_literal() {
        size_t start = pos_;
        std::string raw = consume_until('`');
        std::string text;
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == '`')
                ++i;
            text += raw[i];
        }
        try {
            return {TokenType::Literal, raw, json::parse(text), start};
        } catch (const json::parse_error &) {
            // Legacy form: `foo` is the string "foo"
            try {
                auto first = text.find_first_not_of(" \t");
                auto last = text.find_last_not_of(" \t");
                std::string body =
                    first == std::string::npos ? "" : text.substr(first, last - first + 1);
                return {TokenType::Literal, raw, json::parse("\"" + body + "\""), start};
            } catch (const json::parse_error &) {
                throw QueryError("Invalid JSON literal `" + raw + "` at position " +
                                 std::to_string(start));
            }
        }
    }
};

// ============================================================================
// Parser (top-down operator precedence)
// ============================================================================

constexpr int PROJECTION_STOP = 10;
constexpr size_t MAX_NESTING = 256;

int binding_power(TokenType type) {
    switch (type) {
    case TokenType::Pipe:
        return 1;
    case TokenType::Or:
        return 2;
    case TokenType::And:
        return 3;
    case TokenType::Eq:
    case TokenType::Ne:
    case TokenType::Lt:
    case TokenType::Lte:
    case TokenType::Gt:
    case TokenType::Gte:
        return 5;
    case TokenType::Flatten:
        return 9;
    case TokenType::Star:
        return 20;
    case TokenType::Filter:
        return 21;
    case TokenType::Dot:
        return 40;
    case TokenType::Not:
        return 45;
    case TokenType::LBrace:
        return 50;
    case TokenType::LBracket:
        return 55;
    case TokenType::LParen:
        return 60;
    default:
        return 0;
    }
}

class Parser {
public:

    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    NodePtr parse() {
        if (current().type == TokenType::Eof)
            throw QueryError("Empty expression");
        NodePtr root = expression(0);
        if (current().type != TokenType::Eof)
            unexpected(current());
        return root;
    }

private:

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;

    const Token &current() const { return tokens_[pos_]; }
    const Token &lookahead(size_t n) const {
        return tokens_[std::min(pos_ + n, tokens_.size() - 1)];
    }
    void advance() {
        if (pos_ + 1 < tokens_.size())
            ++pos_;
    }

    [[noreturn]] void unexpected(const Token &token) const {
        if (token.type == TokenType::Eof)
            throw QueryError("Unexpected end of expression");
        throw QueryError("Unexpected token '" + token.text + "' at position " +
                         std::to_string(token.pos));
    }

    void match(TokenType type, const char *what) {
        if (current().type != type) {
            if (current().type == TokenType::Eof)
                throw QueryError(std::string("Expected '") + what +
                                 "' but reached end of expression");
            throw QueryError(std::string("Expected '") + what + "' but found '" + current().text +
                             "' at position " + std::to_string(current().pos));
        }
        advance();
    }

    // Bounds both parser recursion and tree height, so evaluation and
    // destruction of the tree stay within a fixed stack depth
    struct DepthGuard {
        size_t &depth;

        explicit DepthGuard(size_t &d) : depth(d) {
            if (++depth > MAX_NESTING) {
                --depth;
                throw QueryError("Expression nested too deeply");
            }
        }
        ~DepthGuard() { --depth; }
    };

    static void check_height(const NodePtr &node) {
        if (node->height > MAX_NESTING)
            throw QueryError("Expression nested too deeply");
    }

    NodePtr expression(int bp) {
        DepthGuard guard(depth_);
        Token left_token = current();
        advance();
        NodePtr left = nud(left_token);
        check_height(left);
        while (bp < binding_power(current().type)) {
            Token token = current();
            advance();
            left = led(token, left);
            check_height(left);
        }
        return left;
    }

    NodePtr nud(const Token &token) {
        switch (token.type) {
        case TokenType::Literal: {
            auto node = make_node(NodeType::Literal);
            node->literal = token.value;
            return node;
        }
        case TokenType::UnquotedIdentifier:
        case TokenType::QuotedIdentifier: {
            if (token.type == TokenType::QuotedIdentifier && current().type == TokenType::LParen)
                throw QueryError("Quoted identifier cannot be used as a function name");
            auto node = make_node(NodeType::Field);
            node->name = token.type == TokenType::QuotedIdentifier
                             ? token.value.get<std::string>()
                             : token.text;
            return node;
        }
        case TokenType::Star: {
            NodePtr right = current().type == TokenType::RBracket
                                ? make_node(NodeType::Identity)
                                : projection_rhs(binding_power(TokenType::Star));
            return make_node(NodeType::ValueProjection, {make_node(NodeType::Identity), right});
        }
        case TokenType::Filter:
            return filter(make_node(NodeType::Identity));
        case TokenType::LBrace:
            return multi_select_hash();
        case TokenType::LParen: {
            NodePtr inner = expression(0);
            match(TokenType::RParen, ")");
            return inner;
        }
        case TokenType::Flatten: {
            NodePtr left = make_node(NodeType::Flatten, {make_node(NodeType::Identity)});
            NodePtr right = projection_rhs(binding_power(TokenType::Flatten));
            return make_node(NodeType::Projection, {left, right});
        }
        case TokenType::Not:
            return make_node(NodeType::Not, {expression(binding_power(TokenType::Not))});
        case TokenType::LBracket:
            if (current().type == TokenType::Number || current().type == TokenType::Colon)
                return project_if_slice(make_node(NodeType::Identity), index_expression());
            if (current().type == TokenType::Star && lookahead(1).type == TokenType::RBracket) {
                advance();
                advance();
                NodePtr right = projection_rhs(binding_power(TokenType::Star));
                return make_node(NodeType::Projection, {make_node(NodeType::Identity), right});
            }
            return multi_select_list();
        case TokenType::Current:
            return make_node(NodeType::Current);
        case TokenType::Expref:
            return make_node(NodeType::ExpressionRef, {expression(0)});
        default:
            unexpected(token);
        }
    }

    NodePtr led(const Token &token, NodePtr left) {
        switch (token.type) {
        case TokenType::Dot:
            if (current().type != TokenType::Star)
                return make_node(NodeType::Subexpression,
                                 {left, dot_rhs(binding_power(TokenType::Dot))});
            advance();
            return make_node(NodeType::ValueProjection,
                             {left, projection_rhs(binding_power(TokenType::Dot))});
        case TokenType::Pipe:
            return make_node(NodeType::Pipe, {left, expression(binding_power(TokenType::Pipe))});
        case TokenType::Or:
            return make_node(NodeType::Or, {left, expression(binding_power(TokenType::Or))});
        case TokenType::And:
            return make_node(NodeType::And, {left, expression(binding_power(TokenType::And))});
        case TokenType::LParen: {
            if (left->type != NodeType::Field)
                throw QueryError("Invalid function call at position " + std::to_string(token.pos));
            auto call = make_node(NodeType::Function);
            call->name = left->name;
            while (current().type != TokenType::RParen) {
                adopt(*call, expression(0));
                if (current().type == TokenType::Comma)
                    match(TokenType::Comma, ",");
                else if (current().type != TokenType::RParen)
                    unexpected(current());
            }
            match(TokenType::RParen, ")");
            return call;
        }
        case TokenType::Filter:
            return filter(left);
        case TokenType::Flatten: {
            NodePtr flattened = make_node(NodeType::Flatten, {left});
            return make_node(NodeType::Projection,
                             {flattened, projection_rhs(binding_power(TokenType::Flatten))});
        }
        case TokenType::Eq:
        case TokenType::Ne:
        case TokenType::Lt:
        case TokenType::Lte:
        case TokenType::Gt:
        case TokenType::Gte: {
            auto node = make_node(NodeType::Comparator,
                                  {left, expression(binding_power(token.type))});
            node->name = token.text;
            return node;
        }
        case TokenType::LBracket:
            if (current().type == TokenType::Number || current().type == TokenType::Colon)
                return project_if_slice(left, index_expression());
            match(TokenType::Star, "*");
            match(TokenType::RBracket, "]");
            return make_node(NodeType::Projection,
                             {left, projection_rhs(binding_power(TokenType::Star))});
        default:
            unexpected(token);
        }
    }

    NodePtr filter(NodePtr left) {
        NodePtr condition = expression(0);
        match(TokenType::RBracket, "]");
        NodePtr right = current().type == TokenType::Flatten
                            ? make_node(NodeType::Identity)
                            : projection_rhs(binding_power(TokenType::Filter));
        return make_node(NodeType::FilterProjection, {left, right, condition});
    }

    NodePtr projection_rhs(int bp) {
        TokenType type = current().type;
        if (binding_power(type) < PROJECTION_STOP)
            return make_node(NodeType::Identity);
        if (type == TokenType::LBracket || type == TokenType::Filter)
            return expression(bp);
        if (type == TokenType::Dot) {
            advance();
            return dot_rhs(bp);
        }
        unexpected(current());
    }

    NodePtr dot_rhs(int bp) {
        TokenType type = current().type;
        if (type == TokenType::UnquotedIdentifier || type == TokenType::QuotedIdentifier ||
            type == TokenType::Star)
            return expression(bp);
        if (type == TokenType::LBracket) {
            advance();
            return multi_select_list();
        }
        if (type == TokenType::LBrace) {
            advance();
            return multi_select_hash();
        }
        unexpected(current());
    }

    NodePtr index_expression() {
        if (current().type == TokenType::Colon || lookahead(1).type == TokenType::Colon)
            return slice_expression();
        auto node = make_node(NodeType::Index);
        node->index = current().value.get<int64_t>();
        advance();
        match(TokenType::RBracket, "]");
        return node;
    }

    NodePtr slice_expression() {
        auto node = make_node(NodeType::Slice);
        size_t part = 0;
        while (current().type != TokenType::RBracket && part < 3) {
            if (current().type == TokenType::Colon) {
                if (++part == 3)
                    throw QueryError("Too many colons in slice expression");
                advance();
            } else if (current().type == TokenType::Number) {
                node->slice[part] = current().value.get<int64_t>();
                advance();
            } else {
                unexpected(current());
            }
        }
        match(TokenType::RBracket, "]");
        return node;
    }

    NodePtr project_if_slice(NodePtr left, NodePtr right) {
        bool is_slice = right->type == NodeType::Slice;
        NodePtr index_expr = make_node(NodeType::IndexExpression, {left, right});
        if (!is_slice)
            return index_expr;
        return make_node(NodeType::Projection,
                         {index_expr, projection_rhs(binding_power(TokenType::Star))});
    }

    NodePtr multi_select_list() {
        auto node = make_node(NodeType::MultiSelectList);
        while (true) {
            adopt(*node, expression(0));
            if (current().type == TokenType::RBracket)
                break;
            match(TokenType::Comma, ",");
        }
        match(TokenType::RBracket, "]");
        return node;
    }

    NodePtr multi_select_hash() {
        auto node = make_node(NodeType::MultiSelectHash);
        while (true) {
            const Token &key = current();
            if (key.type != TokenType::UnquotedIdentifier &&
                key.type != TokenType::QuotedIdentifier)
                unexpected(key);
            auto pair = make_node(NodeType::KeyValPair);
            pair->name = key.type == TokenType::QuotedIdentifier ? key.value.get<std::string>()
                                                                 : key.text;
            advance();
            match(TokenType::Colon, ":");
            adopt(*pair, expression(0));
            adopt(*node, pair);

            if (current().type == TokenType::Comma) {
                advance();
            } else if (current().type == TokenType::RBrace) {
                advance();
                break;
            } else {
                unexpected(current());
            }
        }
        return node;
    }
};

// ============================================================================
// Value helpers
// ============================================================================

const char *type_name(const json &value) {
    if (value.is_number())
        return "number";
    if (value.is_string())
        return "string";
    if (value.is_boolean())
        return "boolean";
    if (value.is_array())
        return "array";
    if (value.is_object())
        return "object";
    return "null";
}

// Objects compare without regard to key order
bool deep_equal(const json &a, const json &b) {
    if (a.is_number() && b.is_number())
        return a.get<double>() == b.get<double>();
    if (a.type() != b.type())
        return false;
    if (a.is_array()) {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (!deep_equal(a[i], b[i]))
                return false;
        }
        return true;
    }
    if (a.is_object()) {
        if (a.size() != b.size())
            return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !deep_equal(it.value(), *other))
                return false;
        }
        return true;
    }
    return a == b;
}

json slice_array(const json &array, const std::array<std::optional<int64_t>, 3> &parts) {
    int64_t step = parts[2].value_or(1);
    if (step == 0)
        throw QueryError("Slice step cannot be 0");

    const int64_t len = static_cast<int64_t>(array.size());
    auto clamp = [&](std::optional<int64_t> v, int64_t dflt) {
        if (!v)
            return dflt;
        int64_t i = *v;
        if (i < 0) {
            i += len;
            if (i < 0)
                i = step < 0 ? -1 : 0;
        } else if (i >= len) {
            i = step < 0 ? len - 1 : len;
        }
        return i;
    };

    int64_t start = clamp(parts[0], step < 0 ? len - 1 : 0);
    int64_t stop = clamp(parts[1], step < 0 ? -1 : len);

    json out = json::array();
    if (step > 0) {
        for (int64_t i = start; i < stop; i += step)
            out.push_back(array[static_cast<size_t>(i)]);
    } else {
        for (int64_t i = start; i > stop; i += step)
            out.push_back(array[static_cast<size_t>(i)]);
    }
    return out;
}

// Split UTF-8 text into code points
std::vector<std::string> code_points(const std::string &s) {
    std::vector<std::string> out;
    for (size_t i = 0; i < s.size();) {
        size_t len = 1;
        auto c = static_cast<unsigned char>(s[i]);
        if (c >= 0xF0)
            len = 4;
        else if (c >= 0xE0)
            len = 3;
        else if (c >= 0xC0)
            len = 2;
        out.push_back(s.substr(i, len));
        i += len;
    }
    return out;
}

// ============================================================================
// Function helpers
// ============================================================================

[[noreturn]] void type_error(const char *fn, const char *expected, const json &got) {
    throw QueryError(std::string("Function ") + fn + "() expected " + expected + ", got " +
                     type_name(got));
}

const json &value_arg(const char *fn, const FunctionArg &arg) {
    if (arg.is_expression())
        throw QueryError(std::string("Function ") + fn + "() does not accept an expression");
    return arg.value;
}

const std::function<json(const json &)> &expression_arg(const char *fn, const FunctionArg &arg) {
    if (!arg.is_expression())
        throw QueryError(std::string("Function ") + fn + "() expected an expression (&expr)");
    return arg.expression;
}

const std::string &string_arg(const char *fn, const FunctionArg &arg) {
    const json &value = value_arg(fn, arg);
    if (!value.is_string())
        type_error(fn, "a string", value);
    return value.get_ref<const std::string &>();
}

const json &array_arg(const char *fn, const FunctionArg &arg) {
    const json &value = value_arg(fn, arg);
    if (!value.is_array())
        type_error(fn, "an array", value);
    return value;
}

double number_arg(const char *fn, const FunctionArg &arg) {
    const json &value = value_arg(fn, arg);
    if (!value.is_number())
        type_error(fn, "a number", value);
    return value.get<double>();
}

// Array elements must be all numbers or all strings; returns true for numbers
bool comparable_kind(const char *fn, const json &items) {
    bool numbers = items.front().is_number();
    for (const auto &item : items) {
        if (numbers ? !item.is_number() : !item.is_string())
            type_error(fn, "an array of numbers or an array of strings", item);
    }
    return numbers;
}

bool less_than(const json &a, const json &b) {
    if (a.is_number())
        return a.get<double>() < b.get<double>();
    return a.get_ref<const std::string &>() < b.get_ref<const std::string &>();
}

// Keys computed by &expr for sort_by / max_by / min_by
std::vector<json> expression_keys(const char *fn, const json &items,
                                  const std::function<json(const json &)> &expr) {
    std::vector<json> keys;
    keys.reserve(items.size());
    for (const auto &item : items)
        keys.push_back(expr(item));
    if (!keys.empty()) {
        json as_array(keys);
        comparable_kind(fn, as_array);
    }
    return keys;
}

json extreme_by(const char *fn, const std::vector<FunctionArg> &args, bool want_max) {
    const json &items = array_arg(fn, args[0]);
    if (items.empty())
        return nullptr;
    auto keys = expression_keys(fn, items, expression_arg(fn, args[1]));
    size_t best = 0;
    for (size_t i = 1; i < keys.size(); ++i) {
        if (want_max ? less_than(keys[best], keys[i]) : less_than(keys[i], keys[best]))
            best = i;
    }
    return items[best];
}

json extreme(const char *fn, const std::vector<FunctionArg> &args, bool want_max) {
    const json &items = array_arg(fn, args[0]);
    if (items.empty())
        return nullptr;
    comparable_kind(fn, items);
    auto best = items.begin();
    for (auto it = items.begin() + 1; it != items.end(); ++it) {
        if (want_max ? less_than(*best, *it) : less_than(*it, *best))
            best = it;
    }
    return *best;
}

json number_result(double value) {
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 9.0e15)
        return static_cast<int64_t>(value);
    return value;
}

// Integer that converts to int64_t without wrapping
bool fits_int64(const json &v) {
    if (v.is_number_unsigned())
        return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return v.is_number_integer();
}

bool add_overflows(int64_t a, int64_t b) {
    return (b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
           (b < 0 && a < std::numeric_limits<int64_t>::min() - b);
}

// ECMAScript regex. A leading "(?i)" inline flag, which ECMAScript lacks,
// becomes std::regex::icase.
std::regex compile_pattern(const std::string &pattern) {
    if (pattern.compare(0, 4, "(?i)") == 0)
        return std::regex(pattern.substr(4), std::regex::ECMAScript | std::regex::icase);
    return std::regex(pattern);
}

// Python-style replacement (\1, \g<1>) to ECMAScript format ($1)
std::string translate_replacement(const std::string &replacement) {
    std::string out;
    for (size_t i = 0; i < replacement.size(); ++i) {
        char c = replacement[i];
        if (c == '$') {
            out += "$$";
        } else if (c == '\\' && i + 1 < replacement.size()) {
            char next = replacement[i + 1];
            if (std::isdigit(static_cast<unsigned char>(next))) {
                out += '$';
                out += next;
                ++i;
            } else if (next == 'g' && i + 2 < replacement.size() && replacement[i + 2] == '<') {
                size_t close = replacement.find('>', i + 3);
                if (close == std::string::npos) {
                    out += c;
                    continue;
                }
                out += '$';
                out += replacement.substr(i + 3, close - i - 3);
                i = close;
            } else if (next == 'n') {
                out += '\n';
                ++i;
            } else if (next == 't') {
                out += '\t';
                ++i;
            } else if (next == '\\') {
                out += '\\';
                ++i;
            } else {
                out += c;
            }
        } else {
            out += c;
        }
    }
    return out;
}

std::optional<int64_t> parse_integer(const std::string &text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos)
        return std::nullopt;
    auto last = text.find_last_not_of(" \t\n\r");
    std::string body = text.substr(first, last - first + 1);
    try {
        size_t consumed = 0;
        long long value = std::stoll(body, &consumed, 10);
        if (consumed != body.size())
            return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::logic_error &) {
        return std::nullopt;
    }
}

} // namespace

// ============================================================================
// FunctionTable
// ============================================================================

void FunctionTable::add(const std::string &name, FunctionSpec spec) {
    functions_[name] = std::move(spec);
}

const FunctionSpec *FunctionTable::find(const std::string &name) const {
    auto it = functions_.find(name);
    return it != functions_.end() ? &it->second : nullptr;
}

FunctionTable FunctionTable::builtins() {
    FunctionTable table;

    table.add("abs", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                          const json &v = value_arg("abs", args[0]);
                          if (v.is_number_unsigned())
                              return v;
                          if (v.is_number_integer()) {
                              int64_t n = v.get<int64_t>();
                              if (n != std::numeric_limits<int64_t>::min())
                                  return std::llabs(n);
                          }
                          return std::fabs(number_arg("abs", args[0]));
                      }});

    table.add("avg", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                          const json &items = array_arg("avg", args[0]);
                          if (items.empty())
                              return nullptr;
                          double sum = 0;
                          for (const auto &item : items) {
                              if (!item.is_number())
                                  type_error("avg", "an array of numbers", item);
                              sum += item.get<double>();
                          }
                          return sum / static_cast<double>(items.size());
                      }});

    table.add("ceil", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                           return number_result(std::ceil(number_arg("ceil", args[0])));
                       }});

    table.add("floor", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                            return number_result(std::floor(number_arg("floor", args[0])));
                        }});

    table.add("contains", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                               const json &subject = value_arg("contains", args[0]);
                               const json &search = value_arg("contains", args[1]);
                               if (subject.is_string()) {
                                   return search.is_string() &&
                                          subject.get_ref<const std::string &>().find(
                                              search.get_ref<const std::string &>()) !=
                                              std::string::npos;
                               }
                               if (!subject.is_array())
                                   type_error("contains", "an array or a string", subject);
                               return std::any_of(subject.begin(), subject.end(),
                                                  [&](const json &item) {
                                                      return deep_equal(item, search);
                                                  });
                           }});

    table.add("starts_with", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                                  const auto &s = string_arg("starts_with", args[0]);
                                  const auto &prefix = string_arg("starts_with", args[1]);
                                  return s.compare(0, prefix.size(), prefix) == 0;
                              }});

    table.add("ends_with", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                                const auto &s = string_arg("ends_with", args[0]);
                                const auto &suffix = string_arg("ends_with", args[1]);
                                return s.size() >= suffix.size() &&
                                       s.compare(s.size() - suffix.size(), suffix.size(),
                                                 suffix) == 0;
                            }});

    table.add("join", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                           const auto &glue = string_arg("join", args[0]);
                           const json &items = array_arg("join", args[1]);
                           std::string out;
                           for (size_t i = 0; i < items.size(); ++i) {
                               if (!items[i].is_string())
                                   type_error("join", "an array of strings", items[i]);
                               if (i > 0)
                                   out += glue;
                               out += items[i].get_ref<const std::string &>();
                           }
                           return out;
                       }});

    table.add("keys", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                           const json &obj = value_arg("keys", args[0]);
                           if (!obj.is_object())
                               type_error("keys", "an object", obj);
                           json out = json::array();
                           for (auto it = obj.begin(); it != obj.end(); ++it)
                               out.push_back(it.key());
                           return out;
                       }});

    table.add("values", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                             const json &obj = value_arg("values", args[0]);
                             if (!obj.is_object())
                                 type_error("values", "an object", obj);
                             json out = json::array();
                             for (const auto &item : obj)
                                 out.push_back(item);
                             return out;
                         }});

    table.add("length", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                             const json &v = value_arg("length", args[0]);
                             if (v.is_string())
                                 return code_points(v.get_ref<const std::string &>()).size();
                             if (v.is_array() || v.is_object())
                                 return v.size();
                             type_error("length", "a string, array or object", v);
                         }});

    table.add("map", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                          const auto &expr = expression_arg("map", args[0]);
                          const json &items = array_arg("map", args[1]);
                          json out = json::array();
                          for (const auto &item : items)
                              out.push_back(expr(item));
                          return out;
                      }});

    table.add("max", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                          return extreme("max", args, true);
                      }});
    table.add("min", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                          return extreme("min", args, false);
                      }});
    table.add("max_by", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                             return extreme_by("max_by", args, true);
                         }});
    table.add("min_by", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                             return extreme_by("min_by", args, false);
                         }});

    table.add("merge", {1, VARIADIC, [](const std::vector<FunctionArg> &args) -> json {
                            json out = json::object();
                            for (const auto &arg : args) {
                                const json &obj = value_arg("merge", arg);
                                if (!obj.is_object())
                                    type_error("merge", "objects", obj);
                                for (auto it = obj.begin(); it != obj.end(); ++it)
                                    out[it.key()] = it.value();
                            }
                            return out;
                        }});

    table.add("not_null", {1, VARIADIC, [](const std::vector<FunctionArg> &args) -> json {
                               for (const auto &arg : args) {
                                   const json &v = value_arg("not_null", arg);
                                   if (!v.is_null())
                                       return v;
                               }
                               return nullptr;
                           }});

    table.add("reverse", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                              const json &v = value_arg("reverse", args[0]);
                              if (v.is_array()) {
                                  json out = json::array();
                                  for (auto it = v.rbegin(); it != v.rend(); ++it)
                                      out.push_back(*it);
                                  return out;
                              }
                              if (!v.is_string())
                                  type_error("reverse", "an array or a string", v);
                              auto points = code_points(v.get_ref<const std::string &>());
                              std::string out;
                              for (auto it = points.rbegin(); it != points.rend(); ++it)
                                  out += *it;
                              return out;
                          }});

    table.add("sort", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                           json items = array_arg("sort", args[0]);
                           if (items.empty())
                               return items;
                           comparable_kind("sort", items);
                           std::stable_sort(items.begin(), items.end(), less_than);
                           return items;
                       }});

    table.add("sort_by", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                              const json &items = array_arg("sort_by", args[0]);
                              const auto &expr = expression_arg("sort_by", args[1]);
                              auto keys = expression_keys("sort_by", items, expr);
                              std::vector<size_t> order(items.size());
                              for (size_t i = 0; i < order.size(); ++i)
                                  order[i] = i;
                              std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
                                  return less_than(keys[a], keys[b]);
                              });
                              json out = json::array();
                              for (size_t i : order)
                                  out.push_back(items[i]);
                              return out;
                          }});

    table.add("sum", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                          const json &items = array_arg("sum", args[0]);
                          bool all_integers = true;
                          int64_t isum = 0;
                          double dsum = 0;
                          for (const auto &item : items) {
                              if (!item.is_number())
                                  type_error("sum", "an array of numbers", item);
                              if (all_integers && fits_int64(item) &&
                                  !add_overflows(isum, item.get<int64_t>()))
                                  isum += item.get<int64_t>();
                              else
                                  all_integers = false;
                              dsum += item.get<double>();
                          }
                          if (all_integers)
                              return isum;
                          return dsum;
                      }});

    table.add("to_array", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                               const json &v = value_arg("to_array", args[0]);
                               if (v.is_array())
                                   return v;
                               return json::array({v});
                           }});

    table.add("to_number", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                                const json &v = value_arg("to_number", args[0]);
                                if (v.is_number())
                                    return v;
                                if (!v.is_string())
                                    return nullptr;
                                const auto &s = v.get_ref<const std::string &>();
                                if (auto i = parse_integer(s))
                                    return *i;
                                try {
                                    size_t consumed = 0;
                                    double d = std::stod(s, &consumed);
                                    if (consumed == s.size() && std::isfinite(d))
                                        return d;
                                } catch (const std::logic_error &) {
                                }
                                return nullptr;
                            }});

    table.add("to_string", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                                const json &v = value_arg("to_string", args[0]);
                                if (v.is_string())
                                    return v;
                                return v.dump();
                            }});

    table.add("type", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                           return type_name(value_arg("type", args[0]));
                       }});

    return table;
}

FunctionTable FunctionTable::with_extensions() {
    FunctionTable table = builtins();

    // nvl(value, default): default when value is null
    table.add("nvl", {2, 2, [](const std::vector<FunctionArg> &args) -> json {
                          const json &v = value_arg("nvl", args[0]);
                          return v.is_null() ? value_arg("nvl", args[1]) : v;
                      }});

    // int(value): best-effort integer, null when not convertible
    table.add("int", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                          const json &v = value_arg("int", args[0]);
                          if (v.is_boolean())
                              return v.get<bool>() ? 1 : 0;
                          if (v.is_number_integer())
                              return v;
                          if (v.is_number_float()) {
                              double d = v.get<double>();
                              if (!std::isfinite(d) || std::fabs(d) >= 9.2e18)
                                  return nullptr;
                              return static_cast<int64_t>(std::trunc(d));
                          }
                          if (v.is_string()) {
                              if (auto i = parse_integer(v.get_ref<const std::string &>()))
                                  return *i;
                          }
                          return nullptr;
                      }});

    // str(value): text form of non-null values
    table.add("str", {1, 1, [](const std::vector<FunctionArg> &args) -> json {
                          const json &v = value_arg("str", args[0]);
                          if (v.is_null() || v.is_string())
                              return v;
                          return v.dump();
                      }});

    // regex_replace(pattern, replacement, value)
    table.add("regex_replace", {3, 3, [](const std::vector<FunctionArg> &args) -> json {
                                    const auto &pattern = string_arg("regex_replace", args[0]);
                                    const auto &replacement = string_arg("regex_replace", args[1]);
                                    const json &v = value_arg("regex_replace", args[2]);
                                    if (v.is_null())
                                        return nullptr;
                                    if (!v.is_string())
                                        type_error("regex_replace", "a string or null", v);
                                    try {
                                        std::regex re = compile_pattern(pattern);
                                        return std::regex_replace(
                                            v.get_ref<const std::string &>(), re,
                                            translate_replacement(replacement));
                                    } catch (const std::regex_error &) {
                                        return v;
                                    }
                                }});

    return table;
}

// ============================================================================
// QueryEngine
// ============================================================================

CompiledQuery::CompiledQuery(std::shared_ptr<const QueryNode> root, std::string expression)
    : root_(std::move(root)), expression_(std::move(expression)) {}

QueryEngine::QueryEngine(FunctionTable functions) : functions_(std::move(functions)) {}

CompiledQuery QueryEngine::compile(const std::string &expression) const {
    Lexer lexer(expression);
    Parser parser(lexer.tokenize());
    return CompiledQuery(parser.parse(), expression);
}

json QueryEngine::evaluate(const CompiledQuery &query, const json &data) const {
    return visit(*query.root_, data);
}

QueryResult QueryEngine::search(const json &data, const std::string &expression) const {
    QueryResult result;
    try {
        result.value = evaluate(compile(expression), data);
    } catch (const QueryError &e) {
        result.value = json::array();
        result.error = std::string("Invalid JMESPath query: ") + e.what();
    } catch (const json::exception &e) {
        result.value = json::array();
        result.error = std::string("Invalid JMESPath query: ") + e.what();
    }
    return result;
}

json QueryEngine::visit(const QueryNode &node, const json &value) const {
    switch (node.type) {
    case NodeType::Identity:
    case NodeType::Current:
        return value;

    case NodeType::Field: {
        if (!value.is_object())
            return nullptr;
        auto it = value.find(node.name);
        return it != value.end() ? *it : json(nullptr);
    }

    case NodeType::Subexpression: {
        json result = visit(*node.children[0], value);
        for (size_t i = 1; i < node.children.size(); ++i)
            result = visit(*node.children[i], result);
        return result;
    }

    case NodeType::Index: {
        if (!value.is_array())
            return nullptr;
        int64_t idx = node.index;
        if (idx < 0)
            idx += static_cast<int64_t>(value.size());
        if (idx < 0 || idx >= static_cast<int64_t>(value.size()))
            return nullptr;
        return value[static_cast<size_t>(idx)];
    }

    case NodeType::Slice:
        if (!value.is_array())
            return nullptr;
        return slice_array(value, node.slice);

    case NodeType::IndexExpression:
    case NodeType::Pipe:
        return visit(*node.children[1], visit(*node.children[0], value));

    case NodeType::Projection: {
        json base = visit(*node.children[0], value);
        if (!base.is_array())
            return nullptr;
        json collected = json::array();
        for (const auto &element : base) {
            json current = visit(*node.children[1], element);
            if (!current.is_null())
                collected.push_back(std::move(current));
        }
        return collected;
    }

    case NodeType::ValueProjection: {
        json base = visit(*node.children[0], value);
        if (!base.is_object())
            return nullptr;
        json collected = json::array();
        for (const auto &element : base) {
            json current = visit(*node.children[1], element);
            if (!current.is_null())
                collected.push_back(std::move(current));
        }
        return collected;
    }

    case NodeType::FilterProjection: {
        json base = visit(*node.children[0], value);
        if (!base.is_array())
            return nullptr;
        json collected = json::array();
        for (const auto &element : base) {
            if (!is_truthy(visit(*node.children[2], element)))
                continue;
            json current = visit(*node.children[1], element);
            if (!current.is_null())
                collected.push_back(std::move(current));
        }
        return collected;
    }

    case NodeType::Flatten: {
        json base = visit(*node.children[0], value);
        if (!base.is_array())
            return nullptr;
        json merged = json::array();
        for (const auto &element : base) {
            if (element.is_array()) {
                for (const auto &inner : element)
                    merged.push_back(inner);
            } else {
                merged.push_back(element);
            }
        }
        return merged;
    }

    case NodeType::Comparator: {
        json left = visit(*node.children[0], value);
        json right = visit(*node.children[1], value);
        if (node.name == "==")
            return deep_equal(left, right);
        if (node.name == "!=")
            return !deep_equal(left, right);
        if (!left.is_number() || !right.is_number())
            return nullptr;
        double l = left.get<double>();
        double r = right.get<double>();
        if (node.name == "<")
            return l < r;
        if (node.name == "<=")
            return l <= r;
        if (node.name == ">")
            return l > r;
        return l >= r;
    }

    case NodeType::Or: {
        json left = visit(*node.children[0], value);
        return is_truthy(left) ? left : visit(*node.children[1], value);
    }

    case NodeType::And: {
        json left = visit(*node.children[0], value);
        return is_truthy(left) ? visit(*node.children[1], value) : left;
    }

    case NodeType::Not:
        return !is_truthy(visit(*node.children[0], value));

    case NodeType::Literal:
        return node.literal;

    case NodeType::MultiSelectList: {
        if (value.is_null())
            return nullptr;
        json out = json::array();
        for (const auto &child : node.children)
            out.push_back(visit(*child, value));
        return out;
    }

    case NodeType::MultiSelectHash: {
        if (value.is_null())
            return nullptr;
        json out = json::object();
        for (const auto &pair : node.children)
            out[pair->name] = visit(*pair->children[0], value);
        return out;
    }

    case NodeType::KeyValPair:
        return visit(*node.children[0], value);

    case NodeType::Function:
        return call_function(node, value);

    case NodeType::ExpressionRef:
        throw QueryError("Expression reference '&' is only valid as a function argument");
    }
    return nullptr;
}

json QueryEngine::call_function(const QueryNode &node, const json &value) const {
    const FunctionSpec *spec = functions_.find(node.name);
    if (!spec)
        throw QueryError("Unknown function: " + node.name + "()");

    size_t count = node.children.size();
    if (count < spec->min_args || count > spec->max_args) {
        std::string expected = std::to_string(spec->min_args);
        if (spec->max_args == VARIADIC)
            expected = "at least " + expected;
        else if (spec->max_args != spec->min_args)
            expected += " to " + std::to_string(spec->max_args);
        throw QueryError("Function " + node.name + "() expects " + expected +
                         " argument(s), got " + std::to_string(count));
    }

    std::vector<FunctionArg> args;
    args.reserve(count);
    for (const auto &child : node.children) {
        FunctionArg arg;
        if (child->type == NodeType::ExpressionRef) {
            const QueryNode *expr = child->children[0].get();
            arg.expression = [this, expr](const json &item) { return visit(*expr, item); };
        } else {
            arg.value = visit(*child, value);
        }
        args.push_back(std::move(arg));
    }
    return spec->impl(args);
}

QueryResult apply_query(const json &data, const std::string &expression) {
    static const QueryEngine engine;
    return engine.search(data, expression);
}

bool is_truthy(const json &value) {
    if (value.is_null())
        return false;
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_string())
        return !value.get_ref<const std::string &>().empty();
    if (value.is_array() || value.is_object())
        return !value.empty();
    return true;
}

} // namespace arialens
