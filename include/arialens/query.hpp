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
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arialens {

// Raised inside the engine for syntax and runtime failures; QueryEngine
// converts it to QueryResult::error before returning.
class QueryError : public Error {
public:
    using Error::Error;
};

// Outcome of evaluating an expression. On error, value is an empty array.
struct QueryResult {
    json value;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

// Argument passed to a query function: either an evaluated value or an
// expression reference (&expr) that the function applies to its own inputs.
struct FunctionArg {
    json value;
    std::function<json(const json &)> expression;

    bool is_expression() const { return static_cast<bool>(expression); }
};

constexpr size_t VARIADIC = std::numeric_limits<size_t>::max();

struct FunctionSpec {
    size_t min_args = 0;
    size_t max_args = 0; // VARIADIC for no upper bound
    std::function<json(const std::vector<FunctionArg> &args)> impl;
};

// name -> (arity, implementation). Supplied to the engine at construction.
class FunctionTable {
public:

    void add(const std::string &name, FunctionSpec spec);
    const FunctionSpec *find(const std::string &name) const;
    bool contains(const std::string &name) const { return find(name) != nullptr; }

    // Standard JMESPath functions (length, sort_by, contains, ...)
    static FunctionTable builtins();

    // builtins() plus nvl, int, str and regex_replace. regex_replace patterns
    // use ECMAScript syntax (plus a leading "(?i)"); replacements may use
    // \1 or \g<1> group references.
    static FunctionTable with_extensions();

private:

    std::unordered_map<std::string, FunctionSpec> functions_;
};

// Compiled expression tree (defined in query.cpp)
struct QueryNode;

// A parsed expression that can be evaluated against many documents
class CompiledQuery {
public:

    CompiledQuery(std::shared_ptr<const QueryNode> root, std::string expression);

    const std::string &expression() const { return expression_; }

private:

    friend class QueryEngine;

    std::shared_ptr<const QueryNode> root_;
    std::string expression_;
};

// JMESPath-style evaluator over plain data
class QueryEngine {
public:

    explicit QueryEngine(FunctionTable functions = FunctionTable::with_extensions());

    // Parse and evaluate. Never throws for bad expressions or data.
    QueryResult search(const json &data, const std::string &expression) const;

    // Parse only. Throws QueryError on syntax errors.
    CompiledQuery compile(const std::string &expression) const;

    // Evaluate a compiled expression. Throws QueryError on runtime errors.
    json evaluate(const CompiledQuery &query, const json &data) const;

    const FunctionTable &functions() const { return functions_; }

private:

    FunctionTable functions_;

    json visit(const QueryNode &node, const json &value) const;
    json call_function(const QueryNode &node, const json &value) const;
};

// search() with a shared engine carrying the extension functions
QueryResult apply_query(const json &data, const std::string &expression);

// JMESPath truthiness: false, null, "", [] and {} are false
bool is_truthy(const json &value);

} // namespace arialens
