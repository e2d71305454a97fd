#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace authorizer::internal {

enum class NodeKind {
    Literal,      // value
    List,         // args = elements
    Ident,        // name
    Select,       // args[0].name
    Index,        // args[0][args[1]]
    Not,          // !args[0]
    Negate,       // -args[0]
    Binary,       // args[0] name args[1]
    And,          // args[0] && args[1]
    Or,           // args[0] || args[1]
    Conditional,  // args[0] ? args[1] : args[2]
    Has,          // has(args[0].name)
    Call,         // name(args...), receiver in args[0] when hasReceiver
    Comprehension // args[0].name(variable, args[1])
};

struct Node {
    NodeKind kind;
    std::size_t position = 0;      // offset in the expression text
    std::size_t depth = 1;         // height of the subtree rooted here
    std::string name;
    std::string variable;          // comprehension iteration variable
    nlohmann::json value;          // literal value
    bool hasReceiver = false;
    std::shared_ptr<const std::regex> pattern;  // precompiled matches() pattern
    std::vector<std::unique_ptr<Node>> args;
};

/// Parse policy text into an AST
/// @throws PolicyCompileError on syntax errors, unknown names or excessive nesting
std::unique_ptr<Node> parsePolicy(std::string_view text);

/// Variable bindings visible during evaluation
struct Scope {
    const Scope* parent;
    std::string_view name;
    const nlohmann::json* value;

    [[nodiscard]] const nlohmann::json* find(std::string_view key) const {
        for (const Scope* s = this; s; s = s->parent) {
            if (s->name == key) return s->value;
        }
        return nullptr;
    }
};

/// Evaluate a node
/// @throws PolicyEvaluationError on type errors, missing fields and bad arguments
nlohmann::json evaluateNode(const Node& node, const Scope& scope);

}
