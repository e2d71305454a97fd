#include "policy_ast.hpp"
#include "authorizer/constants.hpp"
#include "authorizer/errors.hpp"
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>

namespace authorizer::internal {

namespace {
    using json = nlohmann::json;

    [[noreturn]] void fail(const Node& node, const std::string& msg) {
        throw PolicyEvaluationError(msg + " (at offset " + std::to_string(node.position) + ")");
    }

    std::string typeName(const json& value) {
        if (value.is_number_float()) return "double";
        if (value.is_number()) return "int";
        if (value.is_object()) return "map";
        if (value.is_array()) return "list";
        return value.type_name();
    }

    bool isIntegral(const json& value) {
        return value.is_number_integer();  // includes unsigned
    }

    std::optional<std::int64_t> asInt(const json& value) {
        if (value.is_number_unsigned()) {
            auto u = value.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(u);
        }
        return value.get<std::int64_t>();
    }

    // Three-way comparison of two numbers by value
    int compareNumbers(const json& a, const json& b) {
        if (isIntegral(a) && isIntegral(b)) {
            if (a.is_number_unsigned() || b.is_number_unsigned()) {
                // At least one side may exceed int64; negative values sort first
                bool a_neg = !a.is_number_unsigned() && a.get<std::int64_t>() < 0;
                bool b_neg = !b.is_number_unsigned() && b.get<std::int64_t>() < 0;
                if (a_neg != b_neg) return a_neg ? -1 : 1;
                if (a_neg) {
                    auto x = a.get<std::int64_t>(), y = b.get<std::int64_t>();
                    return x < y ? -1 : (x > y ? 1 : 0);
                }
                auto x = a.get<std::uint64_t>(), y = b.get<std::uint64_t>();
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            auto x = a.get<std::int64_t>(), y = b.get<std::int64_t>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        double x = a.get<double>(), y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }

    bool valuesEqual(const json& a, const json& b) {
        if (a.is_number() && b.is_number()) {
            if (a.is_number_float() || b.is_number_float()) {
                return a.get<double>() == b.get<double>();
            }
            return compareNumbers(a, b) == 0;
        }
        if (a.type() != b.type()) {
            return false;
        }
        if (a.is_array()) {
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!valuesEqual(a[i], b[i])) return false;
            }
            return true;
        }
        if (a.is_object()) {
            if (a.size() != b.size()) return false;
            for (auto it = a.begin(); it != a.end(); ++it) {
                auto other = b.find(it.key());
                if (other == b.end() || !valuesEqual(it.value(), *other)) return false;
            }
            return true;
        }
        return a == b;
    }

    std::size_t codePoints(const std::string& s) {
        std::size_t count = 0;
        for (unsigned char c : s) {
            if ((c & 0xC0) != 0x80) ++count;
        }
        return count;
    }

    const json& requireBool(const Node& node, const json& value, const char* context) {
        if (!value.is_boolean()) {
            fail(node, std::string(context) + " requires a bool, got " + typeName(value));
        }
        return value;
    }

    const std::string& requireString(const Node& node, const json& value, const std::string& context) {
        if (!value.is_string()) {
            fail(node, context + " requires a string, got " + typeName(value));
        }
        return value.get_ref<const std::string&>();
    }

    // Evaluation outcome that keeps an error instead of throwing it
    struct Outcome {
        std::optional<json> value;
        std::optional<PolicyEvaluationError> error;
    };

    Outcome tryEvaluate(const Node& node, const Scope& scope) {
        try {
            return Outcome{evaluateNode(node, scope), std::nullopt};
        } catch (const PolicyEvaluationError& e) {
            return Outcome{std::nullopt, e};
        }
    }

    json integerResult(const Node& node, std::int64_t a, std::int64_t b, const std::string& op) {
        std::int64_t result = 0;
        bool overflow = false;
        if (op == "+") {
            overflow = __builtin_add_overflow(a, b, &result);
        } else if (op == "-") {
            overflow = __builtin_sub_overflow(a, b, &result);
        } else if (op == "*") {
            overflow = __builtin_mul_overflow(a, b, &result);
        } else {
            if (b == 0) {
                fail(node, op == "/" ? "division by zero" : "modulus by zero");
            }
            if (a == std::numeric_limits<std::int64_t>::min() && b == -1) {
                overflow = true;
            } else {
                result = op == "/" ? a / b : a % b;
            }
        }
        if (overflow) {
            fail(node, "integer overflow");
        }
        return result;
    }

    json arithmetic(const Node& node, const json& left, const json& right) {
        const std::string& op = node.name;

        if (op == "+" && left.is_string() && right.is_string()) {
            return left.get<std::string>() + right.get<std::string>();
        }
        if (op == "+" && left.is_array() && right.is_array()) {
            json result = left;
            for (const auto& element : right) result.push_back(element);
            return result;
        }

        if (!left.is_number() || !right.is_number()) {
            fail(node, "no such overload: " + typeName(left) + " " + op + " " + typeName(right));
        }

        if (isIntegral(left) && isIntegral(right)) {
            auto a = asInt(left);
            auto b = asInt(right);
            if (!a || !b) {
                fail(node, "integer overflow");
            }
            return integerResult(node, *a, *b, op);
        }

        if (op == "%") {
            fail(node, "no such overload: double % double");
        }
        double a = left.get<double>(), b = right.get<double>();
        if (op == "+") return a + b;
        if (op == "-") return a - b;
        if (op == "*") return a * b;
        return a / b;
    }

    bool ordering(const Node& node, const json& left, const json& right) {
        int cmp = 0;
        if (left.is_number() && right.is_number()) {
            cmp = compareNumbers(left, right);
        } else if (left.is_string() && right.is_string()) {
            cmp = left.get_ref<const std::string&>().compare(right.get_ref<const std::string&>());
        } else if (left.is_boolean() && right.is_boolean()) {
            cmp = static_cast<int>(left.get<bool>()) - static_cast<int>(right.get<bool>());
        } else {
            fail(node, "no such overload: " + typeName(left) + " " + node.name + " " + typeName(right));
        }

        const std::string& op = node.name;
        if (op == "<") return cmp < 0;
        if (op == "<=") return cmp <= 0;
        if (op == ">") return cmp > 0;
        return cmp >= 0;
    }

    bool membership(const Node& node, const json& element, const json& container) {
        if (container.is_array()) {
            for (const auto& item : container) {
                if (valuesEqual(element, item)) return true;
            }
            return false;
        }
        if (container.is_object()) {
            return element.is_string() && container.contains(element.get<std::string>());
        }
        if (container.is_string() && element.is_string()) {
            return container.get_ref<const std::string&>().find(element.get_ref<const std::string&>()) != std::string::npos;
        }
        fail(node, "no such overload: " + typeName(element) + " in " + typeName(container));
    }

    json binaryOp(const Node& node, const Scope& scope) {
        json left = evaluateNode(*node.args[0], scope);
        json right = evaluateNode(*node.args[1], scope);
        const std::string& op = node.name;

        if (op == "==") return valuesEqual(left, right);
        if (op == "!=") return !valuesEqual(left, right);
        if (op == "in") return membership(node, left, right);
        if (op == "<" || op == "<=" || op == ">" || op == ">=") return ordering(node, left, right);
        return arithmetic(node, left, right);
    }

    // CEL logical operators absorb an error when the other side decides the result
    json logical(const Node& node, const Scope& scope, bool is_and) {
        const bool decisive = !is_and;  // false decides &&, true decides ||

        auto left = tryEvaluate(*node.args[0], scope);
        if (left.value && left.value->is_boolean() && left.value->get<bool>() == decisive) {
            return decisive;
        }

        auto right = tryEvaluate(*node.args[1], scope);
        if (right.value && right.value->is_boolean() && right.value->get<bool>() == decisive) {
            return decisive;
        }

        if (left.error) throw *left.error;
        if (right.error) throw *right.error;
        requireBool(node, *left.value, is_and ? "'&&'" : "'||'");
        requireBool(node, *right.value, is_and ? "'&&'" : "'||'");
        return !decisive;
    }

    json selectField(const Node& node, const json& target) {
        if (!target.is_object()) {
            fail(node, "cannot select field '" + node.name + "' from " + typeName(target));
        }
        auto it = target.find(node.name);
        if (it == target.end()) {
            fail(node, "no such key: " + node.name);
        }
        return *it;
    }

    json indexValue(const Node& node, const json& target, const json& key) {
        if (target.is_array()) {
            if (!isIntegral(key)) {
                fail(node, "list index must be an int, got " + typeName(key));
            }
            auto i = asInt(key);
            if (!i || *i < 0 || static_cast<std::size_t>(*i) >= target.size()) {
                fail(node, "index out of range: " + key.dump());
            }
            return target[static_cast<std::size_t>(*i)];
        }
        if (target.is_object()) {
            if (!key.is_string()) {
                fail(node, "map key must be a string, got " + typeName(key));
            }
            auto it = target.find(key.get<std::string>());
            if (it == target.end()) {
                fail(node, "no such key: " + key.get<std::string>());
            }
            return *it;
        }
        fail(node, "cannot index " + typeName(target));
    }

    json toInt(const Node& node, const json& value) {
        if (isIntegral(value)) {
            auto i = asInt(value);
            if (!i) fail(node, "int() overflow");
            return *i;
        }
        if (value.is_number_float()) {
            double d = value.get<double>();
            if (!std::isfinite(d) || d <= -9.223372036854775808e18 || d >= 9.223372036854775807e18) {
                fail(node, "int() overflow");
            }
            return static_cast<std::int64_t>(d);
        }
        if (value.is_string()) {
            const auto& s = value.get_ref<const std::string&>();
            std::int64_t result = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
            if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
                fail(node, "cannot convert '" + s + "' to int");
            }
            return result;
        }
        fail(node, "no such overload: int(" + typeName(value) + ")");
    }

    json toStringValue(const Node& node, const json& value) {
        if (value.is_string()) return value;
        if (value.is_number() || value.is_boolean()) return value.dump();
        fail(node, "no such overload: string(" + typeName(value) + ")");
    }

    json sizeOf(const Node& node, const json& value) {
        if (value.is_string()) return static_cast<std::int64_t>(codePoints(value.get_ref<const std::string&>()));
        if (value.is_array() || value.is_object()) return static_cast<std::int64_t>(value.size());
        fail(node, "no such overload: size(" + typeName(value) + ")");
    }

    json call(const Node& node, const Scope& scope) {
        std::vector<json> args;
        args.reserve(node.args.size());
        for (const auto& arg : node.args) {
            args.push_back(evaluateNode(*arg, scope));
        }

        const std::string& name = node.name;
        if (name == "size") return sizeOf(node, args[0]);
        if (name == "int") return toInt(node, args[0]);
        if (name == "string") return toStringValue(node, args[0]);

        const auto& receiver = requireString(node, args[0], name + "()");
        const auto& argument = requireString(node, args[1], name + "() argument");

        if (name == "startsWith") {
            return receiver.compare(0, argument.size(), argument) == 0 && receiver.size() >= argument.size();
        }
        if (name == "endsWith") {
            return receiver.size() >= argument.size() &&
                   receiver.compare(receiver.size() - argument.size(), argument.size(), argument) == 0;
        }
        if (name == "contains") {
            return receiver.find(argument) != std::string::npos;
        }
        if (name == "matches") {
            // std::regex recurses per input character
            if (receiver.size() > MAX_REGEX_SUBJECT_SIZE || argument.size() > MAX_REGEX_SUBJECT_SIZE) {
                fail(node, "matches() input exceeds " + std::to_string(MAX_REGEX_SUBJECT_SIZE) + " bytes");
            }
            if (node.pattern) {
                return std::regex_search(receiver, *node.pattern);
            }
            try {
                return std::regex_search(receiver, std::regex(argument, std::regex::ECMAScript));
            } catch (const std::regex_error& e) {
                fail(node, std::string("invalid regular expression: ") + e.what());
            }
        }
        fail(node, "unknown function '" + name + "'");
    }

    json comprehension(const Node& node, const Scope& scope) {
        json range = evaluateNode(*node.args[0], scope);

        std::vector<json> items;
        if (range.is_array()) {
            items.assign(range.begin(), range.end());
        } else if (range.is_object()) {
            for (auto it = range.begin(); it != range.end(); ++it) items.emplace_back(it.key());
        } else {
            fail(node, node.name + "() requires a list or map, got " + typeName(range));
        }

        std::size_t matched = 0;
        std::optional<PolicyEvaluationError> error;
        for (const auto& item : items) {
            Scope inner{&scope, node.variable, &item};
            auto outcome = tryEvaluate(*node.args[1], inner);
            if (outcome.value && !outcome.value->is_boolean()) {
                outcome.error = PolicyEvaluationError(node.name + "() predicate must return a bool");
                outcome.value.reset();
            }
            if (!outcome.value) {
                if (node.name == "exists_one") throw *outcome.error;
                if (!error) error = outcome.error;
                continue;
            }

            bool result = outcome.value->get<bool>();
            if (node.name == "exists" && result) return true;
            if (node.name == "all" && !result) return false;
            if (result) ++matched;
        }

        if (error) throw *error;
        if (node.name == "exists") return false;
        if (node.name == "all") return true;
        return matched == 1;
    }
}

nlohmann::json evaluateNode(const Node& node, const Scope& scope) {
    switch (node.kind) {
        case NodeKind::Literal:
            return node.value;

        case NodeKind::List: {
            json list = json::array();
            for (const auto& element : node.args) {
                list.push_back(evaluateNode(*element, scope));
            }
            return list;
        }

        case NodeKind::Ident: {
            const json* value = scope.find(node.name);
            if (!value) {
                fail(node, "undeclared reference to '" + node.name + "'");
            }
            return *value;
        }

        case NodeKind::Select:
            return selectField(node, evaluateNode(*node.args[0], scope));

        case NodeKind::Index: {
            json target = evaluateNode(*node.args[0], scope);
            return indexValue(node, target, evaluateNode(*node.args[1], scope));
        }

        case NodeKind::Not:
            return !requireBool(node, evaluateNode(*node.args[0], scope), "'!'").get<bool>();

        case NodeKind::Negate: {
            json value = evaluateNode(*node.args[0], scope);
            if (value.is_number_float()) return -value.get<double>();
            if (isIntegral(value)) {
                auto i = asInt(value);
                if (!i || *i == std::numeric_limits<std::int64_t>::min()) fail(node, "integer overflow");
                return -*i;
            }
            fail(node, "no such overload: -" + typeName(value));
        }

        case NodeKind::Binary:
            return binaryOp(node, scope);

        case NodeKind::And:
            return logical(node, scope, true);

        case NodeKind::Or:
            return logical(node, scope, false);

        case NodeKind::Conditional: {
            json condition = evaluateNode(*node.args[0], scope);
            requireBool(node, condition, "'?:'");
            return evaluateNode(*node.args[condition.get<bool>() ? 1 : 2], scope);
        }

        case NodeKind::Has: {
            // Any missing segment along the path yields false
            auto target = tryEvaluate(*node.args[0], scope);
            return target.value && target.value->is_object() && target.value->contains(node.name);
        }

        case NodeKind::Call:
            return call(node, scope);

        case NodeKind::Comprehension:
            return comprehension(node, scope);
    }
    fail(node, "unsupported expression");
}

}
