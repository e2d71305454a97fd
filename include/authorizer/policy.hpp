#pragma once
#include "authorizer/claims.hpp"
#include "authorizer/validation.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace authorizer {

namespace internal {
    struct Node;
}

/**
 * Compiled boolean policy expression over the token header and claims.
 *
 * The language is a subset of CEL: literals, field and index access,
 * arithmetic, comparisons, `in`, `&&`/`||` with error absorption, the
 * conditional operator, has(), size(), string helpers, matches(), int(),
 * string() and the exists/all/exists_one quantifiers. Evaluation has no
 * side effects and always terminates.
 */
class PolicyProgram {
public:
    /// @throws PolicyCompileError if the text is not a valid expression
    [[nodiscard]] static PolicyProgram compile(std::string_view text);

    /**
     * Evaluate against a request. The variables `header` and `claims` are bound
     * to the decoded token header and payload.
     * @throws PolicyEvaluationError on type errors, missing fields and bad arguments
     */
    [[nodiscard]] nlohmann::json evaluate(const nlohmann::json& header, const nlohmann::json& claims) const;

    [[nodiscard]] const std::string& expression() const { return expression_; }

private:
    PolicyProgram(std::string expression, std::shared_ptr<const internal::Node> root);

    std::string expression_;
    std::shared_ptr<const internal::Node> root_;
};

/// Optional policy gate. Without an expression every token passes.
class PolicyValidator {
public:
    PolicyValidator() = default;

    /// Empty or whitespace-only text disables the gate
    /// @throws PolicyCompileError if the text is not a valid expression
    [[nodiscard]] static PolicyValidator fromExpression(std::string_view text);

    [[nodiscard]] bool enabled() const { return program_.has_value(); }

    /// Expression text, empty when disabled
    [[nodiscard]] std::string expression() const;

    /// Passes only if the expression evaluates to boolean true
    /// @return ValidationResult (PolicyRejected)
    [[nodiscard]] ValidationResult validate(const nlohmann::json& header, const TokenClaims& claims) const;

private:
    std::optional<PolicyProgram> program_;
};

} // namespace authorizer
