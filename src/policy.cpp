#include "authorizer/policy.hpp"
#include "authorizer/errors.hpp"
#include "policy_ast.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace authorizer {

PolicyProgram::PolicyProgram(std::string expression, std::shared_ptr<const internal::Node> root)
    : expression_(std::move(expression)), root_(std::move(root)) {}

PolicyProgram PolicyProgram::compile(std::string_view text) {
    std::shared_ptr<const internal::Node> root = internal::parsePolicy(text);
    return PolicyProgram(std::string(text), std::move(root));
}

nlohmann::json PolicyProgram::evaluate(const nlohmann::json& header, const nlohmann::json& claims) const {
    internal::Scope header_scope{nullptr, "header", &header};
    internal::Scope claims_scope{&header_scope, "claims", &claims};
    return internal::evaluateNode(*root_, claims_scope);
}

PolicyValidator PolicyValidator::fromExpression(std::string_view text) {
    PolicyValidator validator;
    bool blank = std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    if (!blank) {
        validator.program_ = PolicyProgram::compile(text);
        spdlog::debug("Compiled policy expression: {}", text);
    }
    return validator;
}

std::string PolicyValidator::expression() const {
    return program_ ? program_->expression() : std::string();
}

ValidationResult PolicyValidator::validate(const nlohmann::json& header, const TokenClaims& claims) const {
    if (!program_) {
        return ValidationResult::success();
    }

    nlohmann::json result;
    try {
        result = program_->evaluate(header, claims.json());
    } catch (const PolicyEvaluationError& e) {
        return ValidationResult::failure(DenyReason::PolicyRejected,
                                         std::string("Policy evaluation failed: ") + e.what());
    }

    if (!result.is_boolean()) {
        return ValidationResult::failure(DenyReason::PolicyRejected,
                                         "Policy must evaluate to a bool, got " + std::string(result.type_name()));
    }
    if (!result.get<bool>()) {
        return ValidationResult::failure(DenyReason::PolicyRejected,
                                         "Policy '" + program_->expression() + "' evaluated to false");
    }
    return ValidationResult::success();
}

}
