#include "authorizer/decision.hpp"
#include "authorizer/constants.hpp"

namespace authorizer {

std::string_view toString(Effect effect) {
    return effect == Effect::Allow ? "Allow" : "Deny";
}

Decision Decision::allow(const std::string& principal, const TokenClaims& claims) {
    Decision decision;
    decision.effect = Effect::Allow;
    decision.resource = ALLOW_ALL_RESOURCES;
    decision.principal = principal;

    decision.context["jwt_principal"] = principal;
    decision.context["jwt_claims"] = claims.dump();
    for (auto it = claims.json().begin(); it != claims.json().end(); ++it) {
        decision.context["jwt_claim_" + it.key()] = claimToString(it.value());
    }
    return decision;
}

Decision Decision::deny(const std::string& resource, DenyReason reason) {
    Decision decision;
    decision.effect = Effect::Deny;
    decision.resource = resource.empty() ? std::string(ALLOW_ALL_RESOURCES) : resource;
    decision.principal = DENIED_PRINCIPAL;
    decision.reason = reason;
    return decision;
}

nlohmann::json toAuthorizerResponse(const Decision& decision, const std::string& usageIdentifierKey) {
    nlohmann::json statement = {
        {"Action", POLICY_ACTION},
        {"Effect", std::string(toString(decision.effect))},
        {"Resource", decision.resource}
    };

    return nlohmann::json{
        {"principalId", decision.allowed() ? decision.principal : std::string(DENIED_PRINCIPAL)},
        {"policyDocument", {
            {"Version", POLICY_VERSION},
            {"Statement", nlohmann::json::array({statement})}
        }},
        {"context", decision.context},
        {"usageIdentifierKey", usageIdentifierKey}
    };
}

std::string dumpResponse(const nlohmann::json& response) {
    return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
