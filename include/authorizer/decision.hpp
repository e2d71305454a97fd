#pragma once
#include "authorizer/claims.hpp"
#include "authorizer/errors.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace authorizer {

enum class Effect {
    Allow,
    Deny
};

[[nodiscard]] std::string_view toString(Effect effect);

/// Outcome of one authorization request
struct Decision {
    Effect effect = Effect::Deny;
    std::string resource;
    std::string principal;
    std::map<std::string, std::string> context;  // identity context, Allow only
    std::optional<DenyReason> reason;            // diagnostics only, never returned to callers

    [[nodiscard]] bool allowed() const { return effect == Effect::Allow; }

    /**
     * Allow every resource for the principal
     * Context holds jwt_principal, jwt_claims (the compact claim set) and
     * one jwt_claim_<name> entry per top-level claim.
     */
    [[nodiscard]] static Decision allow(const std::string& principal, const TokenClaims& claims);

    /// Deny the requested resource ("*" when unknown)
    [[nodiscard]] static Decision deny(const std::string& resource, DenyReason reason);
};

/**
 * Build the API Gateway token authorizer response
 * {"principalId", "policyDocument": {"Version", "Statement": [{"Action", "Effect", "Resource"}]},
 *  "context", "usageIdentifierKey"}
 */
[[nodiscard]] nlohmann::json toAuthorizerResponse(const Decision& decision, const std::string& usageIdentifierKey);

/// Compact JSON text of a response; invalid UTF-8 from the request is replaced, never thrown on
[[nodiscard]] std::string dumpResponse(const nlohmann::json& response);

} // namespace authorizer
