#include "authorizer/validation.hpp"
#include <algorithm>
#include <sstream>

namespace authorizer {

void ValidationResult::throwIfInvalid() const {
    if (!valid) {
        throw AuthorizerError(reason.value_or(DenyReason::MalformedRequest),
                              error.value_or("validation failed"));
    }
}

ValidationResult validateExpiration(const TokenClaims& claims, std::int64_t now, std::int64_t clockSkewSeconds) {
    std::optional<std::int64_t> exp;
    try {
        exp = claims.expires();
    } catch (const AuthorizerError& e) {
        return ValidationResult::failure(e.reason(), e.what());
    }

    // No exp claim: the token never expires
    if (!exp) {
        return ValidationResult::success();
    }

    // An exp so large that adding the leeway overflows is beyond any now
    std::int64_t deadline = 0;
    if (!__builtin_add_overflow(*exp, clockSkewSeconds, &deadline) && now >= deadline) {
        std::ostringstream oss;
        oss << "Token has expired (exp: " << *exp << ", now: " << now << ")";
        return ValidationResult::failure(DenyReason::TokenExpired, oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validateNotBefore(const TokenClaims& claims, std::int64_t now, std::int64_t clockSkewSeconds) {
    std::optional<std::int64_t> nbf;
    try {
        nbf = claims.notBefore();
    } catch (const AuthorizerError& e) {
        return ValidationResult::failure(e.reason(), e.what());
    }

    if (!nbf) {
        return ValidationResult::success();
    }

    std::int64_t earliest = 0;
    if (!__builtin_sub_overflow(*nbf, clockSkewSeconds, &earliest) && now < earliest) {
        std::ostringstream oss;
        oss << "Token is not yet valid (nbf: " << *nbf << ", now: " << now << ")";
        return ValidationResult::failure(DenyReason::TokenNotYetValid, oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validateTiming(const TokenClaims& claims, std::int64_t now, const ValidationOptions& opts) {
    if (opts.checkNotBefore) {
        auto nbfResult = validateNotBefore(claims, now, opts.clockSkewSeconds);
        if (!nbfResult.valid) {
            return nbfResult;
        }
    }

    if (opts.checkExpiration) {
        auto expResult = validateExpiration(claims, now, opts.clockSkewSeconds);
        if (!expResult.valid) {
            return expResult;
        }
    }

    return ValidationResult::success();
}

ValidationResult validateIssuer(const TokenClaims& claims, const std::vector<std::string>& accepted) {
    if (accepted.empty()) {
        return ValidationResult::success();
    }

    auto iss = claims.issuer();
    if (!iss) {
        return ValidationResult::failure(DenyReason::IssuerRejected, "Token has no string 'iss' claim");
    }
    if (std::find(accepted.begin(), accepted.end(), *iss) == accepted.end()) {
        return ValidationResult::failure(DenyReason::IssuerRejected, "Issuer '" + *iss + "' is not accepted");
    }

    return ValidationResult::success();
}

ValidationResult validateAudience(const TokenClaims& claims, const std::vector<std::string>& accepted) {
    if (accepted.empty()) {
        return ValidationResult::success();
    }

    for (const auto& aud : claims.audiences()) {
        if (std::find(accepted.begin(), accepted.end(), aud) != accepted.end()) {
            return ValidationResult::success();
        }
    }

    return ValidationResult::failure(DenyReason::AudienceRejected, "Token audience is not accepted");
}

}
