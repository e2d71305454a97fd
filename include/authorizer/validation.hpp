#pragma once

#include "authorizer/claims.hpp"
#include "authorizer/errors.hpp"
#include "authorizer/key_set.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <cstdint>

namespace authorizer {

/**
 * Validation result indicating success or failure with optional error message
 */
struct ValidationResult {
    bool valid;
    std::optional<std::string> error;
    std::optional<DenyReason> reason;

    explicit operator bool() const { return valid; }

    static ValidationResult success() {
        return ValidationResult{true, std::nullopt, std::nullopt};
    }

    static ValidationResult failure(DenyReason reason, const std::string& msg) {
        return ValidationResult{false, msg, reason};
    }

    /// @throws AuthorizerError carrying reason and error if not valid
    void throwIfInvalid() const;
};

/**
 * Options for configuring token timing validation
 */
struct ValidationOptions {
    bool checkExpiration = true;        // Check if the token has expired (exp claim)
    bool checkNotBefore = true;         // Check if the token is not yet valid (nbf claim)
    std::int64_t clockSkewSeconds = 0;  // Allow clock skew tolerance
};

/**
 * Check if a token has expired
 * A token without "exp" never expires. Valid while now < exp + clockSkewSeconds.
 * @param claims The claims to validate
 * @param now Current Unix time in seconds
 * @param clockSkewSeconds Clock skew tolerance in seconds
 * @return ValidationResult (TokenExpired, or MalformedRequest if exp is not numeric)
 */
ValidationResult validateExpiration(const TokenClaims& claims, std::int64_t now, std::int64_t clockSkewSeconds = 0);

/**
 * Check if a token is not yet valid
 * A token without "nbf" is valid immediately. Valid once now >= nbf - clockSkewSeconds.
 * @param claims The claims to validate
 * @param now Current Unix time in seconds
 * @param clockSkewSeconds Clock skew tolerance in seconds
 * @return ValidationResult (TokenNotYetValid, or MalformedRequest if nbf is not numeric)
 */
ValidationResult validateNotBefore(const TokenClaims& claims, std::int64_t now, std::int64_t clockSkewSeconds = 0);

/**
 * Perform time-based validation
 * @param claims The claims to validate
 * @param now Current Unix time in seconds
 * @param opts Validation options
 * @return ValidationResult with details of the first failure
 */
ValidationResult validateTiming(const TokenClaims& claims, std::int64_t now, const ValidationOptions& opts = ValidationOptions{});

/**
 * Check the "iss" claim against the accepted issuers (empty accepts any)
 * @return ValidationResult (IssuerRejected)
 */
ValidationResult validateIssuer(const TokenClaims& claims, const std::vector<std::string>& accepted);

/**
 * Check that the "aud" claim shares a value with the accepted audiences (empty accepts any)
 * @return ValidationResult (AudienceRejected)
 */
ValidationResult validateAudience(const TokenClaims& claims, const std::vector<std::string>& accepted);

/**
 * Verify the token signature with a key from the key set
 * The algorithm must match the key family and curve, and the JWK's own "alg" when it declares one.
 * @param token Compact token "header.payload.signature"
 * @param key Verification key
 * @param alg Algorithm named in the token header
 * @return ValidationResult (SignatureInvalid, or MalformedRequest if the token cannot be split)
 */
ValidationResult verifySignature(std::string_view token, const KeyRecord& key, std::string_view alg);

}
