#pragma once
#include "authorizer/claims.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace authorizer {

/// Extract the token from an Authorization header value ("Bearer <token>")
/// @throws AuthorizerError(MalformedRequest) if the header is absent, uses
///         another scheme, carries an empty token or exceeds MAX_TOKEN_SIZE
[[nodiscard]] std::string extractBearerToken(const std::optional<std::string>& headerValue);

/// Decode the token header without verifying the signature.
/// Requires non-empty string "kid" and "alg" fields.
/// @throws AuthorizerError(MalformedRequest) on any decoding failure
[[nodiscard]] TokenHeader decodeHeader(std::string_view token);

/// Decode the token payload without verifying the signature
/// @throws AuthorizerError(MalformedRequest) on any decoding failure
[[nodiscard]] TokenClaims decodeClaims(std::string_view token);

} // namespace authorizer
