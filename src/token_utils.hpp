#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace authorizer::internal {

/// Parsed compact JWS components
struct TokenParts {
    std::string header_b64;
    std::string payload_b64;
    std::string signature_b64;
    std::string signing_input;  // "header.payload"
};

/// Parse a token into its components
/// @param token Token in format "header.payload.signature"
/// @return TokenParts structure with separated components
/// @throws std::invalid_argument if the token format is invalid
TokenParts parseJwt(std::string_view token);

/// Decode a Base64 URL segment holding a JSON object
/// @param segment_b64 Encoded segment
/// @param what Segment name used in error messages ("header", "payload")
/// @return Parsed JSON object
/// @throws std::invalid_argument if the segment is not valid base64url or not a JSON object
nlohmann::json decodeJsonSegment(std::string_view segment_b64, std::string_view what);

}
