#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace authorizer {
namespace internal {

/// Encode bytes to Base64 URL format (RFC 4648, no padding)
/// @param data Input bytes to encode
/// @return Base64 URL encoded string (no padding)
std::string base64url_encode(std::span<const std::uint8_t> data);

/// Encode the bytes of a string to Base64 URL format
std::string base64url_encode(std::string_view data);

/// Decode Base64 URL format to bytes (RFC 4648, padding optional)
/// @param input Base64 URL encoded string
/// @return Decoded bytes
/// @throws std::invalid_argument if input is invalid
std::vector<std::uint8_t> base64url_decode(std::string_view input);

/// Decode Base64 URL format into a string (for JSON segments)
/// @throws std::invalid_argument if input is invalid
std::string base64url_decode_string(std::string_view input);

} // namespace internal
} // namespace authorizer
