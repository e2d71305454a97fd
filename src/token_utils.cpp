#include "token_utils.hpp"
#include "base64url.hpp"
#include <stdexcept>

namespace authorizer::internal {

TokenParts parseJwt(std::string_view token) {
    // Find the two dots separating header.payload.signature
    size_t first_dot = token.find('.');
    if (first_dot == std::string_view::npos) {
        throw std::invalid_argument("Invalid token format: missing first '.'");
    }

    size_t second_dot = token.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos) {
        throw std::invalid_argument("Invalid token format: missing second '.'");
    }

    // JWE and other multi-part serializations are not accepted
    if (token.find('.', second_dot + 1) != std::string_view::npos) {
        throw std::invalid_argument("Invalid token format: too many parts");
    }

    std::string header_b64(token.substr(0, first_dot));
    std::string payload_b64(token.substr(first_dot + 1, second_dot - first_dot - 1));
    std::string signature_b64(token.substr(second_dot + 1));

    if (header_b64.empty()) {
        throw std::invalid_argument("Invalid token format: empty header");
    }
    if (payload_b64.empty()) {
        throw std::invalid_argument("Invalid token format: empty payload");
    }
    if (signature_b64.empty()) {
        throw std::invalid_argument("Invalid token format: empty signature");
    }

    std::string signing_input(token.substr(0, second_dot));

    return TokenParts{
        std::move(header_b64),
        std::move(payload_b64),
        std::move(signature_b64),
        std::move(signing_input)
    };
}

nlohmann::json decodeJsonSegment(std::string_view segment_b64, std::string_view what) {
    std::string text = base64url_decode_string(segment_b64);

    // Non-throwing parse; a discarded value means malformed JSON
    auto value = nlohmann::json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        throw std::invalid_argument("Token " + std::string(what) + " is not valid JSON");
    }
    if (!value.is_object()) {
        throw std::invalid_argument("Token " + std::string(what) + " must be a JSON object");
    }
    return value;
}

}
