#include "authorizer/token.hpp"
#include "authorizer/constants.hpp"
#include "authorizer/errors.hpp"
#include "token_utils.hpp"
#include <stdexcept>

namespace authorizer {

namespace {
    std::string requireStringField(const nlohmann::json& header, const char* name) {
        auto it = header.find(name);
        if (it == header.end()) {
            throw AuthorizerError(DenyReason::MalformedRequest,
                                  std::string("Missing '") + name + "' in token header");
        }
        if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
            throw AuthorizerError(DenyReason::MalformedRequest,
                                  std::string("Field '") + name + "' in token header must be a non-empty string");
        }
        return it->get<std::string>();
    }
}

std::string extractBearerToken(const std::optional<std::string>& headerValue) {
    if (!headerValue) {
        throw AuthorizerError(DenyReason::MalformedRequest, "Missing authorization header");
    }

    const std::string& value = *headerValue;
    if (value.size() <= BEARER_PREFIX.size() || value.compare(0, BEARER_PREFIX.size(), BEARER_PREFIX) != 0) {
        throw AuthorizerError(DenyReason::MalformedRequest,
                              "Authorization header must start with 'Bearer ' followed by a token");
    }

    std::string token = value.substr(BEARER_PREFIX.size());
    if (token.size() > MAX_TOKEN_SIZE) {
        throw AuthorizerError(DenyReason::MalformedRequest,
                              "Token exceeds " + std::to_string(MAX_TOKEN_SIZE) + " bytes");
    }
    return token;
}

TokenHeader decodeHeader(std::string_view token) {
    using namespace internal;

    nlohmann::json header;
    try {
        auto parts = parseJwt(token);
        header = decodeJsonSegment(parts.header_b64, "header");
    } catch (const std::invalid_argument& e) {
        throw AuthorizerError(DenyReason::MalformedRequest, e.what());
    }

    TokenHeader result;
    result.alg = requireStringField(header, "alg");
    result.kid = requireStringField(header, "kid");
    if (auto typ = header.find("typ"); typ != header.end() && typ->is_string()) {
        result.typ = typ->get<std::string>();
    }
    result.raw = std::move(header);
    return result;
}

TokenClaims decodeClaims(std::string_view token) {
    using namespace internal;

    try {
        auto parts = parseJwt(token);
        return TokenClaims(decodeJsonSegment(parts.payload_b64, "payload"));
    } catch (const std::invalid_argument& e) {
        throw AuthorizerError(DenyReason::MalformedRequest, e.what());
    }
}

}
