#include "authorizer/claims.hpp"
#include "authorizer/errors.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace authorizer {

namespace {
    std::optional<std::int64_t> numericDate(const nlohmann::json& payload, const char* name) {
        auto it = payload.find(name);
        if (it == payload.end() || it->is_null()) {
            return std::nullopt;
        }

        if (it->is_number_integer() && !it->is_number_unsigned()) {
            return it->get<std::int64_t>();
        }
        if (it->is_number_unsigned()) {
            auto value = it->get<std::uint64_t>();
            constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            return static_cast<std::int64_t>(value > max ? max : value);
        }
        if (it->is_number_float()) {
            double value = it->get<double>();
            // Reject values that cannot be represented as whole seconds
            if (std::isfinite(value) && value > -9.2e18 && value < 9.2e18) {
                return static_cast<std::int64_t>(std::floor(value));
            }
        }

        throw AuthorizerError(DenyReason::MalformedRequest,
                              std::string("Claim '") + name + "' must be a numeric date");
    }

    std::optional<std::string> stringClaim(const nlohmann::json& payload, const char* name) {
        auto it = payload.find(name);
        if (it == payload.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }
}

TokenClaims::TokenClaims(nlohmann::json payload) : payload_(std::move(payload)) {
    if (!payload_.is_object()) {
        throw std::invalid_argument("Token claims must be a JSON object");
    }
}

std::optional<std::string> TokenClaims::issuer() const { return stringClaim(payload_, "iss"); }
std::optional<std::string> TokenClaims::subject() const { return stringClaim(payload_, "sub"); }
std::optional<std::int64_t> TokenClaims::expires() const { return numericDate(payload_, "exp"); }
std::optional<std::int64_t> TokenClaims::notBefore() const { return numericDate(payload_, "nbf"); }

std::vector<std::string> TokenClaims::audiences() const {
    std::vector<std::string> result;
    auto it = payload_.find("aud");
    if (it == payload_.end()) {
        return result;
    }

    if (it->is_string()) {
        result.push_back(it->get<std::string>());
    } else if (it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                result.push_back(entry.get<std::string>());
            }
        }
    }
    return result;
}

bool TokenClaims::contains(const std::string& name) const {
    return payload_.contains(name);
}

const nlohmann::json* TokenClaims::find(const std::string& name) const {
    auto it = payload_.find(name);
    return it == payload_.end() ? nullptr : &*it;
}

std::string TokenClaims::dump() const {
    // Replace invalid UTF-8 instead of throwing from a serialization error
    return payload_.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string claimToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
