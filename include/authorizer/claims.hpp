#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace authorizer {

/// Decoded token header. Untrusted until the signature has been verified.
struct TokenHeader {
    std::string alg;
    std::string kid;
    std::optional<std::string> typ;
    nlohmann::json raw = nlohmann::json::object();
};

/// Decoded token payload with accessors for the registered claims
class TokenClaims {
public:
    TokenClaims() = default;

    /// @throws std::invalid_argument if payload is not a JSON object
    explicit TokenClaims(nlohmann::json payload);

    /// Get the issuer ("iss"), if present and a string
    [[nodiscard]] std::optional<std::string> issuer() const;

    /// Get the subject ("sub"), if present and a string
    [[nodiscard]] std::optional<std::string> subject() const;

    /// Get the audience values ("aud"). A single string yields one entry,
    /// a list yields its string entries, anything else yields none.
    [[nodiscard]] std::vector<std::string> audiences() const;

    /// Get the expiration time ("exp", Unix seconds)
    /// @throws AuthorizerError(MalformedRequest) if present but not numeric
    [[nodiscard]] std::optional<std::int64_t> expires() const;

    /// Get the not-before time ("nbf", Unix seconds)
    /// @throws AuthorizerError(MalformedRequest) if present but not numeric
    [[nodiscard]] std::optional<std::int64_t> notBefore() const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Get a top-level claim, or nullptr if absent
    [[nodiscard]] const nlohmann::json* find(const std::string& name) const;

    [[nodiscard]] const nlohmann::json& json() const { return payload_; }

    /// Compact serialization of the full claim set
    [[nodiscard]] std::string dump() const;

private:
    nlohmann::json payload_ = nlohmann::json::object();
};

/// String form of a claim value: strings as-is, everything else as compact JSON
[[nodiscard]] std::string claimToString(const nlohmann::json& value);

} // namespace authorizer
