#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

typedef struct evp_pkey_st EVP_PKEY;

namespace authorizer {

/// JWK key type ("kty")
enum class KeyFamily {
    RSA,
    EC,
    OKP
};

[[nodiscard]] std::string_view toString(KeyFamily family);

/// Verification key imported from one JWK. Immutable once built.
class KeyRecord {
public:
    /// Takes ownership of key
    KeyRecord(std::string kid, KeyFamily family, std::string curve,
              std::optional<std::string> alg, EVP_PKEY* key);
    ~KeyRecord();

    KeyRecord(const KeyRecord&) = delete;
    KeyRecord& operator=(const KeyRecord&) = delete;

    [[nodiscard]] const std::string& kid() const { return kid_; }
    [[nodiscard]] KeyFamily family() const { return family_; }

    /// Curve name for EC and OKP keys ("P-256", "P-384", "Ed25519"), empty for RSA
    [[nodiscard]] const std::string& curve() const { return curve_; }

    /// Algorithm declared by the JWK, if any
    [[nodiscard]] const std::optional<std::string>& alg() const { return alg_; }

    [[nodiscard]] EVP_PKEY* key() const { return key_; }

private:
    std::string kid_;
    KeyFamily family_;
    std::string curve_;
    std::optional<std::string> alg_;
    EVP_PKEY* key_;
};

using KeysMap = std::unordered_map<std::string, std::shared_ptr<const KeyRecord>>;

/**
 * Import a single JWK (RFC 7517/7518/8037)
 * Supports RSA (n, e), EC P-256/P-384 (crv, x, y) and OKP Ed25519 (crv, x).
 * @param jwk The JWK object
 * @return The imported key
 * @throws std::invalid_argument if the JWK cannot be used for verification
 */
[[nodiscard]] std::shared_ptr<const KeyRecord> importJwk(const nlohmann::json& jwk);

/**
 * Parse a key set document ({"keys": [...]}) into a kid-indexed map
 * JWKs that cannot be imported are skipped with a warning.
 * @param document The key set JSON text
 * @return Map of key id to key
 * @throws std::invalid_argument if the document is not a key set
 */
[[nodiscard]] KeysMap parseKeySet(std::string_view document);

} // namespace authorizer
