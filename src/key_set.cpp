#include "authorizer/key_set.hpp"
#include "authorizer/constants.hpp"
#include "base64url.hpp"
#include "openssl_utils.hpp"
#include <openssl/core_names.h>
#include <spdlog/spdlog.h>
#include <array>
#include <stdexcept>
#include <vector>

namespace authorizer {

using namespace internal;

namespace {
    std::string requireString(const nlohmann::json& jwk, const char* name) {
        auto it = jwk.find(name);
        if (it == jwk.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            throw std::invalid_argument(std::string("JWK field '") + name + "' must be a non-empty string");
        }
        return it->get<std::string>();
    }

    std::vector<std::uint8_t> decodeField(const nlohmann::json& jwk, const char* name) {
        auto encoded = requireString(jwk, name);
        try {
            return base64url_decode(encoded);
        } catch (const std::invalid_argument&) {
            throw std::invalid_argument(std::string("JWK field '") + name + "' is not valid base64url");
        }
    }

    EVP_PKEY* importRsa(const nlohmann::json& jwk) {
        auto n = decodeField(jwk, "n");
        auto e = decodeField(jwk, "e");

        bignum_ptr bn_n{BN_bin2bn(n.data(), static_cast<int>(n.size()), nullptr), BN_free};
        bignum_ptr bn_e{BN_bin2bn(e.data(), static_cast<int>(e.size()), nullptr), BN_free};
        if (!bn_n || !bn_e) {
            throw std::invalid_argument("Cannot read RSA modulus or exponent");
        }

        param_bld_ptr bld{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
        if (!bld ||
            !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, bn_n.get()) ||
            !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, bn_e.get())) {
            throw std::invalid_argument("Cannot build RSA key parameters");
        }
        param_ptr params{OSSL_PARAM_BLD_to_param(bld.get()), OSSL_PARAM_free};
        if (!params) {
            throw std::invalid_argument("Cannot build RSA key parameters");
        }

        evp_pkey_ctx_ptr ctx{EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), EVP_PKEY_CTX_free};
        EVP_PKEY* key = nullptr;
        if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
            EVP_PKEY_fromdata(ctx.get(), &key, EVP_PKEY_PUBLIC_KEY, params.get()) <= 0) {
            throw std::invalid_argument("Cannot create RSA key from JWK");
        }
        return key;
    }

    EVP_PKEY* importEc(const nlohmann::json& jwk, const std::string& crv) {
        const char* group = nullptr;
        std::size_t coordinate_size = 0;
        if (crv == "P-256") {
            group = "prime256v1";
            coordinate_size = 32;
        } else if (crv == "P-384") {
            group = "secp384r1";
            coordinate_size = 48;
        } else {
            throw std::invalid_argument("Unsupported EC curve: " + crv);
        }

        auto x = decodeField(jwk, "x");
        auto y = decodeField(jwk, "y");
        if (x.size() != coordinate_size || y.size() != coordinate_size) {
            throw std::invalid_argument("EC coordinates have the wrong length for " + crv);
        }

        // Uncompressed point encoding: 0x04 || x || y
        std::vector<std::uint8_t> point;
        point.reserve(1 + 2 * coordinate_size);
        point.push_back(0x04);
        point.insert(point.end(), x.begin(), x.end());
        point.insert(point.end(), y.begin(), y.end());

        std::array params{
            OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char*>(group), 0),
            OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()),
            OSSL_PARAM_construct_end()
        };

        evp_pkey_ctx_ptr ctx{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
        EVP_PKEY* key = nullptr;
        if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
            EVP_PKEY_fromdata(ctx.get(), &key, EVP_PKEY_PUBLIC_KEY, params.data()) <= 0) {
            throw std::invalid_argument("Cannot create EC key from JWK (point not on curve?)");
        }
        return key;
    }

    EVP_PKEY* importOkp(const nlohmann::json& jwk, const std::string& crv) {
        if (crv != "Ed25519") {
            throw std::invalid_argument("Unsupported OKP curve: " + crv);
        }

        auto x = decodeField(jwk, "x");
        if (x.size() != 32) {
            throw std::invalid_argument("Ed25519 public key must be 32 bytes");
        }

        EVP_PKEY* key = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, x.data(), x.size());
        if (!key) {
            throw std::invalid_argument("Cannot create Ed25519 key from JWK");
        }
        return key;
    }
}

std::string_view toString(KeyFamily family) {
    switch (family) {
        case KeyFamily::RSA: return "RSA";
        case KeyFamily::EC: return "EC";
        case KeyFamily::OKP: return "OKP";
    }
    return "Unknown";
}

KeyRecord::KeyRecord(std::string kid, KeyFamily family, std::string curve,
                     std::optional<std::string> alg, EVP_PKEY* key)
    : kid_(std::move(kid)), family_(family), curve_(std::move(curve)), alg_(std::move(alg)), key_(key) {}

KeyRecord::~KeyRecord() {
    EVP_PKEY_free(key_);
}

std::shared_ptr<const KeyRecord> importJwk(const nlohmann::json& jwk) {
    if (!jwk.is_object()) {
        throw std::invalid_argument("JWK must be a JSON object");
    }

    auto kid = requireString(jwk, "kid");

    if (auto use = jwk.find("use"); use != jwk.end() && *use != "sig") {
        throw std::invalid_argument("JWK is not a signature key (use != \"sig\")");
    }

    std::optional<std::string> alg;
    if (auto it = jwk.find("alg"); it != jwk.end()) {
        if (!it->is_string()) {
            throw std::invalid_argument("JWK field 'alg' must be a string");
        }
        alg = it->get<std::string>();
    }

    auto kty = requireString(jwk, "kty");
    KeyFamily family;
    std::string curve;
    evp_pkey_ptr key(nullptr, EVP_PKEY_free);

    if (kty == "RSA") {
        family = KeyFamily::RSA;
        key.reset(importRsa(jwk));
    } else if (kty == "EC") {
        family = KeyFamily::EC;
        curve = requireString(jwk, "crv");
        key.reset(importEc(jwk, curve));
    } else if (kty == "OKP") {
        family = KeyFamily::OKP;
        curve = requireString(jwk, "crv");
        key.reset(importOkp(jwk, curve));
    } else {
        throw std::invalid_argument("Unsupported key type: " + kty);
    }

    auto record = std::make_shared<const KeyRecord>(std::move(kid), family, std::move(curve), std::move(alg),
                                                    key.get());
    key.release();
    return record;
}

KeysMap parseKeySet(std::string_view document) {
    if (document.size() > MAX_KEY_SET_SIZE) {
        throw std::invalid_argument("Key set exceeds " + std::to_string(MAX_KEY_SET_SIZE) + " bytes");
    }

    auto value = nlohmann::json::parse(document, nullptr, false);
    if (value.is_discarded() || !value.is_object()) {
        throw std::invalid_argument("Key set is not a JSON object");
    }

    auto keys = value.find("keys");
    if (keys == value.end() || !keys->is_array()) {
        throw std::invalid_argument("Key set has no 'keys' array");
    }

    KeysMap result;
    result.reserve(keys->size());
    for (const auto& jwk : *keys) {
        try {
            auto record = importJwk(jwk);
            auto kid = record->kid();
            result.insert_or_assign(std::move(kid), std::move(record));
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Skipping JWK that cannot be used for verification: {}", e.what());
        }
    }
    return result;
}

}
