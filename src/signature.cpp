#include "authorizer/validation.hpp"
#include "base64url.hpp"
#include "openssl_utils.hpp"
#include "token_utils.hpp"
#include <openssl/err.h>
#include <openssl/rsa.h>
#include <stdexcept>
#include <vector>

namespace authorizer {

using namespace internal;

namespace {
    enum class Scheme {
        Pkcs1,
        Pss,
        Ecdsa,
        Ed25519
    };

    struct AlgorithmSpec {
        Scheme scheme;
        const EVP_MD* md;
        KeyFamily family;
        const char* curve;            // required curve for EC/OKP, nullptr for RSA
        std::size_t coordinateSize;   // ECDSA r and s length
    };

    std::optional<AlgorithmSpec> lookupAlgorithm(std::string_view alg) {
        if (alg == "RS256") return AlgorithmSpec{Scheme::Pkcs1, EVP_sha256(), KeyFamily::RSA, nullptr, 0};
        if (alg == "RS384") return AlgorithmSpec{Scheme::Pkcs1, EVP_sha384(), KeyFamily::RSA, nullptr, 0};
        if (alg == "RS512") return AlgorithmSpec{Scheme::Pkcs1, EVP_sha512(), KeyFamily::RSA, nullptr, 0};
        if (alg == "PS256") return AlgorithmSpec{Scheme::Pss, EVP_sha256(), KeyFamily::RSA, nullptr, 0};
        if (alg == "PS384") return AlgorithmSpec{Scheme::Pss, EVP_sha384(), KeyFamily::RSA, nullptr, 0};
        if (alg == "PS512") return AlgorithmSpec{Scheme::Pss, EVP_sha512(), KeyFamily::RSA, nullptr, 0};
        if (alg == "ES256") return AlgorithmSpec{Scheme::Ecdsa, EVP_sha256(), KeyFamily::EC, "P-256", 32};
        if (alg == "ES384") return AlgorithmSpec{Scheme::Ecdsa, EVP_sha384(), KeyFamily::EC, "P-384", 48};
        if (alg == "EdDSA") return AlgorithmSpec{Scheme::Ed25519, nullptr, KeyFamily::OKP, "Ed25519", 0};
        return std::nullopt;
    }

    // JOSE ECDSA signatures are r || s; OpenSSL verifies DER
    std::optional<std::vector<std::uint8_t>> ecdsaToDer(const std::vector<std::uint8_t>& raw, std::size_t coordinateSize) {
        if (raw.size() != 2 * coordinateSize) {
            return std::nullopt;
        }

        ecdsa_sig_ptr sig{ECDSA_SIG_new(), ECDSA_SIG_free};
        bignum_ptr r{BN_bin2bn(raw.data(), static_cast<int>(coordinateSize), nullptr), BN_free};
        bignum_ptr s{BN_bin2bn(raw.data() + coordinateSize, static_cast<int>(coordinateSize), nullptr), BN_free};
        if (!sig || !r || !s || ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
            return std::nullopt;
        }
        // ECDSA_SIG_set0 took ownership
        r.release();
        s.release();

        int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
        if (der_len <= 0) {
            return std::nullopt;
        }
        std::vector<std::uint8_t> der(static_cast<std::size_t>(der_len));
        auto* der_ptr = der.data();
        i2d_ECDSA_SIG(sig.get(), &der_ptr);
        return der;
    }
}

ValidationResult verifySignature(std::string_view token, const KeyRecord& key, std::string_view alg) {
    TokenParts parts;
    try {
        parts = parseJwt(token);
    } catch (const std::invalid_argument& e) {
        return ValidationResult::failure(DenyReason::MalformedRequest, e.what());
    }

    auto spec = lookupAlgorithm(alg);
    if (!spec) {
        return ValidationResult::failure(DenyReason::SignatureInvalid,
                                         "Unsupported algorithm: " + std::string(alg));
    }

    if (key.family() != spec->family || (spec->curve && key.curve() != spec->curve)) {
        return ValidationResult::failure(DenyReason::SignatureInvalid,
                                         "Algorithm " + std::string(alg) + " cannot be used with a "
                                         + std::string(toString(key.family())) + " key"
                                         + (key.curve().empty() ? "" : " on " + key.curve()));
    }

    if (key.alg() && *key.alg() != alg) {
        return ValidationResult::failure(DenyReason::SignatureInvalid,
                                         "Key '" + key.kid() + "' is restricted to " + *key.alg());
    }

    std::vector<std::uint8_t> signature;
    try {
        signature = base64url_decode(parts.signature_b64);
    } catch (const std::invalid_argument&) {
        return ValidationResult::failure(DenyReason::SignatureInvalid, "Signature is not valid base64url");
    }

    if (spec->scheme == Scheme::Ecdsa) {
        auto der = ecdsaToDer(signature, spec->coordinateSize);
        if (!der) {
            return ValidationResult::failure(DenyReason::SignatureInvalid, "Malformed ECDSA signature");
        }
        signature = std::move(*der);
    }

    evp_md_ctx_ptr ctx{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    EVP_PKEY_CTX* pkey_ctx = nullptr;  // owned by ctx
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), &pkey_ctx, spec->md, nullptr, key.key()) != 1) {
        return ValidationResult::failure(DenyReason::SignatureInvalid, "Cannot initialize signature verification");
    }

    if (spec->scheme == Scheme::Pss) {
        if (EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_pss_saltlen(pkey_ctx, RSA_PSS_SALTLEN_DIGEST) <= 0) {
            return ValidationResult::failure(DenyReason::SignatureInvalid, "Cannot configure RSA-PSS");
        }
    } else if (spec->scheme == Scheme::Pkcs1) {
        if (EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PADDING) <= 0) {
            return ValidationResult::failure(DenyReason::SignatureInvalid, "Cannot configure RSA padding");
        }
    }

    const auto* message = reinterpret_cast<const unsigned char*>(parts.signing_input.data());
    if (EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message, parts.signing_input.size()) != 1) {
        ERR_clear_error();
        return ValidationResult::failure(DenyReason::SignatureInvalid, "Signature verification failed");
    }

    return ValidationResult::success();
}

}
