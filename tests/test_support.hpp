#pragma once

#include "authorizer/clock.hpp"
#include "authorizer/key_fetcher.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

typedef struct evp_pkey_st EVP_PKEY;

namespace authorizer::test {

enum class KeyType {
    RSA,
    EC256,
    EC384,
    Ed25519
};

/// Key pair generated at runtime for signing test tokens
class TestKey {
public:
    TestKey(KeyType type, std::string kid);
    ~TestKey();

    TestKey(const TestKey&) = delete;
    TestKey& operator=(const TestKey&) = delete;

    [[nodiscard]] const std::string& kid() const { return kid_; }

    /// Public JWK for this key ("use": "sig"), with "alg" when given
    [[nodiscard]] nlohmann::json jwk(std::optional<std::string> alg = std::nullopt) const;

    /// Sign a token. The header gets "alg", "typ" and this key's "kid" unless already set.
    [[nodiscard]] std::string sign(std::string_view alg, const nlohmann::json& claims,
                                   nlohmann::json header = nlohmann::json::object()) const;

    /// Base64url signature over signingInput
    [[nodiscard]] std::string signature(std::string_view alg, std::string_view signingInput) const;

private:
    KeyType type_;
    std::string kid_;
    EVP_PKEY* key_;
};

// Shared keys, generated once per test binary
const TestKey& rsaKey();
const TestKey& otherRsaKey();
const TestKey& ec256Key();
const TestKey& ec384Key();
const TestKey& ed25519Key();

/// {"keys": [...]} document
std::string keySet(const nlohmann::json::array_t& jwks);

/// Assemble a token from raw header and claims JSON and an already encoded signature
std::string assembleToken(const nlohmann::json& header, const nlohmann::json& claims, std::string_view signature_b64);

/// Current Unix time from the system clock
std::int64_t unixNow();

/// Clock moved by hand
class ManualClock : public Clock {
public:
    explicit ManualClock(std::int64_t unixStart = 1700000000);

    [[nodiscard]] std::chrono::steady_clock::time_point monotonicNow() const override;
    [[nodiscard]] std::int64_t unixNow() const override;

    void advance(std::chrono::seconds delta);

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point monotonic_;
    std::int64_t unix_;
};

/// Fetcher serving a fixed document and counting calls
class FakeFetcher : public KeySetFetcher {
public:
    explicit FakeFetcher(std::string body = R"({"keys": []})");

    [[nodiscard]] std::string fetch(const std::string& url) override;

    void setBody(std::string body);
    void setFailure(std::optional<std::string> message);
    void setDelay(std::chrono::milliseconds delay);

    [[nodiscard]] int calls() const { return calls_.load(); }
    [[nodiscard]] std::string lastUrl() const;

private:
    mutable std::mutex mutex_;
    std::string body_;
    std::optional<std::string> failure_;
    std::chrono::milliseconds delay_{0};
    std::string lastUrl_;
    std::atomic<int> calls_{0};
};

}
