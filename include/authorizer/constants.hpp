#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace authorizer {

inline constexpr std::string_view VERSION = "1.0.0";

// User-Agent sent with key set requests
inline constexpr const char* USER_AGENT = "oidc-authorizer/1.0.0";

// Authorization header scheme prefix (case-sensitive, single space)
inline constexpr std::string_view BEARER_PREFIX = "Bearer ";

// Maximum token size accepted from a request header (64KB)
inline constexpr std::size_t MAX_TOKEN_SIZE = 64 * 1024;

// Maximum key set document size (1MB)
inline constexpr std::size_t MAX_KEY_SET_SIZE = 1024 * 1024;

// Public-key algorithms the authorizer can verify
inline constexpr std::array<std::string_view, 9> SUPPORTED_ALGORITHMS = {
    "ES256", "ES384", "RS256", "RS384", "PS256", "PS384", "PS512", "RS512", "EdDSA"
};

// Configuration defaults
inline constexpr std::int64_t DEFAULT_MIN_REFRESH_SECONDS = 900;
inline constexpr std::int64_t DEFAULT_FETCH_TIMEOUT_SECONDS = 3;
inline constexpr const char* DEFAULT_PRINCIPAL_CLAIMS = "preferred_username, sub";
inline constexpr const char* DEFAULT_PRINCIPAL_ID = "unknown";

// Resource pattern attached to every Allow decision
inline constexpr const char* ALLOW_ALL_RESOURCES = "*";

// Principal reported on Deny responses
inline constexpr const char* DENIED_PRINCIPAL = "none";

// Authorizer response policy document
inline constexpr const char* POLICY_VERSION = "2012-10-17";
inline constexpr const char* POLICY_ACTION = "execute-api:Invoke";

// Upper bound for every seconds-valued setting; keeps durations representable in steady_clock ticks
inline constexpr std::int64_t MAX_SECONDS_SETTING = 1'000'000'000;

// Strings longer than this are not matched against policy regular expressions
inline constexpr std::size_t MAX_REGEX_SUBJECT_SIZE = 4096;

// Policy expressions deeper than this are rejected at compile time
inline constexpr std::size_t MAX_POLICY_DEPTH = 100;

[[nodiscard]] constexpr bool isSupportedAlgorithm(std::string_view alg) {
    for (auto supported : SUPPORTED_ALGORITHMS) {
        if (supported == alg) return true;
    }
    return false;
}

} // namespace authorizer
