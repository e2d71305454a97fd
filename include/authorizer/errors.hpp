#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace authorizer {

/// Why a request was denied. Reported in logs only; callers see a plain Deny.
enum class DenyReason {
    MalformedRequest,
    UnsupportedAlgorithm,
    KeyNotFound,
    UpstreamFetchFailed,
    SignatureInvalid,
    TokenExpired,
    TokenNotYetValid,
    IssuerRejected,
    AudienceRejected,
    PolicyRejected
};

[[nodiscard]] std::string_view toString(DenyReason reason);

/// Per-request failure raised by a pipeline stage
class AuthorizerError : public std::runtime_error {
public:
    AuthorizerError(DenyReason reason, const std::string& msg)
        : std::runtime_error(msg), reason_(reason) {}

    [[nodiscard]] DenyReason reason() const noexcept { return reason_; }

private:
    DenyReason reason_;
};

/// Invalid configuration detected at startup
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Policy expression that failed to compile
class PolicyCompileError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/// Runtime failure while evaluating a compiled policy
class PolicyEvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace authorizer
