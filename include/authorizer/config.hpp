#pragma once
#include "authorizer/constants.hpp"
#include "authorizer/policy.hpp"
#include "authorizer/principal.hpp"
#include "authorizer/validation.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace authorizer {

/// Split a comma separated list, trimming entries and dropping empty ones
[[nodiscard]] std::vector<std::string> splitList(std::string_view text);

/// Signing algorithms accepted by the algorithm gate
class AcceptedAlgorithms {
public:
    /// Accept every supported algorithm
    AcceptedAlgorithms() = default;

    /// @throws ConfigError if a name is not a supported public-key algorithm
    explicit AcceptedAlgorithms(std::vector<std::string> algorithms);

    /// @throws ConfigError if a name is not a supported public-key algorithm
    [[nodiscard]] static AcceptedAlgorithms fromCommaSeparated(std::string_view algorithms);

    /// Supported, and in the configured set when one is configured
    [[nodiscard]] bool isAccepted(std::string_view alg) const;

    /// @return ValidationResult (UnsupportedAlgorithm)
    [[nodiscard]] ValidationResult check(std::string_view alg) const;

    [[nodiscard]] const std::vector<std::string>& values() const { return algorithms_; }
    [[nodiscard]] bool empty() const { return algorithms_.empty(); }

private:
    std::vector<std::string> algorithms_;
};

/// Authorizer configuration. Built once at startup and shared read-only.
struct Config {
    std::string jwksUri;
    std::vector<std::string> acceptedIssuers;    // empty accepts any issuer
    std::vector<std::string> acceptedAudiences;  // empty accepts any audience
    AcceptedAlgorithms acceptedAlgorithms;
    PrincipalResolver principal;
    std::chrono::seconds minRefreshInterval{DEFAULT_MIN_REFRESH_SECONDS};
    std::chrono::seconds fetchTimeout{DEFAULT_FETCH_TIMEOUT_SECONDS};
    std::int64_t clockSkewSeconds = 0;
    PolicyValidator policy;
    std::string logLevel = "info";

    using Lookup = std::function<std::optional<std::string>(std::string_view)>;

    /**
     * Load configuration from named settings (JWKS_URI, ACCEPTED_ISSUERS, ...)
     * @param lookup Returns the value of a setting, or nullopt if unset
     * @throws ConfigError on missing or invalid settings
     * @throws PolicyCompileError if TOKEN_VALIDATION_CEL does not compile
     */
    [[nodiscard]] static Config fromLookup(const Lookup& lookup);

    /// Load configuration from the process environment
    [[nodiscard]] static Config fromEnvironment();
};

} // namespace authorizer
