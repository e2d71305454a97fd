#pragma once
#include "authorizer/clock.hpp"
#include "authorizer/config.hpp"
#include "authorizer/decision.hpp"
#include "authorizer/key_cache.hpp"
#include <memory>
#include <optional>
#include <string>

namespace authorizer {

/**
 * The authorization pipeline:
 * extract token, decode header, algorithm gate, key lookup, signature and
 * timing checks, issuer and audience checks, policy, principal, decision.
 * Each stage short-circuits to Deny. Safe to share across threads.
 */
class Handler {
public:
    Handler(std::shared_ptr<const Config> config,
            std::shared_ptr<KeyCache> keys,
            std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    /// Build a handler with a libcurl key fetcher for config.jwksUri
    [[nodiscard]] static std::shared_ptr<Handler> create(std::shared_ptr<const Config> config);

    /**
     * Decide a request. Never throws: every failure becomes a Deny.
     * @param authorizationHeader Value of the Authorization header, if any
     * @param resource The requested resource (e.g. the method ARN)
     */
    [[nodiscard]] Decision authorize(const std::optional<std::string>& authorizationHeader,
                                     const std::string& resource) const;

    [[nodiscard]] const Config& config() const { return *config_; }
    [[nodiscard]] KeyCache& keys() const { return *keys_; }

private:
    Decision evaluate(const std::optional<std::string>& authorizationHeader, const std::string& resource) const;

    std::shared_ptr<const Config> config_;
    std::shared_ptr<KeyCache> keys_;
    std::shared_ptr<const Clock> clock_;
};

} // namespace authorizer
