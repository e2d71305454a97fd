#include "authorizer/handler.hpp"
#include "authorizer/errors.hpp"
#include "authorizer/token.hpp"
#include "authorizer/validation.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace authorizer {

Handler::Handler(std::shared_ptr<const Config> config,
                 std::shared_ptr<KeyCache> keys,
                 std::shared_ptr<const Clock> clock)
    : config_(std::move(config)), keys_(std::move(keys)), clock_(std::move(clock)) {
    if (!config_ || !keys_ || !clock_) {
        throw std::invalid_argument("Handler requires a config, a key cache and a clock");
    }
}

std::shared_ptr<Handler> Handler::create(std::shared_ptr<const Config> config) {
    if (!config) {
        throw std::invalid_argument("Handler requires a config");
    }
    auto clock = std::make_shared<SystemClock>();
    auto keys = std::make_shared<KeyCache>(config->jwksUri,
                                           config->minRefreshInterval,
                                           std::make_shared<CurlKeySetFetcher>(config->fetchTimeout),
                                           clock);
    return std::make_shared<Handler>(std::move(config), std::move(keys), std::move(clock));
}

Decision Handler::authorize(const std::optional<std::string>& authorizationHeader, const std::string& resource) const {
    try {
        return evaluate(authorizationHeader, resource);
    } catch (const AuthorizerError& e) {
        spdlog::info("Denied ({}): {}", toString(e.reason()), e.what());
        return Decision::deny(resource, e.reason());
    } catch (const std::exception& e) {
        spdlog::error("Denied after unexpected failure: {}", e.what());
        return Decision::deny(resource, DenyReason::MalformedRequest);
    }
}

Decision Handler::evaluate(const std::optional<std::string>& authorizationHeader, const std::string& resource) const {
    const Config& config = *config_;

    auto token = extractBearerToken(authorizationHeader);
    auto header = decodeHeader(token);

    // Local checks before any key lookup
    config.acceptedAlgorithms.check(header.alg).throwIfInvalid();

    auto key = keys_->lookup(header.kid);

    verifySignature(token, *key, header.alg).throwIfInvalid();

    auto claims = decodeClaims(token);

    ValidationOptions timing;
    timing.clockSkewSeconds = config.clockSkewSeconds;
    validateTiming(claims, clock_->unixNow(), timing).throwIfInvalid();

    validateIssuer(claims, config.acceptedIssuers).throwIfInvalid();
    validateAudience(claims, config.acceptedAudiences).throwIfInvalid();

    config.policy.validate(header.raw, claims).throwIfInvalid();

    auto principal = config.principal.resolve(claims);
    spdlog::debug("Allowed principal '{}' for resource '{}'", principal, resource);
    return Decision::allow(principal, claims);
}

}
