#include <gtest/gtest.h>
#include "authorizer/config.hpp"
#include "authorizer/errors.hpp"
#include <map>

using namespace authorizer;

namespace {

Config::Lookup settings(std::map<std::string, std::string> values) {
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        auto it = values.find(std::string(name));
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}

// ============================================================================
// splitList
// ============================================================================

TEST(SplitListTest, TrimsAndDropsEmptyEntries) {
    EXPECT_EQ(splitList(" a , b,,c ,"), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(SplitListTest, EmptyText) {
    EXPECT_TRUE(splitList("").empty());
    EXPECT_TRUE(splitList(" , ,").empty());
}

TEST(SplitListTest, SingleEntry) {
    EXPECT_EQ(splitList("https://issuer.example.com"), std::vector<std::string>{"https://issuer.example.com"});
}

// ============================================================================
// AcceptedAlgorithms
// ============================================================================

TEST(AcceptedAlgorithmsTest, EmptyAcceptsEverySupportedAlgorithm) {
    AcceptedAlgorithms algorithms;

    for (auto alg : SUPPORTED_ALGORITHMS) {
        EXPECT_TRUE(algorithms.isAccepted(alg)) << alg;
    }
    EXPECT_FALSE(algorithms.isAccepted("HS256"));
    EXPECT_FALSE(algorithms.isAccepted("none"));
}

TEST(AcceptedAlgorithmsTest, ConfiguredSubset) {
    auto algorithms = AcceptedAlgorithms::fromCommaSeparated("RS256, ES256");

    EXPECT_TRUE(algorithms.isAccepted("RS256"));
    EXPECT_TRUE(algorithms.isAccepted("ES256"));
    EXPECT_FALSE(algorithms.isAccepted("PS256"));

    auto result = algorithms.check("EdDSA");
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.reason.has_value());
    EXPECT_EQ(*result.reason, DenyReason::UnsupportedAlgorithm);
}

TEST(AcceptedAlgorithmsTest, SymmetricAlgorithmIsConfigError) {
    EXPECT_THROW(AcceptedAlgorithms::fromCommaSeparated("RS256,HS256"), ConfigError);
    EXPECT_THROW(AcceptedAlgorithms({"none"}), ConfigError);
}

// ============================================================================
// Config::fromLookup
// ============================================================================

TEST(ConfigTest, Defaults) {
    auto config = Config::fromLookup(settings({{"JWKS_URI", "https://issuer.example.com/jwks"}}));

    EXPECT_EQ(config.jwksUri, "https://issuer.example.com/jwks");
    EXPECT_TRUE(config.acceptedIssuers.empty());
    EXPECT_TRUE(config.acceptedAudiences.empty());
    EXPECT_TRUE(config.acceptedAlgorithms.empty());
    EXPECT_EQ(config.principal.claimNames(), (std::vector<std::string>{"preferred_username", "sub"}));
    EXPECT_EQ(config.principal.defaultPrincipal(), "unknown");
    EXPECT_EQ(config.minRefreshInterval, std::chrono::seconds(900));
    EXPECT_EQ(config.fetchTimeout, std::chrono::seconds(3));
    EXPECT_EQ(config.clockSkewSeconds, 0);
    EXPECT_FALSE(config.policy.enabled());
    EXPECT_EQ(config.logLevel, "info");
}

TEST(ConfigTest, AllSettings) {
    auto config = Config::fromLookup(settings({
        {"JWKS_URI", " http://localhost:8080/keys "},
        {"ACCEPTED_ISSUERS", "https://a, https://b"},
        {"ACCEPTED_AUDIENCES", "api"},
        {"ACCEPTED_ALGORITHMS", "ES256"},
        {"MIN_REFRESH_RATE", "60"},
        {"PRINCIPAL_ID_CLAIMS", "email"},
        {"DEFAULT_PRINCIPAL_ID", "anonymous"},
        {"TOKEN_VALIDATION_CEL", "claims.sub == \"alice\""},
        {"CLOCK_SKEW_SECONDS", "30"},
        {"JWKS_FETCH_TIMEOUT", "5"},
        {"LOG_LEVEL", "DEBUG"}
    }));

    EXPECT_EQ(config.jwksUri, "http://localhost:8080/keys");
    EXPECT_EQ(config.acceptedIssuers, (std::vector<std::string>{"https://a", "https://b"}));
    EXPECT_EQ(config.acceptedAudiences, std::vector<std::string>{"api"});
    EXPECT_EQ(config.acceptedAlgorithms.values(), std::vector<std::string>{"ES256"});
    EXPECT_EQ(config.minRefreshInterval, std::chrono::seconds(60));
    EXPECT_EQ(config.principal.claimNames(), std::vector<std::string>{"email"});
    EXPECT_EQ(config.principal.defaultPrincipal(), "anonymous");
    EXPECT_TRUE(config.policy.enabled());
    EXPECT_EQ(config.policy.expression(), "claims.sub == \"alice\"");
    EXPECT_EQ(config.clockSkewSeconds, 30);
    EXPECT_EQ(config.fetchTimeout, std::chrono::seconds(5));
    EXPECT_EQ(config.logLevel, "debug");
}

TEST(ConfigTest, MissingJwksUri) {
    EXPECT_THROW(Config::fromLookup(settings({})), ConfigError);
    EXPECT_THROW(Config::fromLookup(settings({{"JWKS_URI", "  "}})), ConfigError);
}

TEST(ConfigTest, JwksUriMustBeHttp) {
    EXPECT_THROW(Config::fromLookup(settings({{"JWKS_URI", "file:///etc/keys.json"}})), ConfigError);
    EXPECT_THROW(Config::fromLookup(settings({{"JWKS_URI", "issuer.example.com/jwks"}})), ConfigError);
}

TEST(ConfigTest, InvalidRefreshRate) {
    auto base = std::map<std::string, std::string>{{"JWKS_URI", "https://issuer/jwks"}};

    auto notNumber = base;
    notNumber["MIN_REFRESH_RATE"] = "fifteen";
    EXPECT_THROW(Config::fromLookup(settings(notNumber)), ConfigError);

    auto trailing = base;
    trailing["MIN_REFRESH_RATE"] = "90s";
    EXPECT_THROW(Config::fromLookup(settings(trailing)), ConfigError);

    auto negative = base;
    negative["MIN_REFRESH_RATE"] = "-1";
    EXPECT_THROW(Config::fromLookup(settings(negative)), ConfigError);
}

TEST(ConfigTest, RefreshRateUpperBound) {
    auto base = std::map<std::string, std::string>{{"JWKS_URI", "https://issuer/jwks"}};

    auto huge = base;
    huge["MIN_REFRESH_RATE"] = "9300000000";
    EXPECT_THROW((void)Config::fromLookup(settings(huge)), ConfigError);

    auto skew = base;
    skew["CLOCK_SKEW_SECONDS"] = "9223372036854775807";
    EXPECT_THROW((void)Config::fromLookup(settings(skew)), ConfigError);

    auto atLimit = base;
    atLimit["MIN_REFRESH_RATE"] = std::to_string(MAX_SECONDS_SETTING);
    EXPECT_EQ(Config::fromLookup(settings(atLimit)).minRefreshInterval, std::chrono::seconds(MAX_SECONDS_SETTING));
}

TEST(ConfigTest, ZeroRefreshRateIsAllowed) {
    auto config = Config::fromLookup(settings({{"JWKS_URI", "https://issuer/jwks"}, {"MIN_REFRESH_RATE", "0"}}));
    EXPECT_EQ(config.minRefreshInterval, std::chrono::seconds(0));
}

TEST(ConfigTest, FetchTimeoutMustBePositive) {
    EXPECT_THROW(Config::fromLookup(settings({{"JWKS_URI", "https://issuer/jwks"}, {"JWKS_FETCH_TIMEOUT", "0"}})),
                 ConfigError);
}

TEST(ConfigTest, UnsupportedAlgorithmSetting) {
    EXPECT_THROW(Config::fromLookup(settings({{"JWKS_URI", "https://issuer/jwks"}, {"ACCEPTED_ALGORITHMS", "HS512"}})),
                 ConfigError);
}

TEST(ConfigTest, InvalidPolicyIsCompileError) {
    EXPECT_THROW(Config::fromLookup(settings({{"JWKS_URI", "https://issuer/jwks"},
                                              {"TOKEN_VALIDATION_CEL", "invalid syntax {{{{"}})),
                 PolicyCompileError);
}

TEST(ConfigTest, BlankPolicyDisablesGate) {
    auto config = Config::fromLookup(settings({{"JWKS_URI", "https://issuer/jwks"}, {"TOKEN_VALIDATION_CEL", "   "}}));
    EXPECT_FALSE(config.policy.enabled());
    EXPECT_EQ(config.policy.expression(), "");
}

TEST(ConfigTest, InvalidLogLevel) {
    EXPECT_THROW(Config::fromLookup(settings({{"JWKS_URI", "https://issuer/jwks"}, {"LOG_LEVEL", "verbose"}})),
                 ConfigError);
}

TEST(ConfigTest, EmptyPrincipalClaimsUsesDefaultPrincipal) {
    auto config = Config::fromLookup(settings({{"JWKS_URI", "https://issuer/jwks"}, {"PRINCIPAL_ID_CLAIMS", ""}}));

    EXPECT_TRUE(config.principal.claimNames().empty());
    EXPECT_EQ(config.principal.resolve(TokenClaims(nlohmann::json{{"sub", "alice"}})), "unknown");
}

// ============================================================================
// PrincipalResolver
// ============================================================================

TEST(PrincipalResolverTest, FirstPresentClaimWins) {
    PrincipalResolver resolver;

    EXPECT_EQ(resolver.resolve(TokenClaims(nlohmann::json{{"preferred_username", "alice"}, {"sub", "123"}})), "alice");
    EXPECT_EQ(resolver.resolve(TokenClaims(nlohmann::json{{"sub", "123"}})), "123");
}

TEST(PrincipalResolverTest, EmptyValueFallsThrough) {
    PrincipalResolver resolver;
    EXPECT_EQ(resolver.resolve(TokenClaims(nlohmann::json{{"preferred_username", ""}, {"sub", "123"}})), "123");
}

TEST(PrincipalResolverTest, NonStringValueUsesJson) {
    auto resolver = PrincipalResolver::fromCommaSeparated("uid", "nobody");
    EXPECT_EQ(resolver.resolve(TokenClaims(nlohmann::json{{"uid", 42}})), "42");
}

TEST(PrincipalResolverTest, DefaultWhenNothingMatches) {
    auto resolver = PrincipalResolver::fromCommaSeparated("email, upn", "nobody");
    EXPECT_EQ(resolver.resolve(TokenClaims(nlohmann::json{{"sub", "123"}})), "nobody");
}
