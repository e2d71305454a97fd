#include "authorizer/authorizer.hpp"
#include "cmd_args.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

using authorizer::tools::cmd_args;

namespace {

// Command-line options that override environment settings
const std::map<std::string, std::string> kOverrides = {
    {"jwks-uri", "JWKS_URI"},
    {"min-refresh-rate", "MIN_REFRESH_RATE"},
    {"policy", "TOKEN_VALIDATION_CEL"},
    {"log-level", "LOG_LEVEL"}
};

void printUsage() {
    std::cerr << R"(oidc-authorizer - OIDC bearer token authorizer

Usage: oidc-authorizer [command] [options]

Commands:
    (none)                  Read events as JSON lines from stdin and write one
                            response per line:
                            {"authorizationToken": "Bearer ...", "methodArn": "..."}
    --authorize <header>    Authorize a single Authorization header value
    --decode <token>        Print the unverified token header and claims
    --check-config          Validate the configuration and policy, then exit

Options:
    --version, -v           Show version
    --help, -h              Show this help
    --resource <arn>        Resource for --authorize (default: *)
    --jwks-uri <url>        Overrides JWKS_URI
    --min-refresh-rate <s>  Overrides MIN_REFRESH_RATE
    --policy <expr>         Overrides TOKEN_VALIDATION_CEL
    --log-level <level>     Overrides LOG_LEVEL
    --compact               Compact JSON output (for decode)

Environment:
    JWKS_URI (required), ACCEPTED_ISSUERS, ACCEPTED_AUDIENCES, ACCEPTED_ALGORITHMS,
    MIN_REFRESH_RATE (900), PRINCIPAL_ID_CLAIMS ("preferred_username, sub"),
    DEFAULT_PRINCIPAL_ID ("unknown"), TOKEN_VALIDATION_CEL, CLOCK_SKEW_SECONDS (0),
    JWKS_FETCH_TIMEOUT (3), LOG_LEVEL (info)

Examples:
    # Authorize one request
    JWKS_URI=https://issuer.example.com/.well-known/jwks.json \
        oidc-authorizer --authorize "Bearer eyJ..." --resource arn:aws:execute-api:...

    # Check a policy expression
    oidc-authorizer --check-config --jwks-uri https://issuer.example.com/jwks \
        --policy 'claims.email.endsWith("@example.com")'
)";
}

// stdout carries responses, so logs go to stderr
void setupLogging() {
    auto logger = spdlog::stderr_color_mt("oidc-authorizer");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
}

authorizer::Config loadConfig(const cmd_args& args) {
    return authorizer::Config::fromLookup([&args](std::string_view name) -> std::optional<std::string> {
        for (const auto& [option, variable] : kOverrides) {
            if (variable == name) {
                if (auto value = args.value(option)) {
                    return value;
                }
            }
        }
        const char* value = std::getenv(std::string(name).c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

int decodeCommand(const cmd_args& args) {
    std::string token;
    if (auto value = args.value("decode")) {
        token = *value;
    } else if (!args.positional.empty()) {
        token = args.positional[0];
    } else {
        throw std::runtime_error("Token required");
    }

    // Accept a full header value as well as a bare token
    if (token.rfind(authorizer::BEARER_PREFIX, 0) == 0) {
        token = authorizer::extractBearerToken(token);
    }

    auto header = authorizer::decodeHeader(token);
    auto claims = authorizer::decodeClaims(token);

    int indent = args.has("compact") ? -1 : 2;
    nlohmann::json output = {
        {"header", header.raw},
        {"claims", claims.json()}
    };
    std::cout << output.dump(indent) << "\n";
    return 0;
}

int checkConfigCommand(const authorizer::Config& config) {
    nlohmann::json summary = {
        {"jwksUri", config.jwksUri},
        {"acceptedIssuers", config.acceptedIssuers},
        {"acceptedAudiences", config.acceptedAudiences},
        {"acceptedAlgorithms", config.acceptedAlgorithms.values()},
        {"principalClaims", config.principal.claimNames()},
        {"defaultPrincipal", config.principal.defaultPrincipal()},
        {"minRefreshRate", config.minRefreshInterval.count()},
        {"fetchTimeout", config.fetchTimeout.count()},
        {"clockSkewSeconds", config.clockSkewSeconds},
        {"policy", config.policy.expression()},
        {"logLevel", config.logLevel}
    };
    std::cout << summary.dump(2) << "\n";
    return 0;
}

int authorizeCommand(const authorizer::Handler& handler, const cmd_args& args) {
    auto header = args.value("authorize");
    if (!header && !args.positional.empty()) {
        header = args.positional[0];
    }
    if (!header) {
        throw std::runtime_error("Authorization header value required");
    }

    auto resource = args.getOr("resource", authorizer::ALLOW_ALL_RESOURCES);
    auto decision = handler.authorize(header, resource);
    std::cout << authorizer::dumpResponse(authorizer::toAuthorizerResponse(decision, *header)) << "\n";
    return decision.allowed() ? 0 : 2;
}

nlohmann::json handleEvent(const authorizer::Handler& handler, const std::string& line) {
    auto event = nlohmann::json::parse(line, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
        spdlog::info("Denied (MalformedRequest): event is not a JSON object");
        auto decision = authorizer::Decision::deny(authorizer::ALLOW_ALL_RESOURCES,
                                                   authorizer::DenyReason::MalformedRequest);
        return authorizer::toAuthorizerResponse(decision, "");
    }

    std::optional<std::string> header;
    if (auto it = event.find("authorizationToken"); it != event.end() && it->is_string()) {
        header = it->get<std::string>();
    }

    std::string resource = authorizer::ALLOW_ALL_RESOURCES;
    if (auto it = event.find("methodArn"); it != event.end() && it->is_string()) {
        resource = it->get<std::string>();
    }

    auto decision = handler.authorize(header, resource);
    return authorizer::toAuthorizerResponse(decision, header.value_or(""));
}

int serveCommand(const authorizer::Handler& handler) {
    spdlog::info("Serving events from stdin (key set: {})", handler.config().jwksUri);

    std::string line;
    std::size_t events = 0;
    while (std::getline(std::cin, line)) {
        if (authorizer::tools::trim(line).empty()) {
            continue;
        }
        std::cout << authorizer::dumpResponse(handleEvent(handler, line)) << std::endl;
        ++events;
    }

    spdlog::info("Input closed after {} events", events);
    return 0;
}

}

int main(int argc, char* argv[]) {
    try {
        auto args = cmd_args::parse(argc, argv);

        if (args.has("version") || args.has("v")) {
            std::cout << "oidc-authorizer version " << authorizer::VERSION << "\n";
            return 0;
        }

        if (args.has("help") || args.has("h")) {
            printUsage();
            return 0;
        }

        setupLogging();

        if (args.has("decode")) {
            return decodeCommand(args);
        }

        auto config = std::make_shared<const authorizer::Config>(loadConfig(args));
        spdlog::set_level(spdlog::level::from_str(config->logLevel));

        if (args.has("check-config")) {
            return checkConfigCommand(*config);
        }

        auto handler = authorizer::Handler::create(config);

        if (args.has("authorize")) {
            return authorizeCommand(*handler, args);
        }

        return serveCommand(*handler);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
