#include "authorizer/config.hpp"
#include "authorizer/errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace authorizer {

namespace {
    std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    std::int64_t parseSeconds(const Config::Lookup& lookup, const char* name, std::int64_t fallback, std::int64_t minimum) {
        auto raw = lookup(name);
        if (!raw || trim(*raw).empty()) {
            return fallback;
        }

        auto text = trim(*raw);
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            throw ConfigError(std::string(name) + " must be an integer number of seconds, got '" + *raw + "'");
        }
        if (value < minimum) {
            throw ConfigError(std::string(name) + " must be at least " + std::to_string(minimum));
        }
        if (value > MAX_SECONDS_SETTING) {
            throw ConfigError(std::string(name) + " must be at most " + std::to_string(MAX_SECONDS_SETTING));
        }
        return value;
    }

    bool isLogLevel(std::string_view level) {
        static constexpr std::string_view levels[] = {
            "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"
        };
        return std::find(std::begin(levels), std::end(levels), level) != std::end(levels);
    }
}

std::vector<std::string> splitList(std::string_view text) {
    std::vector<std::string> result;
    while (true) {
        auto comma = text.find(',');
        auto entry = trim(text.substr(0, comma));
        if (!entry.empty()) {
            result.emplace_back(entry);
        }
        if (comma == std::string_view::npos) {
            return result;
        }
        text.remove_prefix(comma + 1);
    }
}

AcceptedAlgorithms::AcceptedAlgorithms(std::vector<std::string> algorithms) : algorithms_(std::move(algorithms)) {
    for (const auto& alg : algorithms_) {
        if (!isSupportedAlgorithm(alg)) {
            throw ConfigError("Unsupported algorithm '" + alg + "'. Only public-key algorithms are supported");
        }
    }
}

AcceptedAlgorithms AcceptedAlgorithms::fromCommaSeparated(std::string_view algorithms) {
    return AcceptedAlgorithms(splitList(algorithms));
}

bool AcceptedAlgorithms::isAccepted(std::string_view alg) const {
    if (!isSupportedAlgorithm(alg)) {
        return false;
    }
    return algorithms_.empty() || std::find(algorithms_.begin(), algorithms_.end(), alg) != algorithms_.end();
}

ValidationResult AcceptedAlgorithms::check(std::string_view alg) const {
    if (isAccepted(alg)) {
        return ValidationResult::success();
    }
    return ValidationResult::failure(DenyReason::UnsupportedAlgorithm,
                                     "Unsupported algorithm '" + std::string(alg) + "'");
}

Config Config::fromLookup(const Lookup& lookup) {
    Config config;

    auto uri = lookup("JWKS_URI");
    if (!uri || trim(*uri).empty()) {
        throw ConfigError("JWKS_URI is required");
    }
    config.jwksUri = std::string(trim(*uri));
    if (config.jwksUri.rfind("https://", 0) != 0 && config.jwksUri.rfind("http://", 0) != 0) {
        throw ConfigError("JWKS_URI must be an http:// or https:// URL, got '" + config.jwksUri + "'");
    }

    config.acceptedIssuers = splitList(lookup("ACCEPTED_ISSUERS").value_or(""));
    config.acceptedAudiences = splitList(lookup("ACCEPTED_AUDIENCES").value_or(""));
    config.acceptedAlgorithms = AcceptedAlgorithms::fromCommaSeparated(lookup("ACCEPTED_ALGORITHMS").value_or(""));

    config.principal = PrincipalResolver::fromCommaSeparated(
        lookup("PRINCIPAL_ID_CLAIMS").value_or(DEFAULT_PRINCIPAL_CLAIMS),
        lookup("DEFAULT_PRINCIPAL_ID").value_or(DEFAULT_PRINCIPAL_ID));

    config.minRefreshInterval = std::chrono::seconds(
        parseSeconds(lookup, "MIN_REFRESH_RATE", DEFAULT_MIN_REFRESH_SECONDS, 0));
    config.fetchTimeout = std::chrono::seconds(
        parseSeconds(lookup, "JWKS_FETCH_TIMEOUT", DEFAULT_FETCH_TIMEOUT_SECONDS, 1));
    config.clockSkewSeconds = parseSeconds(lookup, "CLOCK_SKEW_SECONDS", 0, 0);

    config.policy = PolicyValidator::fromExpression(lookup("TOKEN_VALIDATION_CEL").value_or(""));

    if (auto level = lookup("LOG_LEVEL"); level && !trim(*level).empty()) {
        std::string normalized(trim(*level));
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!isLogLevel(normalized)) {
            throw ConfigError("LOG_LEVEL '" + *level + "' is not a valid log level");
        }
        config.logLevel = normalized;
    }

    return config;
}

Config Config::fromEnvironment() {
    return fromLookup([](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

}
