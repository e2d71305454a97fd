#include "authorizer/principal.hpp"
#include "authorizer/config.hpp"
#include "authorizer/constants.hpp"

namespace authorizer {

PrincipalResolver::PrincipalResolver()
    : PrincipalResolver(splitList(DEFAULT_PRINCIPAL_CLAIMS), DEFAULT_PRINCIPAL_ID) {}

PrincipalResolver::PrincipalResolver(std::vector<std::string> claimNames, std::string defaultPrincipal)
    : claimNames_(std::move(claimNames)), defaultPrincipal_(std::move(defaultPrincipal)) {}

PrincipalResolver PrincipalResolver::fromCommaSeparated(std::string_view claimNames, std::string defaultPrincipal) {
    return PrincipalResolver(splitList(claimNames), std::move(defaultPrincipal));
}

std::string PrincipalResolver::resolve(const TokenClaims& claims) const {
    for (const auto& name : claimNames_) {
        if (const auto* value = claims.find(name)) {
            auto principal = claimToString(*value);
            if (!principal.empty()) {
                return principal;
            }
        }
    }
    return defaultPrincipal_;
}

}
