#pragma once
#include "authorizer/claims.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace authorizer {

/// Picks the principal id from an ordered list of claim names
class PrincipalResolver {
public:
    PrincipalResolver();
    PrincipalResolver(std::vector<std::string> claimNames, std::string defaultPrincipal);

    /// Parse "preferred_username, sub" style lists (entries trimmed, empty entries dropped)
    [[nodiscard]] static PrincipalResolver fromCommaSeparated(std::string_view claimNames, std::string defaultPrincipal);

    /**
     * Resolve the principal for a claim set
     * Returns the first configured claim that is present with a non-empty string form
     * (strings as-is, other values as compact JSON), else the default principal.
     */
    [[nodiscard]] std::string resolve(const TokenClaims& claims) const;

    [[nodiscard]] const std::vector<std::string>& claimNames() const { return claimNames_; }
    [[nodiscard]] const std::string& defaultPrincipal() const { return defaultPrincipal_; }

private:
    std::vector<std::string> claimNames_;
    std::string defaultPrincipal_;
};

} // namespace authorizer
