#include "authorizer/errors.hpp"

namespace authorizer {

std::string_view toString(DenyReason reason) {
    switch (reason) {
        case DenyReason::MalformedRequest: return "MalformedRequest";
        case DenyReason::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case DenyReason::KeyNotFound: return "KeyNotFound";
        case DenyReason::UpstreamFetchFailed: return "UpstreamFetchFailed";
        case DenyReason::SignatureInvalid: return "SignatureInvalid";
        case DenyReason::TokenExpired: return "TokenExpired";
        case DenyReason::TokenNotYetValid: return "TokenNotYetValid";
        case DenyReason::IssuerRejected: return "IssuerRejected";
        case DenyReason::AudienceRejected: return "AudienceRejected";
        case DenyReason::PolicyRejected: return "PolicyRejected";
    }
    return "Unknown";
}

}
