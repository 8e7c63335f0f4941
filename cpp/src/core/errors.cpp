#include "ferry/core/errors.hpp"

namespace ferry::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Invalid: return "ValidationError";
            case StatusCode::TooLarge: return "ValidationError";
            case StatusCode::Unsupported: return "ValidationError";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Unauthenticated: return "AuthRequired";
            case StatusCode::PermissionDenied: return "AuthFailed";
            case StatusCode::Conflict: return "OffsetMismatch";
            case StatusCode::Busy: return "Busy";
            case StatusCode::NoSpace: return "StorageFull";
            case StatusCode::Gone: return "NotResumable";
            case StatusCode::AddressInUse: return "BindConflict";
            case StatusCode::Io: return "InternalIO";
            case StatusCode::Corrupt: return "InternalIO";
            case StatusCode::Network: return "Network";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::Unknown: return "Unknown";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "core";
            case StatusDomain::Storage: return "storage";
            case StatusDomain::Db: return "db";
            case StatusDomain::Security: return "security";
            case StatusDomain::Protocol: return "protocol";
            case StatusDomain::Net: return "net";
            case StatusDomain::Cli: return "cli";
            case StatusDomain::External: return "external";
        }
        return "unknown";
    }
} // namespace ferry::core
