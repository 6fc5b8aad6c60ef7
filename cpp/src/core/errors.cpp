#include "revive/core/errors.hpp"

#include <cstring>

namespace revive::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::PermissionDenied: return "PermissionDenied";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Paths: return "Paths";
            case StatusDomain::History: return "History";
            case StatusDomain::Placement: return "Placement";
            case StatusDomain::Restore: return "Restore";
            case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }

    std::string status_reason(Status s) {
        if (s.aux != 0) {
            return std::strerror(static_cast<int>(s.aux));
        }
        return status_code_name(s.code);
    }
} // namespace revive::core
