#include "tagcache/core/errors.hpp"

namespace tagcache::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Io: return "Io";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Catalog: return "Catalog";
            case StatusDomain::Resolver: return "Resolver";
            case StatusDomain::Invalidation: return "Invalidation";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Db: return "Db";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace tagcache::core
