#include "hoststore/core/errors.hpp"

#include <cerrno>

namespace hoststore::core {
    Status status_from_errno(StatusDomain domain, int err) noexcept {
        const u32 aux = static_cast<u32>(err);
        switch (err) {
        case 0:
            return ok_status();
        case ENOENT:
        case ENOTDIR:
            return make_status(domain, StatusCode::NotFound, aux);
        case EACCES:
        case EPERM:
        case EROFS:
            return make_status(domain, StatusCode::PermissionDenied, aux);
        case EEXIST:
        case ENOTEMPTY:
            return make_status(domain, StatusCode::Conflict, aux);
        case EBUSY:
        case ETXTBSY:
            return make_status(domain, StatusCode::Busy, aux);
        case EINVAL:
        case ENAMETOOLONG:
            return make_status(domain, StatusCode::Invalid, aux);
        case EXDEV:
            return make_status(domain, StatusCode::Unsupported, aux);
        default:
            return make_status(domain, StatusCode::Io, aux);
        }
    }

    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::Unknown: return "unknown";
        case StatusCode::Invalid: return "invalid";
        case StatusCode::NotFound: return "not_found";
        case StatusCode::PermissionDenied: return "permission_denied";
        case StatusCode::Conflict: return "conflict";
        case StatusCode::Busy: return "busy";
        case StatusCode::Corrupt: return "corrupt";
        case StatusCode::Io: return "io";
        case StatusCode::Unsupported: return "unsupported";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "core";
        case StatusDomain::Discovery: return "discovery";
        case StatusDomain::Layout: return "layout";
        case StatusDomain::Settings: return "settings";
        case StatusDomain::Relocate: return "relocate";
        case StatusDomain::Db: return "db";
        case StatusDomain::Migrate: return "migrate";
        case StatusDomain::Import: return "import";
        }
        return "unknown";
    }
} // namespace hoststore::core
