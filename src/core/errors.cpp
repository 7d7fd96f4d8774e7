#include "regauth/core/errors.hpp"

namespace regauth::core {
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
            case StatusCode::Crypto: return "crypto";
            case StatusCode::Unsupported: return "unsupported";
            case StatusCode::Unavailable: return "unavailable";
            case StatusCode::ReadOnly: return "read_only";
        }
        return "unknown";
    }
} // namespace regauth::core
