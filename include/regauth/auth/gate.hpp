#pragma once

#include <type_traits>

#include "regauth/core/errors.hpp"
#include "regauth/core/models.hpp"
#include "regauth/core/types.hpp"
#include "regauth/db/db.hpp"

namespace regauth::auth {
    using u8 = regauth::core::u8;
    using u32 = regauth::core::u32;

    // Carried in Status::aux when Status::domain == Auth.
    enum class AuthError : u32 {
        None = 0,
        MalformedToken = 1,
        InvalidOrRevokedToken = 2,
        LegacyTokenRejected = 3,
        InsufficientScope = 4,
        StoreUnavailable = 5,
    };

    inline constexpr u32 kAuthErrorCount = 6;

    // The only distinctions an external caller is allowed to see.
    enum class PublicFailure : u8 {
        None = 0,
        Unauthenticated = 1,
        Forbidden = 2,
        Unavailable = 3,
    };

    struct AuthRequest {
        const char* presented{nullptr};    // raw token, never logged
        regauth::core::EndpointScope endpoint{regauth::core::EndpointScope::None};
        const char* crate_name{nullptr};   // nullptr for endpoints not about one crate
    };

    [[nodiscard]] regauth::core::Status make_auth_status(AuthError e) noexcept;
    [[nodiscard]] AuthError auth_error_of(regauth::core::Status s) noexcept;
    [[nodiscard]] PublicFailure public_failure(AuthError e) noexcept;
    [[nodiscard]] const char* auth_error_name(AuthError e) noexcept;

    // Single pass: parse -> find_and_touch -> scope check.
    // A null out is a Core-domain Invalid, not an authentication outcome.
    regauth::core::Status authenticate(regauth::db::DbHandle db,
        const AuthRequest& request,
        regauth::core::Timestamp now,
        regauth::core::Principal* out) noexcept;

    // Copies the token out of an Authorization header value, dropping an
    // optional "Bearer " scheme. MalformedToken when empty or it does not fit.
    regauth::core::Status bearer_extract(const char* header, char* out, u32 cap) noexcept;

    static_assert(std::is_trivially_copyable_v<AuthRequest>);
    static_assert(std::is_standard_layout_v<AuthRequest>);

} // namespace regauth::auth
