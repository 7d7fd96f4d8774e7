#include "regauth/auth/gate.hpp"

#include <cstring>

#include "regauth/core/log.hpp"
#include "regauth/security/digest.hpp"
#include "regauth/security/scopes.hpp"
#include "regauth/security/token.hpp"
#include "regauth/storage/token_store.hpp"

namespace regauth::auth {
    using regauth::core::Status;
    using regauth::core::StatusCode;
    using regauth::core::StatusDomain;

    namespace {
        [[nodiscard]] StatusCode code_for(AuthError e) noexcept {
            switch (e) {
                case AuthError::None: return StatusCode::Ok;
                case AuthError::MalformedToken: return StatusCode::Invalid;
                case AuthError::InvalidOrRevokedToken: return StatusCode::NotFound;
                case AuthError::LegacyTokenRejected: return StatusCode::Invalid;
                case AuthError::InsufficientScope: return StatusCode::PermissionDenied;
                case AuthError::StoreUnavailable: return StatusCode::Unavailable;
            }
            return StatusCode::Unknown;
        }

        // Tries every known kind in priority order.
        [[nodiscard]] bool parse_any_kind(const char* presented, regauth::core::Hash256* digest,
            regauth::core::TokenKind* kind) noexcept {
            for (u32 i = 0; i < regauth::security::token_kind_count(); ++i) {
                const regauth::security::TokenKindInfo& info = regauth::security::token_kind_at(i);
                if (regauth::core::is_ok(regauth::security::token_parse(info.kind, presented, digest))) {
                    *kind = info.kind;
                    return true;
                }
            }
            return false;
        }
    } // namespace

    Status make_auth_status(AuthError e) noexcept {
        if (e == AuthError::None) {
            return regauth::core::ok_status();
        }
        return regauth::core::make_status(StatusDomain::Auth, code_for(e), static_cast<u32>(e));
    }

    AuthError auth_error_of(Status s) noexcept {
        if (regauth::core::is_ok(s)) {
            return AuthError::None;
        }
        if (s.domain != StatusDomain::Auth || s.aux == 0 || s.aux >= kAuthErrorCount) {
            return AuthError::StoreUnavailable;
        }
        return static_cast<AuthError>(s.aux);
    }

    PublicFailure public_failure(AuthError e) noexcept {
        switch (e) {
            case AuthError::None: return PublicFailure::None;
            case AuthError::MalformedToken:
            case AuthError::InvalidOrRevokedToken:
            case AuthError::LegacyTokenRejected:
                return PublicFailure::Unauthenticated;
            case AuthError::InsufficientScope: return PublicFailure::Forbidden;
            case AuthError::StoreUnavailable: return PublicFailure::Unavailable;
        }
        return PublicFailure::Unavailable;
    }

    const char* auth_error_name(AuthError e) noexcept {
        switch (e) {
            case AuthError::None: return "none";
            case AuthError::MalformedToken: return "malformed_token";
            case AuthError::InvalidOrRevokedToken: return "invalid_or_revoked_token";
            case AuthError::LegacyTokenRejected: return "legacy_token_rejected";
            case AuthError::InsufficientScope: return "insufficient_scope";
            case AuthError::StoreUnavailable: return "store_unavailable";
        }
        return "unknown";
    }

    Status authenticate(regauth::db::DbHandle db,
        const AuthRequest& request,
        regauth::core::Timestamp now,
        regauth::core::Principal* out) noexcept {
        if (out == nullptr) {
            return regauth::core::make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        regauth::core::Hash256 digest{};
        regauth::core::TokenKind parsed_kind{regauth::core::TokenKind::Api};
        if (!parse_any_kind(request.presented, &digest, &parsed_kind)) {
            if (regauth::security::token_is_legacy(request.presented)) {
                regauth::core::logger()->debug("rejected unprefixed legacy token");
                return make_auth_status(AuthError::LegacyTokenRejected);
            }
            regauth::core::logger()->debug("rejected malformed token");
            return make_auth_status(AuthError::MalformedToken);
        }

        regauth::storage::TouchResult found{};
        const Status s = regauth::storage::token_store_try_touch_or_read(db, digest, now, &found);
        regauth::security::secure_wipe(digest.b.data(), digest.b.size());
        if (!regauth::core::is_ok(s)) {
            regauth::core::logger()->error("token store failure during authentication: {}",
                                           regauth::core::status_code_name(s.code));
            return make_auth_status(AuthError::StoreUnavailable);
        }
        if (found.outcome == regauth::storage::TouchOutcome::NotFound) {
            regauth::core::logger()->debug("no active token matches the presented secret");
            return make_auth_status(AuthError::InvalidOrRevokedToken);
        }

        // Re-derive and compare before trusting what the store handed back.
        // The digest covers only the secret, so the prefix must name the stored kind.
        regauth::core::Hash256 check{};
        regauth::core::TokenKind check_kind{regauth::core::TokenKind::Api};
        const bool parsed_again = parse_any_kind(request.presented, &check, &check_kind);
        const bool digest_ok = parsed_again && regauth::security::digest_equal_ct(check, found.token.hashed);
        regauth::security::secure_wipe(check.b.data(), check.b.size());
        if (!digest_ok || check_kind != parsed_kind || found.token.kind != parsed_kind || found.token.revoked) {
            return make_auth_status(AuthError::InvalidOrRevokedToken);
        }

        const regauth::security::ActionRequest action{request.endpoint, request.crate_name};
        const regauth::security::ScopeDecision decision =
            regauth::security::scope_check(found.token.crate_scopes, found.token.endpoint_scopes, action);
        if (decision != regauth::security::ScopeDecision::Allowed) {
            regauth::core::logger()->debug("token id={} denied: {} scope",
                found.token.id.v,
                decision == regauth::security::ScopeDecision::EndpointDenied ? "endpoint" : "crate");
            return make_auth_status(AuthError::InsufficientScope);
        }

        regauth::core::Principal p{};
        p.owner = found.token.owner;
        p.token = found.token.id;
        p.kind = found.token.kind;
        p.crate_scopes = found.token.crate_scopes;
        p.endpoint_scopes = found.token.endpoint_scopes;
        p.usage_recorded = (found.outcome == regauth::storage::TouchOutcome::Touched);
        *out = p;
        return regauth::core::ok_status();
    }

    Status bearer_extract(const char* header, char* out, u32 cap) noexcept {
        if (out == nullptr || cap == 0) {
            return regauth::core::make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        out[0] = '\0';
        if (header == nullptr) {
            return make_auth_status(AuthError::MalformedToken);
        }

        const char* token = header;
        static constexpr char kScheme[] = "Bearer ";
        if (std::strncmp(header, kScheme, sizeof(kScheme) - 1) == 0) {
            token = header + sizeof(kScheme) - 1;
        }
        while (*token == ' ') {
            ++token;
        }

        const size_t len = std::strlen(token);
        if (len == 0 || len + 1 > cap) {
            return make_auth_status(AuthError::MalformedToken);
        }
        std::memcpy(out, token, len + 1);
        return regauth::core::ok_status();
    }

} // namespace regauth::auth
