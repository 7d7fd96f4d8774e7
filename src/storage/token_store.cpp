#include "regauth/storage/token_store.hpp"

#include <cstring>

#include "regauth/core/log.hpp"
#include "regauth/security/digest.hpp"

namespace regauth::storage {

using namespace regauth::core;

namespace {

[[nodiscard]] Status store_status(Status s) noexcept {
    return make_status(StatusDomain::Store, s.code, s.aux);
}

} // namespace

Status token_store_insert(db::DbHandle db, const NewTokenParams& params, Timestamp now, CreatedToken* out) noexcept {
    if (!out || !params.owner.is_valid()) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    const char* name = params.name ? params.name : "";
    if (std::strlen(name) > kMaxTokenNameLen) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    security::GeneratedToken generated{};
    Status s = security::token_generate(params.kind, &generated);
    if (!is_ok(s)) {
        logger()->error("token generation failed: {}", status_code_name(s.code));
        return store_status(s);
    }

    ApiToken row{};
    row.owner = params.owner;
    row.kind = params.kind;
    row.hashed = generated.hashed;
    std::memcpy(row.name, name, std::strlen(name));
    row.created_at = now;
    row.crate_scopes = params.crate_scopes;
    row.endpoint_scopes = params.endpoint_scopes;

    CreatedToken created{};
    s = db::db_token_insert(db, row, &created.model);
    if (!is_ok(s)) {
        security::generated_token_wipe(&generated);
        if (s.code == StatusCode::Unavailable) {
            logger()->error("token store unavailable while issuing a token");
        }
        return store_status(s);
    }

    std::memcpy(created.plaintext, generated.plaintext, generated.len);
    created.plaintext[generated.len] = '\0';
    security::generated_token_wipe(&generated);

    *out = created;
    created_token_wipe(&created);

    logger()->info("issued {} token id={} for user={}",
                   security::token_kind_name(params.kind), out->model.id.v, params.owner.v);
    return ok_status();
}

Status token_store_revoke(db::DbHandle db, TokenId id) noexcept {
    const Status s = db::db_token_revoke(db, id);
    if (!is_ok(s)) {
        return store_status(s);
    }
    logger()->info("revoked token id={}", id.v);
    return ok_status();
}

void created_token_wipe(CreatedToken* token) noexcept {
    if (!token) {
        return;
    }
    security::secure_wipe(token->plaintext, sizeof(token->plaintext));
}

Status token_store_try_touch_or_read(db::DbHandle db, const Hash256& hashed, Timestamp now, TouchResult* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    TouchResult result{};
    Status s = db::db_token_touch_and_get(db, hashed, now, &result.token);
    if (is_ok(s)) {
        result.outcome = TouchOutcome::Touched;
        *out = result;
        return ok_status();
    }
    if (s.code == StatusCode::NotFound) {
        result.outcome = TouchOutcome::NotFound;
        *out = result;
        return ok_status();
    }
    if (s.code != StatusCode::ReadOnly) {
        return store_status(s);
    }

    logger()->warn("token store is read-only; authenticating without recording usage");

    s = db::db_token_find_active(db, hashed, &result.token);
    if (s.code == StatusCode::NotFound) {
        result.outcome = TouchOutcome::NotFound;
        *out = result;
        return ok_status();
    }
    if (!is_ok(s)) {
        return store_status(s);
    }

    result.outcome = TouchOutcome::ReadOnlyFallback;
    *out = result;
    return ok_status();
}

Status token_store_find_and_touch(db::DbHandle db, const Hash256& hashed, Timestamp now,
                                  ApiToken* out, bool* touched) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    TouchResult result{};
    const Status s = token_store_try_touch_or_read(db, hashed, now, &result);
    if (!is_ok(s)) {
        return s;
    }
    if (result.outcome == TouchOutcome::NotFound) {
        return make_status(StatusDomain::Store, StatusCode::NotFound);
    }

    *out = result.token;
    if (touched) {
        *touched = (result.outcome == TouchOutcome::Touched);
    }
    return ok_status();
}

Status token_store_get(db::DbHandle db, TokenId id, ApiToken* out) noexcept {
    const Status s = db::db_token_get(db, id, out);
    return is_ok(s) ? s : store_status(s);
}

Status token_store_list_for_owner(db::DbHandle db, UserId owner, ApiToken* out, u32* count) noexcept {
    const Status s = db::db_token_list_by_owner(db, owner, out, count);
    return is_ok(s) ? s : store_status(s);
}

} // namespace regauth::storage
