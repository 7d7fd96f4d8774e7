#include "regauth/db/db.hpp"
#include <sqlite3.h>
#include <array>
#include <charconv>
#include <cstring>
#include <cstdlib>
#include <string>
#include <mutex>

#include "regauth/core/log.hpp"
#include "regauth/security/scopes.hpp"
#include "regauth/security/token.hpp"

namespace regauth::db {

using namespace regauth::core;

namespace {
    struct DbSlot {
        sqlite3* db = nullptr;
        bool in_use = false;
        std::mutex mutex;
    };

    std::array<DbSlot, kMaxDbHandles> g_slots;
    std::mutex g_slots_mutex;

    [[nodiscard]] DbSlot* slot_for(DbHandle h) noexcept {
        if (!db_handle_valid(h)) {
            return nullptr;
        }
        return &g_slots[h.id - 1];
    }

    [[nodiscard]] Status map_sqlite(int rc) noexcept {
        const u32 aux = static_cast<u32>(rc);
        switch (rc & 0xff) {
            case SQLITE_OK:
            case SQLITE_DONE:
            case SQLITE_ROW:
                return ok_status();
            case SQLITE_READONLY:
                return make_status(StatusDomain::Db, StatusCode::ReadOnly, aux);
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return make_status(StatusDomain::Db, StatusCode::Busy, aux);
            case SQLITE_CANTOPEN:
            case SQLITE_IOERR:
            case SQLITE_NOTADB:
            case SQLITE_FULL:
            case SQLITE_PROTOCOL:
                return make_status(StatusDomain::Db, StatusCode::Unavailable, aux);
            case SQLITE_CORRUPT:
                return make_status(StatusDomain::Db, StatusCode::Corrupt, aux);
            case SQLITE_CONSTRAINT:
                return make_status(StatusDomain::Db, StatusCode::Conflict, aux);
            default:
                return make_status(StatusDomain::Db, StatusCode::Unknown, aux);
        }
    }

    [[nodiscard]] Status closed_status() noexcept {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept {
        if (!db || !sql) return false;
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (err_msg) sqlite3_free(err_msg);
        return rc == SQLITE_OK;
    }

    [[nodiscard]] Status exec_status(sqlite3* db, const char* sql) noexcept {
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (err_msg) sqlite3_free(err_msg);
        return map_sqlite(rc);
    }

    [[nodiscard]] const char* column_text(sqlite3_stmt* stmt, TokenColumn col) noexcept {
        const int i = static_cast<int>(col);
        if (sqlite3_column_type(stmt, i) == SQLITE_NULL) {
            return nullptr;
        }
        const char* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
        return t ? t : "";
    }

    [[nodiscard]] Status read_token_row(sqlite3_stmt* stmt, ApiToken* out) noexcept {
        ApiToken t{};
        t.id = TokenId{sqlite3_column_int64(stmt, static_cast<int>(TokenColumn::Id))};
        t.owner = UserId{static_cast<u32>(sqlite3_column_int64(stmt, static_cast<int>(TokenColumn::UserId)))};

        Status s = regauth::security::token_kind_decode(
            sqlite3_column_int64(stmt, static_cast<int>(TokenColumn::Kind)), &t.kind);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Db, StatusCode::Corrupt, s.aux);
        }

        const int token_col = static_cast<int>(TokenColumn::Token);
        const void* blob = sqlite3_column_blob(stmt, token_col);
        if (!blob || sqlite3_column_bytes(stmt, token_col) != static_cast<int>(t.hashed.b.size())) {
            return make_status(StatusDomain::Db, StatusCode::Corrupt);
        }
        std::memcpy(t.hashed.b.data(), blob, t.hashed.b.size());

        const char* name = column_text(stmt, TokenColumn::Name);
        if (name) {
            std::strncpy(t.name, name, sizeof(t.name) - 1);
        }

        t.created_at = sqlite3_column_int64(stmt, static_cast<int>(TokenColumn::CreatedAt));
        const int last_used_col = static_cast<int>(TokenColumn::LastUsedAt);
        if (sqlite3_column_type(stmt, last_used_col) != SQLITE_NULL) {
            t.has_last_used = true;
            t.last_used_at = sqlite3_column_int64(stmt, last_used_col);
        }
        t.revoked = sqlite3_column_int(stmt, static_cast<int>(TokenColumn::Revoked)) != 0;

        s = regauth::security::crate_scopes_parse(column_text(stmt, TokenColumn::CrateScopes), &t.crate_scopes);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Db, StatusCode::Corrupt, s.aux);
        }
        s = regauth::security::endpoint_scopes_parse(column_text(stmt, TokenColumn::EndpointScopes), &t.endpoint_scopes);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Db, StatusCode::Corrupt, s.aux);
        }

        *out = t;
        return ok_status();
    }

    // Runs a prepared single-row SELECT; NotFound when it yields nothing.
    [[nodiscard]] Status step_single_token(sqlite3_stmt* stmt, ApiToken* out) noexcept {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            return read_token_row(stmt, out);
        }
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        return map_sqlite(rc);
    }

    [[nodiscard]] Status select_active_locked(sqlite3* db, const Hash256& hashed, ApiToken* out) noexcept {
        std::string sql = "SELECT ";
        sql += kTokenColumnsSQL;
        sql += " FROM api_tokens WHERE token = ? AND revoked = 0";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return map_sqlite(rc);
        }

        sqlite3_bind_blob(stmt, 1, hashed.b.data(), static_cast<int>(hashed.b.size()), SQLITE_STATIC);
        const Status s = step_single_token(stmt, out);
        sqlite3_finalize(stmt);
        return s;
    }

    void apply_journal_mode(sqlite3* db) noexcept {
        const char* journal_mode = std::getenv("REGAUTH_DB_JOURNAL_MODE");
        if (!journal_mode || journal_mode[0] == '\0') {
            journal_mode = "WAL";
        }
        std::string journal_sql = "PRAGMA journal_mode=";
        journal_sql += journal_mode;
        // In-memory databases refuse WAL; that is fine.
        (void)exec_sql(db, journal_sql.c_str());
        (void)exec_sql(db, "PRAGMA synchronous=NORMAL");
    }
}

// ============================================================================
// Database Lifecycle
// ============================================================================

DbConfig db_config_from_env(const char* path) noexcept {
    DbConfig cfg{};
    cfg.path = path;

    const char* timeout = std::getenv("REGAUTH_DB_BUSY_TIMEOUT_MS");
    if (timeout && timeout[0] != '\0') {
        u32 v = 0;
        const char* end = timeout + std::strlen(timeout);
        const auto r = std::from_chars(timeout, end, v, 10);
        if (r.ec == std::errc() && r.ptr == end) {
            cfg.busy_timeout_ms = v;
        } else {
            logger()->warn("ignoring invalid REGAUTH_DB_BUSY_TIMEOUT_MS");
        }
    }
    return cfg;
}

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> slots_lock(g_slots_mutex);

    u32 index = kMaxDbHandles;
    for (u32 i = 0; i < kMaxDbHandles; ++i) {
        if (!g_slots[i].in_use) {
            index = i;
            break;
        }
    }
    if (index == kMaxDbHandles) {
        return make_status(StatusDomain::Db, StatusCode::Busy);
    }

    DbSlot& slot = g_slots[index];
    std::lock_guard<std::mutex> lock(slot.mutex);

    const char* path = cfg.path ? cfg.path : ":memory:";
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path, &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        const Status s = map_sqlite(rc);
        if (db) sqlite3_close(db);
        logger()->error("token database open failed: {}", sqlite3_errstr(rc));
        return s.code == StatusCode::Unknown ? make_status(StatusDomain::Db, StatusCode::Unavailable, s.aux) : s;
    }

    sqlite3_busy_timeout(db, static_cast<int>(cfg.busy_timeout_ms));
    apply_journal_mode(db);

    rc = sqlite3_exec(db, kSchemaSQL, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        logger()->error("token schema setup failed: {}", sqlite3_errmsg(db));
        const Status s = map_sqlite(rc);
        sqlite3_close(db);
        return s;
    }

    if (cfg.read_only && !exec_sql(db, "PRAGMA query_only=ON")) {
        sqlite3_close(db);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    slot.db = db;
    slot.in_use = true;
    out->id = index + 1;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> slots_lock(g_slots_mutex);
    std::lock_guard<std::mutex> lock(slot->mutex);

    if (!slot->in_use) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (slot->db) {
        sqlite3_close(slot->db);
        slot->db = nullptr;
    }
    slot->in_use = false;
    return ok_status();
}

Status db_set_read_only(DbHandle db, bool read_only) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->db) {
        return closed_status();
    }
    return exec_status(slot->db, read_only ? "PRAGMA query_only=ON" : "PRAGMA query_only=OFF");
}

// ============================================================================
// Token Operations
// ============================================================================

Status db_token_insert(DbHandle db, const ApiToken& row, ApiToken* out) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    char crate_text[regauth::security::kCrateScopesTextCap];
    bool crate_null = true;
    Status s = regauth::security::crate_scopes_serialize(row.crate_scopes, crate_text, sizeof(crate_text), &crate_null);
    if (!is_ok(s)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    char endpoint_text[regauth::security::kEndpointScopesTextCap];
    bool endpoint_null = true;
    s = regauth::security::endpoint_scopes_serialize(row.endpoint_scopes, endpoint_text, sizeof(endpoint_text), &endpoint_null);
    if (!is_ok(s)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->db) {
        return closed_status();
    }

    const char* sql = "INSERT INTO api_tokens (user_id, kind, token, name, created_at, last_used_at, revoked, "
                      "crate_scopes, endpoint_scopes) VALUES (?, ?, ?, ?, ?, NULL, 0, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return map_sqlite(rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(row.owner.v));
    sqlite3_bind_int(stmt, 2, regauth::security::token_kind_encode(row.kind));
    sqlite3_bind_blob(stmt, 3, row.hashed.b.data(), static_cast<int>(row.hashed.b.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, row.name, -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, row.created_at);
    if (crate_null) {
        sqlite3_bind_null(stmt, 6);
    } else {
        sqlite3_bind_text(stmt, 6, crate_text, -1, SQLITE_STATIC);
    }
    if (endpoint_null) {
        sqlite3_bind_null(stmt, 7);
    } else {
        sqlite3_bind_text(stmt, 7, endpoint_text, -1, SQLITE_STATIC);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return map_sqlite(rc);
    }

    ApiToken stored = row;
    stored.id = TokenId{sqlite3_last_insert_rowid(slot->db)};
    stored.has_last_used = false;
    stored.last_used_at = 0;
    stored.revoked = false;
    *out = stored;
    return ok_status();
}

Status db_token_touch_and_get(DbHandle db, const Hash256& hashed, Timestamp now, ApiToken* out) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->db) {
        return closed_status();
    }

    Status s = exec_status(slot->db, "BEGIN IMMEDIATE");
    if (!is_ok(s)) {
        return s;
    }

    // MAX keeps last_used_at monotonic when requests race with skewed clocks.
    const char* sql = "UPDATE api_tokens SET last_used_at = MAX(COALESCE(last_used_at, ?1), ?1) "
                      "WHERE token = ?2 AND revoked = 0";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        (void)exec_sql(slot->db, "ROLLBACK");
        return map_sqlite(rc);
    }

    sqlite3_bind_int64(stmt, 1, now);
    sqlite3_bind_blob(stmt, 2, hashed.b.data(), static_cast<int>(hashed.b.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        (void)exec_sql(slot->db, "ROLLBACK");
        return map_sqlite(rc);
    }

    if (sqlite3_changes(slot->db) == 0) {
        (void)exec_sql(slot->db, "ROLLBACK");
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    ApiToken row{};
    s = select_active_locked(slot->db, hashed, &row);
    if (!is_ok(s)) {
        (void)exec_sql(slot->db, "ROLLBACK");
        return s;
    }

    s = exec_status(slot->db, "COMMIT");
    if (!is_ok(s)) {
        (void)exec_sql(slot->db, "ROLLBACK");
        return s;
    }

    *out = row;
    return ok_status();
}

Status db_token_find_active(DbHandle db, const Hash256& hashed, ApiToken* out) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->db) {
        return closed_status();
    }
    return select_active_locked(slot->db, hashed, out);
}

Status db_token_get(DbHandle db, TokenId id, ApiToken* out) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->db) {
        return closed_status();
    }

    std::string sql = "SELECT ";
    sql += kTokenColumnsSQL;
    sql += " FROM api_tokens WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(slot->db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return map_sqlite(rc);
    }

    sqlite3_bind_int64(stmt, 1, id.v);
    const Status s = step_single_token(stmt, out);
    sqlite3_finalize(stmt);
    return s;
}

Status db_token_revoke(DbHandle db, TokenId id) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->db) {
        return closed_status();
    }

    // revoked only ever goes 0 -> 1; matching an already revoked row still counts as a change.
    const char* sql = "UPDATE api_tokens SET revoked = 1 WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return map_sqlite(rc);
    }

    sqlite3_bind_int64(stmt, 1, id.v);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return map_sqlite(rc);
    }

    if (sqlite3_changes(slot->db) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return ok_status();
}

Status db_token_list_by_owner(DbHandle db, UserId owner, ApiToken* out, u32* count) noexcept {
    DbSlot* slot = slot_for(db);
    if (!slot || !count || (*count > 0 && !out)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->db) {
        return closed_status();
    }

    std::string sql = "SELECT ";
    sql += kTokenColumnsSQL;
    sql += " FROM api_tokens WHERE user_id = ? ORDER BY id LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return map_sqlite(rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(owner.v));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(*count));

    u32 n = 0;
    Status s = ok_status();
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        s = read_token_row(stmt, &out[n]);
        if (!is_ok(s)) {
            break;
        }
        ++n;
    }
    sqlite3_finalize(stmt);

    if (is_ok(s) && rc != SQLITE_DONE) {
        s = map_sqlite(rc);
    }
    if (!is_ok(s)) {
        return s;
    }
    *count = n;
    return ok_status();
}

} // namespace regauth::db
