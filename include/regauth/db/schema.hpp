#pragma once

#include "regauth/core/types.hpp"

namespace regauth::db {
    using u32 = regauth::core::u32;

    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS api_tokens (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER NOT NULL,
            kind INTEGER NOT NULL,
            token BLOB NOT NULL,
            name TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            last_used_at INTEGER,
            revoked INTEGER NOT NULL DEFAULT 0,
            crate_scopes TEXT,
            endpoint_scopes TEXT
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_api_tokens_token ON api_tokens(token);
        CREATE INDEX IF NOT EXISTS idx_api_tokens_user ON api_tokens(user_id);
    )SQL";

    // Column order of every SELECT that materializes an ApiToken.
    enum class TokenColumn : int {
        Id = 0,
        UserId,
        Kind,
        Token,
        Name,
        CreatedAt,
        LastUsedAt,
        Revoked,
        CrateScopes,
        EndpointScopes,
    };

    constexpr const char* kTokenColumnsSQL =
        "id, user_id, kind, token, name, created_at, last_used_at, revoked, crate_scopes, endpoint_scopes";

} // namespace regauth::db
