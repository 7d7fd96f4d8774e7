#pragma once

#include <type_traits>

#include "regauth/core/errors.hpp"
#include "regauth/core/models.hpp"
#include "regauth/core/types.hpp"
#include "regauth/db/schema.hpp"

namespace regauth::db {
    using u32 = regauth::core::u32;

    inline constexpr u32 kMaxDbHandles = 16;
    inline constexpr u32 kDefaultBusyTimeoutMs = 5000;

    struct DbConfig {
        const char* path{nullptr};   // nullptr opens a private in-memory database
        bool read_only{false};       // replica mode: every write is rejected with ReadOnly
        u32 busy_timeout_ms{kDefaultBusyTimeoutMs};
    };

    struct DbHandle {
        u32 id{0};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle h) noexcept {
        return h.id != 0 && h.id <= kMaxDbHandles;
    }

    // Reads REGAUTH_DB_BUSY_TIMEOUT_MS; the path is left to the caller.
    [[nodiscard]] DbConfig db_config_from_env(const char* path) noexcept;

    regauth::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    regauth::core::Status db_close(DbHandle db) noexcept;

    // Switches a connection between primary and replica behaviour.
    regauth::core::Status db_set_read_only(DbHandle db, bool read_only) noexcept;

    // Writes row (ignoring id, last_used_at and revoked) and returns the stored row.
    regauth::core::Status db_token_insert(DbHandle db, const regauth::core::ApiToken& row,
        regauth::core::ApiToken* out) noexcept;

    // One transaction: raise last_used_at to at least now on the active row
    // with this digest, then read it back. ReadOnly when the write is
    // rejected; nothing is changed in that case.
    regauth::core::Status db_token_touch_and_get(DbHandle db, const regauth::core::Hash256& hashed,
        regauth::core::Timestamp now, regauth::core::ApiToken* out) noexcept;

    regauth::core::Status db_token_find_active(DbHandle db, const regauth::core::Hash256& hashed,
        regauth::core::ApiToken* out) noexcept;

    regauth::core::Status db_token_get(DbHandle db, regauth::core::TokenId id,
        regauth::core::ApiToken* out) noexcept;

    regauth::core::Status db_token_revoke(DbHandle db, regauth::core::TokenId id) noexcept;

    // count: input = capacity of out, output = rows written.
    regauth::core::Status db_token_list_by_owner(DbHandle db, regauth::core::UserId owner,
        regauth::core::ApiToken* out, u32* count) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);

} // namespace regauth::db
