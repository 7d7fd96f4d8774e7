#pragma once

#include <type_traits>

#include "regauth/core/errors.hpp"
#include "regauth/core/models.hpp"
#include "regauth/core/types.hpp"
#include "regauth/db/db.hpp"
#include "regauth/security/token.hpp"

namespace regauth::storage {

using u8 = regauth::core::u8;
using u32 = regauth::core::u32;

// Parameters for issuing a token
struct NewTokenParams {
    regauth::core::UserId owner{regauth::core::UserId::invalid()};
    regauth::core::TokenKind kind{regauth::core::TokenKind::Api};
    const char* name{nullptr};                              // Display label, not secret
    regauth::core::CrateScopeList crate_scopes{};          // Unrestricted by default
    regauth::core::EndpointScopeList endpoint_scopes{};    // Legacy scope by default
};

// Result of issuing a token. plaintext is shown to the caller exactly once;
// wipe it with created_token_wipe() when done.
struct CreatedToken {
    regauth::core::ApiToken model{};
    char plaintext[regauth::security::kMaxPlaintextLen + 1]{};
};

enum class TouchOutcome : u8 {
    Touched = 0,            // Found and last_used_at committed
    ReadOnlyFallback = 1,   // Found, but the store refused the write
    NotFound = 2,           // No active token with this digest
};

struct TouchResult {
    TouchOutcome outcome{TouchOutcome::NotFound};
    regauth::core::ApiToken token{};
};

// ========================================================================
// Issue / Revoke
// ========================================================================

// Generates a secret of the requested kind and persists only its digest.
[[nodiscard]] regauth::core::Status token_store_insert(regauth::db::DbHandle db,
                                                       const NewTokenParams& params,
                                                       regauth::core::Timestamp now,
                                                       CreatedToken* out) noexcept;

// One-way. Revoking a revoked token is Ok; an unknown id is NotFound.
[[nodiscard]] regauth::core::Status token_store_revoke(regauth::db::DbHandle db,
                                                       regauth::core::TokenId id) noexcept;

void created_token_wipe(CreatedToken* token) noexcept;

// ========================================================================
// Lookup
// ========================================================================

// Step one: touch and read in one transaction.
// Step two, only when the store rejects the write as read-only: plain read.
// Every other failure is returned as is.
[[nodiscard]] regauth::core::Status token_store_try_touch_or_read(regauth::db::DbHandle db,
                                                                  const regauth::core::Hash256& hashed,
                                                                  regauth::core::Timestamp now,
                                                                  TouchResult* out) noexcept;

// Same as above, but NotFound is reported as a NotFound status.
[[nodiscard]] regauth::core::Status token_store_find_and_touch(regauth::db::DbHandle db,
                                                               const regauth::core::Hash256& hashed,
                                                               regauth::core::Timestamp now,
                                                               regauth::core::ApiToken* out,
                                                               bool* touched) noexcept;

[[nodiscard]] regauth::core::Status token_store_get(regauth::db::DbHandle db,
                                                    regauth::core::TokenId id,
                                                    regauth::core::ApiToken* out) noexcept;

// count: input = capacity, output = tokens written.
[[nodiscard]] regauth::core::Status token_store_list_for_owner(regauth::db::DbHandle db,
                                                               regauth::core::UserId owner,
                                                               regauth::core::ApiToken* out,
                                                               u32* count) noexcept;

static_assert(std::is_trivially_copyable_v<NewTokenParams>);
static_assert(std::is_trivially_copyable_v<CreatedToken>);
static_assert(std::is_trivially_copyable_v<TouchResult>);

} // namespace regauth::storage
