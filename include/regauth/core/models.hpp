#pragma once
#include <type_traits>
#include "regauth/core/types.hpp"

namespace regauth::core {

    inline constexpr u32 kMaxCrateNameLen = 64;
    inline constexpr u32 kMaxCrateScopes = 32;
    inline constexpr u32 kMaxEndpointScopes = 8;
    inline constexpr u32 kMaxTokenNameLen = 255;

    // Persisted as small integers; see token_kind_encode/decode.
    enum class TokenKind : u8 {
        Api = 1,
        TrustedPublish = 2,
    };

    // Persisted as small integers; see endpoint_scope_encode/decode.
    // None is never persisted and marks an uncategorized request.
    enum class EndpointScope : u8 {
        None = 0,
        Publish = 1,
        Yank = 2,
        ChangeOwners = 3,
    };

    struct CratePattern {
        char b[kMaxCrateNameLen + 2]{}; // name + optional '*' + NUL
    };

    // restricted == false means "all crates".
    struct CrateScopeList {
        bool restricted{false};
        u32 len{0};
        CratePattern items[kMaxCrateScopes]{};
    };

    // restricted == false is the legacy endpoint scope (every category).
    struct EndpointScopeList {
        bool restricted{false};
        u32 len{0};
        EndpointScope items[kMaxEndpointScopes]{};
    };

    struct ApiToken {
        TokenId id{TokenId::invalid()};
        UserId owner{UserId::invalid()};
        TokenKind kind{TokenKind::Api};
        Hash256 hashed{};
        char name[kMaxTokenNameLen + 1]{};
        Timestamp created_at{0};
        bool has_last_used{false};
        Timestamp last_used_at{0};
        bool revoked{false};
        CrateScopeList crate_scopes{};
        EndpointScopeList endpoint_scopes{};
    };

    // What downstream authorization sees after a successful authentication.
    struct Principal {
        UserId owner{UserId::invalid()};
        TokenId token{TokenId::invalid()};
        TokenKind kind{TokenKind::Api};
        CrateScopeList crate_scopes{};
        EndpointScopeList endpoint_scopes{};
        bool usage_recorded{false};
    };

    static_assert(std::is_trivially_copyable_v<CratePattern>);
    static_assert(std::is_trivially_copyable_v<CrateScopeList>);
    static_assert(std::is_trivially_copyable_v<EndpointScopeList>);
    static_assert(std::is_trivially_copyable_v<ApiToken>);
    static_assert(std::is_trivially_copyable_v<Principal>);
    static_assert(std::is_standard_layout_v<ApiToken>);
    static_assert(std::is_standard_layout_v<Principal>);
} // namespace regauth::core
