#pragma once

#include <type_traits>

#include "regauth/core/errors.hpp"
#include "regauth/core/models.hpp"
#include "regauth/core/types.hpp"

namespace regauth::security {
    using u8 = regauth::core::u8;
    using u32 = regauth::core::u32;
    using i64 = regauth::core::i64;

    // What the request layer asks for. crate_name == nullptr means the
    // endpoint is not about a specific crate.
    struct ActionRequest {
        regauth::core::EndpointScope endpoint{regauth::core::EndpointScope::None};
        const char* crate_name{nullptr};
    };

    enum class ScopeDecision : u8 {
        Allowed = 0,
        EndpointDenied = 1,
        CrateDenied = 2,
    };

    // Endpoint tags
    [[nodiscard]] u8 endpoint_scope_encode(regauth::core::EndpointScope scope) noexcept;
    regauth::core::Status endpoint_scope_decode(i64 raw, regauth::core::EndpointScope* out) noexcept;
    [[nodiscard]] const char* endpoint_scope_str(regauth::core::EndpointScope scope) noexcept;
    regauth::core::Status endpoint_scope_from_str(const char* s, regauth::core::EndpointScope* out) noexcept;

    // Crate patterns
    [[nodiscard]] bool crate_name_valid(const char* name) noexcept;
    [[nodiscard]] bool crate_pattern_valid(const char* pattern) noexcept;
    regauth::core::Status crate_scope_make(const char* pattern, regauth::core::CratePattern* out) noexcept;
    [[nodiscard]] bool crate_scope_matches(const regauth::core::CratePattern& pattern, const char* crate_name) noexcept;

    // Lists. A default-constructed list is unrestricted; restrict() turns it
    // into an empty restricted list that denies everything until filled.
    void crate_scopes_restrict(regauth::core::CrateScopeList* list) noexcept;
    regauth::core::Status crate_scopes_add(regauth::core::CrateScopeList* list, const char* pattern) noexcept;
    void endpoint_scopes_restrict(regauth::core::EndpointScopeList* list) noexcept;
    regauth::core::Status endpoint_scopes_add(regauth::core::EndpointScopeList* list, regauth::core::EndpointScope scope) noexcept;

    [[nodiscard]] bool crate_scopes_permit(const regauth::core::CrateScopeList& list, const char* crate_name) noexcept;
    [[nodiscard]] bool endpoint_scopes_permit(const regauth::core::EndpointScopeList& list,
        regauth::core::EndpointScope requested) noexcept;

    [[nodiscard]] ScopeDecision scope_check(const regauth::core::CrateScopeList& crates,
        const regauth::core::EndpointScopeList& endpoints,
        const ActionRequest& request) noexcept;

    // Persistence text forms. is_null reports the unrestricted state.
    regauth::core::Status crate_scopes_serialize(const regauth::core::CrateScopeList& list,
        char* out, u32 cap, bool* is_null) noexcept;
    regauth::core::Status crate_scopes_parse(const char* text, regauth::core::CrateScopeList* out) noexcept;
    regauth::core::Status endpoint_scopes_serialize(const regauth::core::EndpointScopeList& list,
        char* out, u32 cap, bool* is_null) noexcept;
    regauth::core::Status endpoint_scopes_parse(const char* text, regauth::core::EndpointScopeList* out) noexcept;

    inline constexpr u32 kCrateScopesTextCap =
        regauth::core::kMaxCrateScopes * (regauth::core::kMaxCrateNameLen + 2) + 1;
    inline constexpr u32 kEndpointScopesTextCap = regauth::core::kMaxEndpointScopes * 4 + 1;

    static_assert(std::is_trivially_copyable_v<ActionRequest>);
    static_assert(std::is_standard_layout_v<ActionRequest>);

} // namespace regauth::security
