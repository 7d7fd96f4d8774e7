#pragma once

#include <type_traits>

#include "regauth/core/errors.hpp"
#include "regauth/core/models.hpp"
#include "regauth/core/types.hpp"

namespace regauth::security {
    using u8 = regauth::core::u8;
    using u32 = regauth::core::u32;
    using i64 = regauth::core::i64;

    // Upper bound for anything we are willing to look at as a presented token.
    inline constexpr u32 kMaxPresentedLen = 128;
    inline constexpr u32 kMaxPlaintextLen = 64;
    // Tokens issued before prefixes existed: 32 alphanumerics, nothing else.
    inline constexpr u32 kLegacySecretLen = 32;

    struct TokenKindInfo {
        regauth::core::TokenKind kind{regauth::core::TokenKind::Api};
        const char* prefix{nullptr};
        u32 prefix_len{0};
        u32 secret_len{0};
    };

    // The plaintext exists only here and only until the caller wipes it.
    struct GeneratedToken {
        regauth::core::TokenKind kind{regauth::core::TokenKind::Api};
        u32 len{0};
        char plaintext[kMaxPlaintextLen + 1]{};
        regauth::core::Hash256 hashed{};
    };

    [[nodiscard]] u8 token_kind_encode(regauth::core::TokenKind kind) noexcept;

    // Unknown values are Corrupt, never defaulted.
    regauth::core::Status token_kind_decode(i64 raw, regauth::core::TokenKind* out) noexcept;

    [[nodiscard]] const char* token_kind_name(regauth::core::TokenKind kind) noexcept;

    // Kind table in parse priority order (longest prefix first).
    [[nodiscard]] u32 token_kind_count() noexcept;
    [[nodiscard]] const TokenKindInfo& token_kind_at(u32 index) noexcept;
    [[nodiscard]] const TokenKindInfo* token_kind_info(regauth::core::TokenKind kind) noexcept;

    regauth::core::Status token_generate(regauth::core::TokenKind kind, GeneratedToken* out) noexcept;

    // Ok with the digest of the secret portion, or NotFound when the string
    // does not have this kind's shape. Never an error for foreign input.
    regauth::core::Status token_parse(regauth::core::TokenKind kind,
        const char* presented,
        regauth::core::Hash256* out) noexcept;

    [[nodiscard]] bool token_is_legacy(const char* presented) noexcept;

    void generated_token_wipe(GeneratedToken* token) noexcept;

    static_assert(std::is_trivially_copyable_v<TokenKindInfo>);
    static_assert(std::is_trivially_copyable_v<GeneratedToken>);
    static_assert(std::is_standard_layout_v<GeneratedToken>);

} // namespace regauth::security
