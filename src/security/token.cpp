#include "regauth/security/token.hpp"

#include <array>
#include <cstddef>
#include <cstring>

#include "regauth/security/digest.hpp"

namespace regauth::security {
    using regauth::core::TokenKind;

    namespace {
        constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        constexpr u32 kAlphabetLen = sizeof(kAlphabet) - 1;
        // Largest multiple of the alphabet size that fits in a byte.
        constexpr u32 kRejectAbove = (256 / kAlphabetLen) * kAlphabetLen;

        constexpr std::array<TokenKindInfo, 2> kKinds = {{
            {TokenKind::TrustedPublish, "cio_tp_", 7, 32},
            {TokenKind::Api, "cio", 3, 32},
        }};

        static_assert(kAlphabetLen == 62);
        static_assert(7 + 32 <= kMaxPlaintextLen);

        [[nodiscard]] bool is_alnum(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        }

        // Length up to limit + 1 so oversize input is detectable without a full scan.
        [[nodiscard]] u32 bounded_len(const char* s, u32 limit) noexcept {
            u32 n = 0;
            while (n <= limit && s[n] != '\0') {
                ++n;
            }
            return n;
        }

        regauth::core::Status fill_secret(char* out, u32 len) noexcept {
            std::array<u8, 64> pool{};
            u32 written = 0;
            while (written < len) {
                const regauth::core::Status s = random_fill(BufferMut{pool.data(), static_cast<u32>(pool.size())});
                if (!regauth::core::is_ok(s)) {
                    secure_wipe(pool.data(), pool.size());
                    return s;
                }
                for (size_t i = 0; i < pool.size() && written < len; ++i) {
                    if (pool[i] >= kRejectAbove) {
                        continue;
                    }
                    out[written++] = kAlphabet[pool[i] % kAlphabetLen];
                }
            }
            secure_wipe(pool.data(), pool.size());
            return regauth::core::ok_status();
        }
    } // namespace

    u8 token_kind_encode(TokenKind kind) noexcept {
        return static_cast<u8>(kind);
    }

    regauth::core::Status token_kind_decode(i64 raw, TokenKind* out) noexcept {
        if (out == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Invalid);
        }
        switch (raw) {
            case 1:
                *out = TokenKind::Api;
                return regauth::core::ok_status();
            case 2:
                *out = TokenKind::TrustedPublish;
                return regauth::core::ok_status();
            default:
                return regauth::core::make_status(regauth::core::StatusDomain::Security,
                    regauth::core::StatusCode::Corrupt, static_cast<u32>(raw));
        }
    }

    const char* token_kind_name(TokenKind kind) noexcept {
        switch (kind) {
            case TokenKind::Api: return "api";
            case TokenKind::TrustedPublish: return "trusted_publish";
        }
        return "unknown";
    }

    u32 token_kind_count() noexcept {
        return static_cast<u32>(kKinds.size());
    }

    const TokenKindInfo& token_kind_at(u32 index) noexcept {
        return kKinds[index < kKinds.size() ? index : 0];
    }

    const TokenKindInfo* token_kind_info(TokenKind kind) noexcept {
        for (const TokenKindInfo& info : kKinds) {
            if (info.kind == kind) {
                return &info;
            }
        }
        return nullptr;
    }

    regauth::core::Status token_generate(TokenKind kind, GeneratedToken* out) noexcept {
        if (out == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Invalid);
        }
        const TokenKindInfo* info = token_kind_info(kind);
        if (info == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Unsupported);
        }

        GeneratedToken t{};
        t.kind = kind;
        std::memcpy(t.plaintext, info->prefix, info->prefix_len);

        char* secret = t.plaintext + info->prefix_len;
        regauth::core::Status s = fill_secret(secret, info->secret_len);
        if (!regauth::core::is_ok(s)) {
            generated_token_wipe(&t);
            return s;
        }
        t.len = info->prefix_len + info->secret_len;
        t.plaintext[t.len] = '\0';

        s = digest_compute(BufferView{reinterpret_cast<const u8*>(secret), info->secret_len}, &t.hashed);
        if (!regauth::core::is_ok(s)) {
            generated_token_wipe(&t);
            return s;
        }

        *out = t;
        generated_token_wipe(&t);
        return regauth::core::ok_status();
    }

    regauth::core::Status token_parse(TokenKind kind, const char* presented, regauth::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Invalid);
        }
        const TokenKindInfo* info = token_kind_info(kind);
        if (info == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Unsupported);
        }
        const regauth::core::Status not_this_kind =
            regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::NotFound);
        if (presented == nullptr) {
            return not_this_kind;
        }

        const u32 len = bounded_len(presented, kMaxPresentedLen);
        if (len != info->prefix_len + info->secret_len) {
            return not_this_kind;
        }
        if (std::memcmp(presented, info->prefix, info->prefix_len) != 0) {
            return not_this_kind;
        }

        const char* secret = presented + info->prefix_len;
        for (u32 i = 0; i < info->secret_len; ++i) {
            if (!is_alnum(secret[i])) {
                return not_this_kind;
            }
        }

        return digest_compute(BufferView{reinterpret_cast<const u8*>(secret), info->secret_len}, out);
    }

    bool token_is_legacy(const char* presented) noexcept {
        if (presented == nullptr) {
            return false;
        }
        if (bounded_len(presented, kMaxPresentedLen) != kLegacySecretLen) {
            return false;
        }
        for (u32 i = 0; i < kLegacySecretLen; ++i) {
            if (!is_alnum(presented[i])) {
                return false;
            }
        }
        return true;
    }

    void generated_token_wipe(GeneratedToken* token) noexcept {
        if (token == nullptr) {
            return;
        }
        secure_wipe(token->plaintext, sizeof(token->plaintext));
        token->len = 0;
    }
} // namespace regauth::security
