#include "regauth/security/digest.hpp"

#include <blake3.h>

#if defined(REGAUTH_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

#if defined(REGAUTH_HAVE_OPENSSL)
#include <openssl/crypto.h>
#include <openssl/rand.h>
#endif

#if !defined(REGAUTH_HAVE_LIBSODIUM) && !defined(REGAUTH_HAVE_OPENSSL)
#error "regauth needs libsodium or OpenSSL for random bytes"
#endif

namespace regauth::security {
    namespace {
#if defined(REGAUTH_HAVE_LIBSODIUM)
        regauth::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return regauth::core::make_status(regauth::core::StatusDomain::External, regauth::core::StatusCode::Unavailable);
            }
            return regauth::core::ok_status();
        }
#endif
    } // namespace

    regauth::core::Status digest_compute(BufferView data, regauth::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return regauth::core::ok_status();
    }

    bool digest_equal_ct(const regauth::core::Hash256& a, const regauth::core::Hash256& b) noexcept {
        volatile u8 acc = 0;
        for (size_t i = 0; i < a.b.size(); ++i) {
            acc = static_cast<u8>(acc | static_cast<u8>(a.b[i] ^ b.b[i]));
        }
        return acc == 0;
    }

    regauth::core::Status random_fill(BufferMut out) noexcept {
        if (out.len > 0 && out.data == nullptr) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Invalid);
        }
        if (out.len == 0) {
            return regauth::core::ok_status();
        }

#if defined(REGAUTH_HAVE_LIBSODIUM)
        const regauth::core::Status init = ensure_sodium();
        if (!regauth::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out.data, static_cast<size_t>(out.len));
        return regauth::core::ok_status();
#elif defined(REGAUTH_HAVE_OPENSSL)
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Crypto);
        }
        return regauth::core::ok_status();
#endif
    }

    void secure_wipe(void* p, std::size_t len) noexcept {
        if (p == nullptr || len == 0) {
            return;
        }
#if defined(REGAUTH_HAVE_LIBSODIUM)
        sodium_memzero(p, len);
#elif defined(REGAUTH_HAVE_OPENSSL)
        OPENSSL_cleanse(p, len);
#endif
    }
} // namespace regauth::security
