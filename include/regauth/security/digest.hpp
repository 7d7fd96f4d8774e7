#pragma once

#include <cstddef>

#include "regauth/core/errors.hpp"
#include "regauth/core/types.hpp"

namespace regauth::security {
    using u8 = regauth::core::u8;
    using u32 = regauth::core::u32;
    using BufferView = regauth::core::BufferView;
    using BufferMut = regauth::core::BufferMut;

    [[nodiscard]] constexpr bool digest_is_zero(const regauth::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // Unkeyed BLAKE3-256.
    regauth::core::Status digest_compute(BufferView data, regauth::core::Hash256* out) noexcept;

    // Runs in time independent of where the inputs differ.
    [[nodiscard]] bool digest_equal_ct(const regauth::core::Hash256& a, const regauth::core::Hash256& b) noexcept;

    // Fills the buffer from the operating system CSPRNG.
    regauth::core::Status random_fill(BufferMut out) noexcept;

    void secure_wipe(void* p, std::size_t len) noexcept;

} // namespace regauth::security
