#pragma once

#include <array>
#include <atomic>
#include <type_traits>

#include "regauth/auth/gate.hpp"
#include "regauth/core/errors.hpp"
#include "regauth/core/types.hpp"

namespace regauth::obs {

using u32 = regauth::core::u32;
using u64 = regauth::core::u64;

struct ReporterConfig {
    char dsn[256]{};                // Empty disables reporting
    char environment[64]{};         // Required when dsn is set
    char release[64]{};             // Optional release identifier
    double traces_sample_rate{0.0}; // In [0, 1]
};

static_assert(std::is_trivially_copyable_v<ReporterConfig>);

// Reads REGAUTH_REPORT_DSN, REGAUTH_REPORT_ENV, REGAUTH_RELEASE and
// REGAUTH_TRACES_SAMPLE_RATE. Invalid when a DSN comes without an
// environment or the sample rate is not a number in [0, 1].
[[nodiscard]] regauth::core::Status reporter_config_from_env(ReporterConfig* out) noexcept;

// Built once at startup and passed by reference to the request layer, which
// reports the outcomes the gate returns. Holds counts only, never token data.
class Reporter {
public:
    explicit Reporter(const ReporterConfig& cfg) noexcept;

    Reporter(const Reporter&) = delete;
    Reporter& operator=(const Reporter&) = delete;

    [[nodiscard]] bool enabled() const noexcept;
    [[nodiscard]] const ReporterConfig& config() const noexcept { return cfg_; }

    // AuthError::None counts a success. Core-domain argument errors are not counted.
    void record(regauth::auth::AuthError e) noexcept;
    void record(regauth::core::Status authenticate_result) noexcept;

    [[nodiscard]] u64 count(regauth::auth::AuthError e) const noexcept;

    // Download traffic dwarfs everything else, so it is sampled at a tenth.
    [[nodiscard]] double traces_sample_rate_for(const char* route) const noexcept;

private:
    ReporterConfig cfg_;
    std::array<std::atomic<u64>, regauth::auth::kAuthErrorCount> counts_{};
};

} // namespace regauth::obs
