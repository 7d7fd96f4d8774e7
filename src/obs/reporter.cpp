#include "regauth/obs/reporter.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "regauth/core/log.hpp"

namespace regauth::obs {

using namespace regauth::core;

namespace {

[[nodiscard]] bool copy_env(const char* name, char* out, size_t cap) noexcept {
    out[0] = '\0';
    const char* v = std::getenv(name);
    if (!v || v[0] == '\0') {
        return true;
    }
    if (std::strlen(v) + 1 > cap) {
        return false;
    }
    std::strcpy(out, v);
    return true;
}

[[nodiscard]] bool parse_rate(const char* s, double* out) noexcept {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || end == nullptr || *end != '\0' || errno != 0) {
        return false;
    }
    if (!(v >= 0.0 && v <= 1.0)) {
        return false;
    }
    *out = v;
    return true;
}

[[nodiscard]] bool starts_with(const char* s, const char* prefix) noexcept {
    return std::strncmp(s, prefix, std::strlen(prefix)) == 0;
}

[[nodiscard]] bool ends_with(const char* s, const char* suffix) noexcept {
    const size_t n = std::strlen(s);
    const size_t m = std::strlen(suffix);
    return n >= m && std::strcmp(s + (n - m), suffix) == 0;
}

} // namespace

Status reporter_config_from_env(ReporterConfig* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Obs, StatusCode::Invalid);
    }

    ReporterConfig cfg{};
    if (!copy_env("REGAUTH_REPORT_DSN", cfg.dsn, sizeof(cfg.dsn)) ||
        !copy_env("REGAUTH_REPORT_ENV", cfg.environment, sizeof(cfg.environment)) ||
        !copy_env("REGAUTH_RELEASE", cfg.release, sizeof(cfg.release))) {
        return make_status(StatusDomain::Obs, StatusCode::Invalid);
    }

    if (cfg.dsn[0] != '\0' && cfg.environment[0] == '\0') {
        logger()->error("REGAUTH_REPORT_ENV must be set when REGAUTH_REPORT_DSN is set");
        return make_status(StatusDomain::Obs, StatusCode::Invalid);
    }

    const char* rate = std::getenv("REGAUTH_TRACES_SAMPLE_RATE");
    if (rate && rate[0] != '\0' && !parse_rate(rate, &cfg.traces_sample_rate)) {
        logger()->error("REGAUTH_TRACES_SAMPLE_RATE must be a number between 0 and 1");
        return make_status(StatusDomain::Obs, StatusCode::Invalid);
    }

    *out = cfg;
    return ok_status();
}

Reporter::Reporter(const ReporterConfig& cfg) noexcept : cfg_(cfg) {
    if (enabled()) {
        logger()->info("reporting enabled (environment={}, release={})",
                       cfg_.environment, cfg_.release[0] ? cfg_.release : "unset");
    }
}

bool Reporter::enabled() const noexcept {
    return cfg_.dsn[0] != '\0';
}

void Reporter::record(regauth::auth::AuthError e) noexcept {
    const u32 i = static_cast<u32>(e);
    if (i >= counts_.size()) {
        return;
    }
    counts_[i].fetch_add(1, std::memory_order_relaxed);
}

void Reporter::record(Status authenticate_result) noexcept {
    // Argument errors are caller bugs, not authentication outcomes.
    if (!is_ok(authenticate_result) && authenticate_result.domain == StatusDomain::Core) {
        return;
    }
    record(regauth::auth::auth_error_of(authenticate_result));
}

u64 Reporter::count(regauth::auth::AuthError e) const noexcept {
    const u32 i = static_cast<u32>(e);
    if (i >= counts_.size()) {
        return 0;
    }
    return counts_[i].load(std::memory_order_relaxed);
}

double Reporter::traces_sample_rate_for(const char* route) const noexcept {
    if (route && starts_with(route, "/api/v1/crates/") && ends_with(route, "/download")) {
        return cfg_.traces_sample_rate / 10.0;
    }
    return cfg_.traces_sample_rate;
}

} // namespace regauth::obs
