#pragma once

#include <memory>

#include <spdlog/spdlog.h>

#include "regauth/core/errors.hpp"

namespace regauth::core {

    struct LogConfig {
        spdlog::level::level_enum level{spdlog::level::info};
    };

    // Reads REGAUTH_LOG_LEVEL; unknown names keep the default level.
    [[nodiscard]] LogConfig log_config_from_env() noexcept;

    // Creates the "regauth" logger. Safe to call more than once.
    Status log_init(const LogConfig& cfg) noexcept;

    void log_set_level(spdlog::level::level_enum level) noexcept;

    // Never null; falls back to a default logger when log_init was not called.
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() noexcept;

} // namespace regauth::core
