#include "regauth/core/log.hpp"

#include <cstdlib>
#include <cstdio>
#include <exception>
#include <mutex>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace regauth::core {
    namespace {
        constexpr const char* kLoggerName = "regauth";
        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v";

        std::mutex g_log_mutex;

        std::shared_ptr<spdlog::logger> create_logger_locked(spdlog::level::level_enum level) {
            auto existing = spdlog::get(kLoggerName);
            if (existing) {
                existing->set_level(level);
                return existing;
            }
            auto console = spdlog::stderr_color_mt(kLoggerName);
            console->set_pattern(kPattern);
            console->set_level(level);
            return console;
        }
    } // namespace

    LogConfig log_config_from_env() noexcept {
        LogConfig cfg{};
        const char* level = std::getenv("REGAUTH_LOG_LEVEL");
        if (!level || level[0] == '\0') {
            return cfg;
        }
        const auto parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to off; only accept "off" when asked for.
        if (parsed != spdlog::level::off || std::string_view(level) == "off") {
            cfg.level = parsed;
        }
        return cfg;
    }

    Status log_init(const LogConfig& cfg) noexcept {
        try {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            (void)create_logger_locked(cfg.level);
        } catch (const std::exception& ex) {
            std::fprintf(stderr, "error: log initialization failed: %s\n", ex.what());
            return make_status(StatusDomain::Core, StatusCode::Unavailable);
        }
        return ok_status();
    }

    void log_set_level(spdlog::level::level_enum level) noexcept {
        logger()->set_level(level);
    }

    std::shared_ptr<spdlog::logger> logger() noexcept {
        try {
            auto existing = spdlog::get(kLoggerName);
            if (existing) {
                return existing;
            }
            std::lock_guard<std::mutex> lock(g_log_mutex);
            return create_logger_locked(spdlog::level::info);
        } catch (const std::exception& ex) {
            std::fprintf(stderr, "error: regauth logger unavailable: %s\n", ex.what());
            return spdlog::default_logger();
        }
    }

} // namespace regauth::core
