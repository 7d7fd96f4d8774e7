#include <gtest/gtest.h>

#include <cstdlib>

#include "regauth/core/errors.hpp"
#include "regauth/core/log.hpp"

TEST(Status, DefaultIsOk){
    regauth::core::Status s{};
    EXPECT_EQ(s.code, regauth::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, regauth::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
}

TEST(Status, CodeNames){
    EXPECT_STREQ(regauth::core::status_code_name(regauth::core::StatusCode::Ok), "ok");
    EXPECT_STREQ(regauth::core::status_code_name(regauth::core::StatusCode::ReadOnly), "read_only");
}

TEST(Log, LevelFromEnvironment){
    ::setenv("REGAUTH_LOG_LEVEL", "debug", 1);
    EXPECT_EQ(regauth::core::log_config_from_env().level, spdlog::level::debug);

    ::setenv("REGAUTH_LOG_LEVEL", "chatty", 1);
    EXPECT_EQ(regauth::core::log_config_from_env().level, spdlog::level::info);

    ::unsetenv("REGAUTH_LOG_LEVEL");
    EXPECT_EQ(regauth::core::log_config_from_env().level, spdlog::level::info);
}

TEST(Log, InitTwiceIsOk){
    regauth::core::LogConfig cfg{};
    cfg.level = spdlog::level::warn;
    EXPECT_TRUE(regauth::core::is_ok(regauth::core::log_init(cfg)));
    EXPECT_TRUE(regauth::core::is_ok(regauth::core::log_init(cfg)));
    ASSERT_NE(regauth::core::logger(), nullptr);
    EXPECT_EQ(regauth::core::logger()->level(), spdlog::level::warn);
    regauth::core::log_set_level(spdlog::level::info);
    EXPECT_EQ(regauth::core::logger()->level(), spdlog::level::info);
}

TEST(Log, LoggerRecreatedAfterDrop){
    spdlog::drop("regauth");
    auto recreated = regauth::core::logger();
    ASSERT_NE(recreated, nullptr);
    EXPECT_EQ(recreated->name(), "regauth");
    EXPECT_EQ(spdlog::get("regauth"), recreated);
}
