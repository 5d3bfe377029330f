#include <gtest/gtest.h>
#include <string>

#include "test_support.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
#include "util/status.hpp"

TEST(LogLevel, FiltersByThreshold)
{
    using namespace cjkpost;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);
    EXPECT_NE(out2.find("[ERROR]"), std::string::npos);

    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    set_log_level(Level::Info);
}

TEST(LogLevel, FromEnv)
{
    using namespace cjkpost;
    test_support::EnvGuard g(constants::ENV_LOG_LEVEL);

    g.set("warn");
    set_log_level_from_env();
    EXPECT_EQ(global_level(), Level::Warning);

    // unset leaves the threshold alone
    g.unset();
    set_log_level_from_env();
    EXPECT_EQ(global_level(), Level::Warning);

    g.set("bogus");
    set_log_level_from_env();
    EXPECT_EQ(global_level(), Level::Info);
}

TEST(Status, Names)
{
    using cjkpost::Status;
    EXPECT_STREQ(cjkpost::status_name(Status::Ok), "Ok");
    EXPECT_STREQ(cjkpost::status_name(Status::ProtocolViolation), "ProtocolViolation");
}
