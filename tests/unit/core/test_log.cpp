/**
 * @file test_log.cpp
 * @brief Unit tests for Core/Log.h
 */

#include <gtest/gtest.h>
#include <VolSeg/Core/Log.h>

using namespace Vol::Seg;

TEST(LogTest, LoggerIsShared) {
    auto a = Log::Get();
    auto b = Log::Get();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), Log::LOGGER_NAME);
}

TEST(LogTest, RegisteredWithSpdlog) {
    EXPECT_EQ(spdlog::get(Log::LOGGER_NAME), Log::Get());
}

TEST(LogTest, SetLevel) {
    auto previous = Log::Get()->level();

    Log::SetLevel(spdlog::level::debug);
    EXPECT_TRUE(Log::Get()->should_log(spdlog::level::debug));

    Log::SetLevel(spdlog::level::err);
    EXPECT_FALSE(Log::Get()->should_log(spdlog::level::warn));

    Log::SetLevel(previous);
}
