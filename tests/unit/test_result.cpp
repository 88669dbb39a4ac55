/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

using namespace constellation_planner;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"antenna busy"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "antenna busy");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrowsWithReason) {
    Result<int> r = Error{"no window"};
    try {
        (void)r.value();
        FAIL() << "value() on an error result must throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("no window"), std::string::npos);
    }
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{"fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 5;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v > 3) return std::string{"big"};
        return Error{"small"};
    });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "big");
}

TEST(ResultTest, MoveOnlyPayload) {
    Result<std::unique_ptr<int>> r(std::make_unique<int>(7));
    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, ErrorWithContext) {
    const Error e{"gap 3.0s < 5.0s"};
    EXPECT_EQ(e.with_context("BJGS_ANT01").message, "BJGS_ANT01: gap 3.0s < 5.0s");
}

TEST(ResultTest, MakeError) {
    auto r = make_error<double>("bad volume");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "bad volume");
}

TEST(ResultVoidTest, SuccessAndError) {
    Result<void> ok;
    Result<void> failed = Error{"conflict"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "conflict");
    EXPECT_THROW((void)ok.error(), std::runtime_error);
}
