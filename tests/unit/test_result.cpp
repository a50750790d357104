/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace exec_engine;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().kind, ErrorKind::Internal);
}

TEST(ResultTest, ErrorKindIsCarried) {
    Result<int> r = Error{ErrorKind::NotFound, "missing"};
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().is(ErrorKind::NotFound));
    EXPECT_FALSE(r.error().is(ErrorKind::Storage));
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

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
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

TEST(ResultTest, AndThenShortCircuits) {
    auto half = [](int v) -> Result<int> {
        if (v % 2 != 0) return Error{ErrorKind::InvalidArgument, "odd"};
        return v / 2;
    };
    Result<int> even = 8;
    Result<int> odd = 7;
    EXPECT_EQ(*even.and_then(half), 4);
    EXPECT_TRUE(odd.and_then(half).error().is(ErrorKind::InvalidArgument));
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorKind::Storage, "disk gone"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::Storage);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>(ErrorKind::Conflict, "duplicate");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Conflict);
}

TEST(ResultTest, ErrorKindNames) {
    EXPECT_EQ(to_string(ErrorKind::Provision), "provision");
    EXPECT_EQ(to_string(ErrorKind::Timeout), "timeout");
    EXPECT_EQ(to_string(ErrorKind::Crash), "crashed");
    EXPECT_EQ(to_string(ErrorKind::Storage), "storage");
    EXPECT_EQ(to_string(ErrorKind::ShuttingDown), "shutting_down");
}
