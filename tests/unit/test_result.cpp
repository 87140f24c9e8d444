/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and ErrorCode.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace buffered_statsd;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorCarriesCode) {
    Result<int> r = Error{"buffer gone", ErrorCode::Closed};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "buffer gone");
    EXPECT_EQ(r.error().code, ErrorCode::Closed);
}

TEST(ResultTest, DefaultCodeIsUnknown) {
    Error e{"plain"};
    EXPECT_EQ(e.code, ErrorCode::Unknown);
    EXPECT_EQ(e.what(), "plain");
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int> good = 21;
    auto doubled = good.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);

    Result<int> bad = Error{"fail", ErrorCode::Config};
    auto mapped = bad.map([](int v) { return v * 2; });
    ASSERT_FALSE(mapped.has_value());
    EXPECT_EQ(mapped.error().code, ErrorCode::Config);
}

TEST(ResultTest, VoidResult) {
    auto success = ok();
    EXPECT_TRUE(success);
    EXPECT_THROW((void)success.error(), std::runtime_error);

    Result<void> failure = Error{"send failed", ErrorCode::Transport};
    ASSERT_FALSE(failure);
    EXPECT_EQ(failure.error().code, ErrorCode::Transport);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>("bad port", ErrorCode::Config);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "bad port");

    auto v = make_error("timed out", ErrorCode::Timeout);
    ASSERT_FALSE(v);
    EXPECT_EQ(v.error().code, ErrorCode::Timeout);
}

TEST(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(to_string(ErrorCode::Closed), "closed");
    EXPECT_EQ(to_string(ErrorCode::KindMismatch), "kind_mismatch");
    EXPECT_EQ(to_string(ErrorCode::Fault), "fault");
}
