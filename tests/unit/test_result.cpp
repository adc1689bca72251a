/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace grid_deploy;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ErrorCarriesCode) {
    Result<int> r = Error{ErrorCode::DuplicateName, "svc already deployed"};
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().is(ErrorCode::DuplicateName));
    EXPECT_FALSE(r.error().is(ErrorCode::Configuration));
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>(ErrorCode::ServiceUnavailable, "no instance");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(r.error().what(), "no instance");
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

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsCode) {
    Result<int> r = Error{ErrorCode::Timeout, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().code, ErrorCode::Timeout);
}

TEST(ResultTest, AndThen) {
    Result<int> r = 4;
    auto halved = r.and_then([](int v) -> Result<int> {
        if (v % 2 != 0) return Error{ErrorCode::Configuration, "odd"};
        return v / 2;
    });
    ASSERT_TRUE(halved);
    EXPECT_EQ(*halved, 2);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorCode::NotFound, "missing"};
    EXPECT_TRUE(ok);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::NotFound);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(ErrorCode::DuplicateName), "duplicate_name");
    EXPECT_EQ(to_string(ErrorCode::Configuration), "configuration");
    EXPECT_EQ(to_string(ErrorCode::InstanceInit), "instance_init");
    EXPECT_EQ(to_string(ErrorCode::ServiceUnavailable), "service_unavailable");
    EXPECT_EQ(to_string(ErrorCode::AffinityUnresolved), "affinity_unresolved");
}
