/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 * @author AnalyzerOrchestrator Team
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace analyzer_orchestrator;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorCarriesKind) {
    Result<int> r = Error{"no healthy endpoint", ErrorKind::CapacityExhausted};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "no healthy endpoint");
    EXPECT_EQ(r.error().kind, ErrorKind::CapacityExhausted);
}

TEST(ResultTest, DefaultKindIsInternal) {
    Error e{"boom"};
    EXPECT_EQ(e.kind, ErrorKind::Internal);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int> r = Error{"fail", ErrorKind::Timeout};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().kind, ErrorKind::Timeout);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{"locked", ErrorKind::LockTimeout};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, ErrorKind::LockTimeout);
}

TEST(ErrorKindTest, RetryableKinds) {
    EXPECT_TRUE(is_retryable(ErrorKind::CapacityExhausted));
    EXPECT_TRUE(is_retryable(ErrorKind::RemoteFailure));
    EXPECT_TRUE(is_retryable(ErrorKind::Timeout));
    EXPECT_FALSE(is_retryable(ErrorKind::InvalidArgument));
    EXPECT_FALSE(is_retryable(ErrorKind::StaleVersion));
    EXPECT_EQ(to_string(ErrorKind::AllocationConflict), "allocation_conflict");
}
