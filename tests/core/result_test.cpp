#include "ingest/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using ingest::Err;
using ingest::Error;
using ingest::ErrorKind;
using ingest::Ok;
using ingest::Result;

TEST(ResultTest, HoldsValue) {
    Result<int> result = Ok(42);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.value_or(7), 42);
}

TEST(ResultTest, HoldsError) {
    Result<int> result = Err<int>(Error::io_failure("disk gone"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::IoFailure);
    EXPECT_EQ(result.error().message, "disk gone");
    EXPECT_EQ(result.value_or(7), 7);
}

TEST(ResultTest, VoidResult) {
    auto ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> failed = Err<void>(Error::invalid_argument("nope"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::InvalidArgument);
}

TEST(ErrorTest, RetriesExhaustedKeepsStatusAndMessage) {
    const Error last = Error::api_error(503, "Service Unavailable");
    const Error exhausted = Error::retries_exhausted(last);

    EXPECT_EQ(exhausted.kind, ErrorKind::RetriesExhausted);
    EXPECT_EQ(exhausted.status_code, 503);
    EXPECT_NE(exhausted.message.find("Service Unavailable"), std::string::npos);
}

TEST(ErrorTest, DescribeIncludesKindAndStatus) {
    EXPECT_EQ(Error::api_error(429, "Too Many Requests").describe(), "api error: 429 Too Many Requests");
    EXPECT_EQ(Error::upload_rejected("bad part").describe(), "upload error: bad part");
    EXPECT_FALSE(Error::network_failure("reset").has_status());
}
