#include "adpush/core/error.hpp"
#include "adpush/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using adpush::Err;
using adpush::ErrorKind;
using adpush::Ok;
using adpush::Result;
using adpush::UploadError;
using adpush::make_error;

namespace {

Result<int, UploadError> parse_positive(int value) {
    if (value <= 0) {
        return Err<int>(make_error(ErrorKind::InvalidConfig, "must be positive"));
    }
    return Ok(value);
}

Result<std::string, UploadError> describe_positive(int value) {
    auto parsed = parse_positive(value);
    if (parsed.is_error()) {
        return parsed.forward_error<std::string>();
    }
    return Ok(std::to_string(parsed.value()));
}

} // namespace

TEST(ResultTest, OkAndErrCarryTheirPayload) {
    auto ok = parse_positive(3);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 3);

    auto err = parse_positive(0);
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().kind, ErrorKind::InvalidConfig);
    EXPECT_EQ(err.value_or(7), 7);
}

TEST(ResultTest, ForwardErrorKeepsTheErrorAcrossValueTypes) {
    EXPECT_EQ(describe_positive(5).value(), "5");

    auto forwarded = describe_positive(-1);
    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error().message, "must be positive");
}

TEST(ResultTest, StringValueAndStringErrorStayDistinct) {
    Result<std::string> ok = Ok(std::string("value"));
    Result<std::string> err = Err<std::string>(std::string("problem"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "problem");
}

TEST(ResultTest, VoidResult) {
    Result<void, UploadError> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void, UploadError> err = Err<void>(make_error(ErrorKind::IOError, "short read"));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().kind, ErrorKind::IOError);
}

TEST(UploadErrorTest, DescribeIncludesDiagnosticContext) {
    auto error = make_error(ErrorKind::ChunkExhausted, "chunk failed", "connection reset", 503);
    error.committed_offset = 2048;
    error.attempts = 5;
    error.retry_after = std::chrono::milliseconds(1500);

    const auto text = error.describe();
    EXPECT_NE(text.find("ChunkExhausted"), std::string::npos);
    EXPECT_NE(text.find("offset=2048"), std::string::npos);
    EXPECT_NE(text.find("attempts=5"), std::string::npos);
    EXPECT_NE(text.find("http=503"), std::string::npos);
    EXPECT_NE(text.find("connection reset"), std::string::npos);
    EXPECT_NE(text.find("retry_after=1500ms"), std::string::npos);
    EXPECT_FALSE(error.is_retryable());
    EXPECT_TRUE(make_error(ErrorKind::Transient, "x").is_retryable());
}
