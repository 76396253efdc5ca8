// =============================================================================
// uuid-compactor - Error Handling Tests
// =============================================================================

#include "uuidc/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace uuidc {
namespace {

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kSuccess), "success");
    EXPECT_EQ(errorCodeToString(ErrorCode::kUsageError), "usage error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kLengthError), "length error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kFormatError), "format error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kDecodeError), "decode error");
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(ExceptionTest, WhatIsMessageVerbatim) {
    const FormatError error("Not a compact uuid string: abc", ErrorContext{"abc"});

    EXPECT_STREQ(error.what(), "Not a compact uuid string: abc");
    EXPECT_EQ(error.code(), ErrorCode::kFormatError);
    ASSERT_TRUE(error.hasContext());
    EXPECT_EQ(error.context()->input, "abc");
}

TEST(ExceptionTest, LengthErrorFormatsExpectedLength) {
    const LengthError error(22, ErrorContext{"AAAA"});

    EXPECT_EQ(error.message(), "Expecting a compact uuid string of length 22");
    EXPECT_EQ(error.expectedLength(), std::optional<std::size_t>(22));
    EXPECT_FALSE(LengthError("custom").expectedLength().has_value());
}

TEST(ExceptionTest, DescribeIncludesCategoryAndContext) {
    ErrorContext context{"AAA%"};
    context.withEncoding("base64");
    const DecodeError error("Not a compact uuid string: AAA%", '%', context);

    const std::string description = error.describe();
    EXPECT_EQ(description.rfind("[decode error] Not a compact uuid string: AAA%", 0), 0U);
    EXPECT_NE(description.find("encoding: base64, input: \"AAA%\""), std::string::npos);
    EXPECT_EQ(error.symbol(), std::optional<char>('%'));
    EXPECT_EQ(DecodeError("bad").describe(), "[decode error] bad");
}

TEST(ExceptionTest, HierarchyCatchableAsBase) {
    try {
        throw DecodeError("bad");
    } catch (const UuidcException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kDecodeError);
        EXPECT_FALSE(e.hasContext());
    }
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, ThrowExceptionMatchesCode) {
    EXPECT_THROW(Error(ErrorCode::kLengthError, "x").throwException(), LengthError);
    EXPECT_THROW(Error(ErrorCode::kFormatError, "x").throwException(), FormatError);
    EXPECT_THROW(Error(ErrorCode::kDecodeError, "x").throwException(), DecodeError);
    EXPECT_THROW(Error(ErrorCode::kUsageError, "x").throwException(), UsageError);
}

TEST(ResultTest, TryExecuteConvertsLibraryExceptions) {
    auto ok = tryExecute([] { return 42; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);

    auto failed = tryExecute([]() -> int { throw FormatError("Not a compact uuid string: "); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kFormatError);
    EXPECT_EQ(failed.error().message(), "Not a compact uuid string: ");
}

TEST(ResultTest, RethrowKeepsDerivedDetails) {
    auto failed = tryExecute([]() -> int {
        ErrorContext context{"AB%"};
        context.withEncoding("base32");
        throw DecodeError("Not a compact uuid string: AB%", '%', context);
    });
    ASSERT_FALSE(failed.has_value());

    try {
        (void)unwrapOrThrow(std::move(failed));
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.symbol(), std::optional<char>('%'));
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->input, "AB%");
        EXPECT_EQ(e.context()->encoding, "base32");
    }
}

TEST(ResultTest, TryExecuteLetsOtherExceptionsThrough) {
    EXPECT_THROW((void)tryExecute([]() -> int { throw std::runtime_error("io"); }),
                 std::runtime_error);
}

TEST(ResultTest, UnwrapOrThrow) {
    EXPECT_EQ(unwrapOrThrow(Result<int>{7}), 7);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kUsageError, "bad")), UsageError);
}

}  // namespace
}  // namespace uuidc
