// =============================================================================
// cramdec - Error Handling Tests
// =============================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "cramdec/common/error.h"

namespace cramdec::common::test {

TEST(ErrorTest, DescribeIncludesContext) {
    ErrorContext context;
    context.withSeries("FC").withContentId(12).withRecord(7);
    const Error error{ErrorCode::kMissingDataSeriesEncoding, "no encoding", context};

    const std::string text = error.describe();
    EXPECT_NE(text.find("missing data series encoding"), std::string::npos);
    EXPECT_NE(text.find("no encoding"), std::string::npos);
    EXPECT_NE(text.find("series: FC"), std::string::npos);
    EXPECT_NE(text.find("content id: 12"), std::string::npos);
    EXPECT_NE(text.find("record: 7"), std::string::npos);
}

TEST(ErrorTest, WithRecordCreatesContext) {
    Error error{ErrorCode::kInvalidData, "bad"};
    EXPECT_FALSE(error.context().has_value());

    error.withRecord(3);
    ASSERT_TRUE(error.context().has_value());
    EXPECT_EQ(error.context()->recordId, 3U);

    error.withRecord(4);
    EXPECT_EQ(error.context()->recordId, 4U);
}

TEST(ErrorTest, ThrowsMatchingException) {
    const Error eof{ErrorCode::kUnexpectedEof, "short"};
    EXPECT_THROW(eof.throwException(), UnexpectedEofError);

    const Error missing{ErrorCode::kMissingTagSet, "no set"};
    try {
        missing.throwException();
        FAIL() << "expected MissingEntryError";
    } catch (const MissingEntryError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kMissingTagSet);
        EXPECT_EQ(ex.message(), "no set");
    }

    const Error invalid{ErrorCode::kInvalidData, "bad"};
    EXPECT_THROW(invalid.throwException(), InvalidDataError);

    const Error notImplemented{ErrorCode::kNotImplemented, "golomb"};
    EXPECT_THROW(notImplemented.throwException(), NotImplementedError);
}

TEST(ErrorTest, UnwrapOrThrow) {
    EXPECT_EQ(unwrapOrThrow(Result<int>{5}), 5);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kInvalidArgument, "x")),
                 InvalidArgumentError);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
}

TEST(ErrorTest, TryExecuteConvertsExceptions) {
    auto ok = tryExecute([] { return 42; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);

    auto typed = tryExecute([]() -> int { throw InvalidDataError("typed"); });
    ASSERT_FALSE(typed.has_value());
    EXPECT_EQ(typed.error().code(), ErrorCode::kInvalidData);
    EXPECT_EQ(typed.error().message(), "typed");

    auto generic = tryExecute([] { throw std::runtime_error("boom"); });
    ASSERT_FALSE(generic.has_value());
    EXPECT_EQ(generic.error().message(), "boom");
}

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kMissingExternalBlock), "missing external block");
    EXPECT_EQ(errorCodeToString(ErrorCode::kUnexpectedEof), "unexpected EOF");
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kNotImplemented));
}

}  // namespace cramdec::common::test
