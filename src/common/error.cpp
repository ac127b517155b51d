// =============================================================================
// cramdec - Error Handling Framework Implementation
// =============================================================================

#include "cramdec/common/error.h"

#include <fmt/format.h>

namespace cramdec {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::string out;

    auto append = [&out](std::string_view part) {
        if (!out.empty()) {
            out += ", ";
        }
        out += part;
    };

    if (!dataSeries.empty()) {
        append(fmt::format("series: {}", dataSeries));
    }
    if (contentId.has_value()) {
        append(fmt::format("content id: {}", *contentId));
    }
    if (tagSetId.has_value()) {
        append(fmt::format("tag set: {}", *tagSetId));
    }
    if (!tagKey.empty()) {
        append(fmt::format("tag: {}", tagKey));
    }
    if (recordId.has_value()) {
        append(fmt::format("record: {}", *recordId));
    }

#ifndef NDEBUG
    if (!out.empty()) {
        out += fmt::format(" (at {}:{})", location.file_name(), location.line());
    }
#endif

    return out;
}

// =============================================================================
// CramDecException Implementation
// =============================================================================

void CramDecException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);

    if (context_.has_value()) {
        const std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            what_ += fmt::format(" ({})", contextStr);
        }
    }
}

// =============================================================================
// Error Implementation
// =============================================================================

std::string Error::describe() const {
    std::string out = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_.has_value()) {
        const std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            out += fmt::format(" ({})", contextStr);
        }
    }
    return out;
}

[[noreturn]] void Error::throwException() const {
    const ErrorContext context = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kUnexpectedEof:
            throw UnexpectedEofError(message_, context);
        case ErrorCode::kMissingDataSeriesEncoding:
        case ErrorCode::kMissingExternalBlock:
        case ErrorCode::kMissingTagSet:
        case ErrorCode::kMissingTagEncoding:
            throw MissingEntryError(code_, message_, context);
        case ErrorCode::kInvalidData:
            throw InvalidDataError(message_, context);
        case ErrorCode::kNotImplemented:
            throw NotImplementedError(message_, context);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_, context);
        case ErrorCode::kSuccess:
            throw CramDecException(ErrorCode::kSuccess, message_);
    }
    throw CramDecException(code_, message_, context);
}

}  // namespace cramdec
