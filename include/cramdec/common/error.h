// =============================================================================
// cramdec - Error Handling Framework
// =============================================================================
// Error handling for the CRAM record decoding library.
//
// This module provides:
// - ErrorCode enum covering every decode failure category
// - CramDecException hierarchy for callers that prefer exceptions
// - Result<T, E> type for functional error handling (using std::expected)
// - ErrorContext naming the data series, content id, tag or record involved
//
// Decoding never retries: every error propagates to the caller immediately
// and is terminal for the slice being decoded.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef CRAMDEC_COMMON_ERROR_H
#define CRAMDEC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace cramdec {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Decode failure categories.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief A core or external buffer ran out before a value was complete.
    kUnexpectedEof = 1,

    /// @brief The compression header declares no encoding for a required data series.
    kMissingDataSeriesEncoding = 2,

    /// @brief An encoding references an external content id with no block.
    kMissingExternalBlock = 3,

    /// @brief A record references a tag set id absent from the preservation map.
    kMissingTagSet = 4,

    /// @brief A tag key has no registered tag encoding.
    kMissingTagEncoding = 5,

    /// @brief Malformed or out-of-range data.
    kInvalidData = 6,

    /// @brief A codec variant that exists in the format but is not decodable here.
    kNotImplemented = 7,

    /// @brief Invalid argument value supplied by the caller.
    kInvalidArgument = 8
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUnexpectedEof:
            return "unexpected EOF";
        case ErrorCode::kMissingDataSeriesEncoding:
            return "missing data series encoding";
        case ErrorCode::kMissingExternalBlock:
            return "missing external block";
        case ErrorCode::kMissingTagSet:
            return "missing tag set";
        case ErrorCode::kMissingTagEncoding:
            return "missing tag encoding";
        case ErrorCode::kInvalidData:
            return "invalid data";
        case ErrorCode::kNotImplemented:
            return "not implemented";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for decode errors.
/// @note Each field is optional; format() prints only the ones that are set.
struct ErrorContext {
    /// @brief Two-letter data series key (e.g. "FC").
    std::string dataSeries;

    /// @brief External block content id.
    std::optional<std::int32_t> contentId;

    /// @brief Tag key rendered as three characters (e.g. "NMi").
    std::string tagKey;

    /// @brief Tag set id from the TagSetIds series.
    std::optional<std::int32_t> tagSetId;

    /// @brief Record id within the slice being decoded.
    std::optional<std::uint64_t> recordId;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Set the data series key.
    /// @return Reference to this for method chaining.
    ErrorContext& withSeries(std::string key) {
        dataSeries = std::move(key);
        return *this;
    }

    /// @brief Set the content id.
    /// @return Reference to this for method chaining.
    ErrorContext& withContentId(std::int32_t id) {
        contentId = id;
        return *this;
    }

    /// @brief Set the tag key.
    /// @return Reference to this for method chaining.
    ErrorContext& withTag(std::string key) {
        tagKey = std::move(key);
        return *this;
    }

    /// @brief Set the tag set id.
    /// @return Reference to this for method chaining.
    ErrorContext& withTagSet(std::int32_t id) {
        tagSetId = id;
        return *this;
    }

    /// @brief Set the record id.
    /// @return Reference to this for method chaining.
    ErrorContext& withRecord(std::uint64_t id) {
        recordId = id;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all cramdec errors.
class CramDecException : public std::exception {
public:
    CramDecException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    CramDecException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~CramDecException() override = default;

    CramDecException(const CramDecException&) = default;
    CramDecException(CramDecException&&) noexcept = default;
    CramDecException& operator=(const CramDecException&) = default;
    CramDecException& operator=(CramDecException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief A core or external stream ended before a value was complete.
class UnexpectedEofError : public CramDecException {
public:
    explicit UnexpectedEofError(std::string message, ErrorContext context = {})
        : CramDecException(ErrorCode::kUnexpectedEof, std::move(message), std::move(context)) {}
};

/// @brief A required data series, tag set, tag encoding or external block is absent.
/// @note Covers the four "missing" codes; code() tells them apart.
class MissingEntryError : public CramDecException {
public:
    MissingEntryError(ErrorCode code, std::string message, ErrorContext context = {})
        : CramDecException(code, std::move(message), std::move(context)) {}
};

/// @brief Malformed data or a value outside its representable range.
class InvalidDataError : public CramDecException {
public:
    explicit InvalidDataError(std::string message, ErrorContext context = {})
        : CramDecException(ErrorCode::kInvalidData, std::move(message), std::move(context)) {}
};

/// @brief A codec that exists in the format but has no decoder here.
class NotImplementedError : public CramDecException {
public:
    explicit NotImplementedError(std::string message, ErrorContext context = {})
        : CramDecException(ErrorCode::kNotImplemented, std::move(message), std::move(context)) {}
};

/// @brief Invalid caller-supplied argument.
class InvalidArgumentError : public CramDecException {
public:
    explicit InvalidArgumentError(std::string message, ErrorContext context = {})
        : CramDecException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, message and context.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// @brief Construct from a CramDecException.
    explicit Error(const CramDecException& ex)
        : code_(ex.code()), message_(ex.message()), context_(ex.context()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Attach or replace the record id in the context.
    Error& withRecord(std::uint64_t id) {
        if (!context_.has_value()) {
            context_.emplace();
        }
        context_->withRecord(id);
        return *this;
    }

    /// @brief Message plus formatted context.
    [[nodiscard]] std::string describe() const;

    /// @brief Throw the exception matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result with context.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message, ErrorContext context) {
    return std::unexpected(Error{code, std::move(message), std::move(context)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message,
                                              ErrorContext context) {
    return std::unexpected(Error{code, std::move(message), std::move(context)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws CramDecException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Void version of unwrapOrThrow.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const CramDecException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInvalidData, ex.what()});
    }
}

}  // namespace cramdec

#endif  // CRAMDEC_COMMON_ERROR_H
