// =============================================================================
// uuid-compactor - Error Handling
// =============================================================================
// Exceptions raised by the uuidc library, and a std::expected-based Result
// for callers that prefer not to catch.
//
// what() returns the message verbatim. Compact-string rejections use the
// fixed formats "Expecting a compact uuid string of length {N}" and
// "Not a compact uuid string: {input}", which existing callers match on.
// =============================================================================

#ifndef UUIDC_COMMON_ERROR_H
#define UUIDC_COMMON_ERROR_H

#include <cstddef>
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

namespace uuidc {

/// @brief Error categories reported by the library.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,

    /// @brief Invalid configuration.
    kUsageError = 1,

    /// @brief Input length does not match the length required by the entry point.
    kLengthError = 2,

    /// @brief Input is not a recognized compact or canonical uuid string.
    kFormatError = 3,

    /// @brief The text codec rejected the input.
    /// @note Symbol outside the alphabet, or malformed padding.
    kDecodeError = 4
};

/// @brief Human-readable name of an error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kLengthError:
            return "length error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kDecodeError:
            return "decode error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context
// =============================================================================

/// @brief Where and on what an error was raised.
/// @note Kept out of what(); read it through UuidcException::context().
struct ErrorContext {
    /// @brief The rejected input text.
    std::string input;

    /// @brief Encoding in use ("base64", "base32"), empty if none applies.
    std::string encoding;

    std::source_location location;

    explicit ErrorContext(std::string text,
                          std::source_location loc = std::source_location::current())
        : input(std::move(text)), location(loc) {}

    ErrorContext& withEncoding(std::string_view name) {
        encoding = std::string(name);
        return *this;
    }
};

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base class of every exception the library throws.
class UuidcException : public std::exception {
public:
    UuidcException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    UuidcException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// @brief "[category] message (encoding: ..., input: ...)", for logs.
    [[nodiscard]] std::string describe() const;

protected:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
};

/// @brief Invalid configuration.
class UsageError : public UuidcException {
public:
    explicit UsageError(std::string message)
        : UuidcException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief A compact string whose length does not match the length required
///        by expand64() or expand32().
class LengthError : public UuidcException {
public:
    explicit LengthError(std::string message)
        : UuidcException(ErrorCode::kLengthError, std::move(message)) {}

    /// @brief Construct from the only length the entry point accepts.
    LengthError(std::size_t expectedLength, ErrorContext context);

    [[nodiscard]] std::optional<std::size_t> expectedLength() const noexcept {
        return expectedLength_;
    }

private:
    std::optional<std::size_t> expectedLength_;
};

/// @brief Not a compact uuid string of any recognized form, or not a
///        canonical uuid string.
class FormatError : public UuidcException {
public:
    explicit FormatError(std::string message)
        : UuidcException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : UuidcException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Input the text codec refused to decode.
class DecodeError : public UuidcException {
public:
    explicit DecodeError(std::string message)
        : UuidcException(ErrorCode::kDecodeError, std::move(message)) {}

    DecodeError(std::string message, ErrorContext context)
        : UuidcException(ErrorCode::kDecodeError, std::move(message), std::move(context)) {}

    /// @brief Construct with the symbol the codec reported as foreign.
    DecodeError(std::string message, char symbol, ErrorContext context)
        : UuidcException(ErrorCode::kDecodeError, std::move(message), std::move(context)),
          symbol_(symbol) {}

    [[nodiscard]] std::optional<char> symbol() const noexcept { return symbol_; }

private:
    std::optional<char> symbol_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result.
/// @note When built from a caught exception, throwException() rethrows that
///       exception unchanged, so the derived type and its details survive a
///       Result round trip.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Wrap an exception caught by the caller.
    /// @param ex The caught exception.
    /// @param original std::current_exception() from the same catch block.
    Error(const UuidcException& ex, std::exception_ptr original)
        : code_(ex.code()), message_(ex.message()), original_(std::move(original)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Rethrow the wrapped exception, or throw the type matching code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::exception_ptr original_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Return the value, or throw the error it holds.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Run func, converting a thrown UuidcException into an error Result.
/// @note Any other exception propagates.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<decltype(func())> {
    try {
        if constexpr (std::is_void_v<decltype(func())>) {
            func();
            return {};
        } else {
            return func();
        }
    } catch (const UuidcException& ex) {
        return std::unexpected(Error{ex, std::current_exception()});
    }
}

}  // namespace uuidc

#endif  // UUIDC_COMMON_ERROR_H
