// =============================================================================
// uuid-compactor - Error Handling Implementation
// =============================================================================

#include "uuidc/common/error.h"

#include <fmt/format.h>

namespace uuidc {

std::string UuidcException::describe() const {
    std::string text = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_.has_value()) {
        if (context_->encoding.empty()) {
            text += fmt::format(" (input: \"{}\")", context_->input);
        } else {
            text += fmt::format(" (encoding: {}, input: \"{}\")", context_->encoding,
                                context_->input);
        }
#ifndef NDEBUG
        text += fmt::format(" at {}:{}", context_->location.file_name(),
                            context_->location.line());
#endif
    }
    return text;
}

LengthError::LengthError(std::size_t expectedLength, ErrorContext context)
    : UuidcException(ErrorCode::kLengthError,
                     fmt::format("Expecting a compact uuid string of length {}", expectedLength),
                     std::move(context)),
      expectedLength_(expectedLength) {}

[[noreturn]] void Error::throwException() const {
    if (original_) {
        std::rethrow_exception(original_);
    }
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kLengthError:
            throw LengthError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kDecodeError:
            throw DecodeError(message_);
        case ErrorCode::kSuccess:
            break;
    }
    throw UuidcException(code_, message_);
}

}  // namespace uuidc
