// =============================================================================
// uuid-compactor - Compactor Module
// =============================================================================
// Converts UUIDs to short URL-safe strings and back.
//
// Two compact forms are supported:
// 1. Base64: 22 characters of the URL-safe base-64 alphabet (A-Z a-z 0-9 - _)
// 2. Base32: 26 characters of the RFC 4648 base-32 alphabet (A-Z 2-7), longer
//    but upper-case only and free of 0/1/8 which read like O/I/B
//
// A UUID is packed into 16 big-endian bytes, encoded with padding by cppcodec,
// and truncated to the fixed length. The padding suffix for 16 bytes is always
// the same ("==" for base-64, "======" for base-32), so expansion restores it
// before decoding.
//
// A Compactor is immutable after construction and may be shared across
// threads without synchronization.
// =============================================================================

#ifndef UUIDC_CODEC_COMPACTOR_H
#define UUIDC_CODEC_COMPACTOR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/uuid/uuid.hpp>

#include "uuidc/common/error.h"
#include "uuidc/common/types.h"

namespace uuidc::codec {

// =============================================================================
// Constants
// =============================================================================

/// @brief Length of strings produced by compact64().
inline constexpr std::size_t kCompact64Length = 22;

/// @brief Length of strings produced by compact32().
inline constexpr std::size_t kCompact32Length = 26;

// =============================================================================
// Encoding Selection
// =============================================================================

/// @brief Compact text encodings.
enum class Encoding : std::uint8_t {
    /// @brief URL-safe base-64, 22 characters.
    kBase64 = 0,

    /// @brief RFC 4648 base-32, 26 characters.
    kBase32 = 1
};

/// @brief Length of compact strings in the given encoding.
[[nodiscard]] constexpr std::size_t compactLength(Encoding encoding) noexcept {
    return encoding == Encoding::kBase32 ? kCompact32Length : kCompact64Length;
}

/// @brief Short name of the encoding ("base64" or "base32").
[[nodiscard]] constexpr std::string_view encodingName(Encoding encoding) noexcept {
    return encoding == Encoding::kBase32 ? "base32" : "base64";
}

/// @brief Identify the encoding of a compact string from its length alone.
/// @return The matching encoding, or std::nullopt if no encoding has that length.
[[nodiscard]] constexpr std::optional<Encoding> encodingForLength(std::size_t length) noexcept {
    switch (length) {
        case kCompact64Length:
            return Encoding::kBase64;
        case kCompact32Length:
            return Encoding::kBase32;
        default:
            return std::nullopt;
    }
}

// =============================================================================
// Configuration
// =============================================================================

/// @brief Compactor configuration.
struct CompactorConfig {
    /// @brief Encoding used by compact(const Uuid&).
    Encoding defaultEncoding = Encoding::kBase64;

    /// @brief Validate the configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Compactor
// =============================================================================

/// @brief Converts between UUIDs and their compact string forms.
class Compactor {
public:
    /// @brief Construct with the default configuration.
    Compactor() = default;

    /// @brief Construct with a configuration.
    /// @throws UsageError if the configuration is invalid.
    explicit Compactor(CompactorConfig config);

    /// @brief Get the configuration.
    [[nodiscard]] const CompactorConfig& config() const noexcept { return config_; }

    // -------------------------------------------------------------------------
    // Compaction
    // -------------------------------------------------------------------------

    /// @brief Compact to 22 base-64 characters.
    /// @param high Most significant 64 bits.
    /// @param low Least significant 64 bits.
    [[nodiscard]] std::string compact64(std::int64_t high, std::int64_t low) const;

    /// @brief Compact to 26 base-32 characters.
    /// @param high Most significant 64 bits.
    /// @param low Least significant 64 bits.
    [[nodiscard]] std::string compact32(std::int64_t high, std::int64_t low) const;

    [[nodiscard]] std::string compact64(const Uuid& uuid) const;
    [[nodiscard]] std::string compact32(const Uuid& uuid) const;

    [[nodiscard]] std::string compact64(const boost::uuids::uuid& uuid) const;
    [[nodiscard]] std::string compact32(const boost::uuids::uuid& uuid) const;

    /// @brief Compact a canonical uuid string, e.g. "be177dbe-5639-4ee1-90b1-09e108ffdddc".
    /// @throws FormatError if the string is not a valid uuid.
    [[nodiscard]] std::string compact64(std::string_view uuidString) const;

    /// @brief Compact a canonical uuid string to base-32.
    /// @throws FormatError if the string is not a valid uuid.
    [[nodiscard]] std::string compact32(std::string_view uuidString) const;

    /// @brief Compact with an explicit encoding.
    [[nodiscard]] std::string compact(const Uuid& uuid, Encoding encoding) const;

    /// @brief Compact with the configured default encoding.
    [[nodiscard]] std::string compact(const Uuid& uuid) const;

    // -------------------------------------------------------------------------
    // Expansion
    // -------------------------------------------------------------------------

    /// @brief Expand a string produced by any compact64() or compact32() overload.
    /// @throws FormatError if the length is neither 22 nor 26, or the decoded
    ///         value is not 16 bytes.
    /// @throws DecodeError if the string contains a symbol foreign to the
    ///         encoding selected by its length.
    [[nodiscard]] Uuid expand(std::string_view compactUuid) const;

    /// @brief Expand a base-64 compact string.
    /// @throws LengthError if the length is not 22.
    /// @throws DecodeError, FormatError as for expand().
    [[nodiscard]] Uuid expand64(std::string_view compactUuid) const;

    /// @brief Expand a base-32 compact string.
    /// @throws LengthError if the length is not 26.
    /// @throws DecodeError, FormatError as for expand().
    [[nodiscard]] Uuid expand32(std::string_view compactUuid) const;

    // Non-throwing forms. The error carries the code and message the
    // throwing form would have raised.
    [[nodiscard]] Result<Uuid> tryExpand(std::string_view compactUuid) const;
    [[nodiscard]] Result<Uuid> tryExpand64(std::string_view compactUuid) const;
    [[nodiscard]] Result<Uuid> tryExpand32(std::string_view compactUuid) const;

private:
    CompactorConfig config_;
};

}  // namespace uuidc::codec

#endif  // UUIDC_CODEC_COMPACTOR_H
