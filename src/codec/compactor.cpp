// =============================================================================
// uuid-compactor - Compactor Implementation
// =============================================================================

#include "uuidc/codec/compactor.h"

#include <span>
#include <utility>
#include <vector>

#include <cppcodec/base32_rfc4648.hpp>
#include <cppcodec/base64_url.hpp>
#include <cppcodec/parse_error.hpp>
#include <fmt/format.h>

#include "uuidc/common/logger.h"

namespace uuidc::codec {

namespace {

// =============================================================================
// Codec Configurations
// =============================================================================

/// @brief Everything that differs between the two compact forms.
struct CodecTraits {
    Encoding encoding;

    /// @brief Characters kept after truncation.
    std::size_t compactLength;

    /// @brief Characters per codec block; padded output is a multiple of this.
    std::size_t blockLength;

    std::string (*encode)(const std::uint8_t* binary, std::size_t size);
    std::vector<std::uint8_t> (*decode)(const char* text, std::size_t size);
};

constexpr CodecTraits kBase64Codec{
    Encoding::kBase64, kCompact64Length, 4,
    [](const std::uint8_t* binary, std::size_t size) -> std::string {
        return cppcodec::base64_url::encode(binary, size);
    },
    [](const char* text, std::size_t size) -> std::vector<std::uint8_t> {
        return cppcodec::base64_url::decode(text, size);
    }};

constexpr CodecTraits kBase32Codec{
    Encoding::kBase32, kCompact32Length, 8,
    [](const std::uint8_t* binary, std::size_t size) -> std::string {
        return cppcodec::base32_rfc4648::encode(binary, size);
    },
    [](const char* text, std::size_t size) -> std::vector<std::uint8_t> {
        return cppcodec::base32_rfc4648::decode(text, size);
    }};

constexpr char kPaddingSymbol = '=';

[[nodiscard]] constexpr const CodecTraits& traitsFor(Encoding encoding) noexcept {
    return encoding == Encoding::kBase32 ? kBase32Codec : kBase64Codec;
}

[[nodiscard]] std::string notCompactMessage(std::string_view text) {
    return fmt::format("Not a compact uuid string: {}", text);
}

[[nodiscard]] ErrorContext makeContext(std::string_view text, const CodecTraits& codec) {
    ErrorContext context{std::string(text)};
    context.withEncoding(encodingName(codec.encoding));
    return context;
}

// =============================================================================
// Core Transformations
// =============================================================================

/// @brief Pack, encode and drop the padding suffix.
[[nodiscard]] std::string compactWith(const Uuid& uuid, const CodecTraits& codec) {
    const UuidBytes bytes = packUuid(uuid);
    std::string encoded = codec.encode(bytes.data(), bytes.size());
    encoded.resize(codec.compactLength);
    return encoded;
}

/// @brief Restore the padding suffix, decode and unpack. No length check.
[[nodiscard]] Uuid expandWith(std::string_view text, const CodecTraits& codec) {
    std::string padded(text);
    padded.append((codec.blockLength - text.size() % codec.blockLength) % codec.blockLength,
                  kPaddingSymbol);

    std::vector<std::uint8_t> bytes;
    try {
        bytes = codec.decode(padded.data(), padded.size());
    } catch (const cppcodec::symbol_error& e) {
        UUIDC_LOG_DEBUG("Rejected {} string with foreign symbol 0x{:02x}",
                        encodingName(codec.encoding),
                        static_cast<unsigned>(static_cast<unsigned char>(e.symbol())));
        throw DecodeError(notCompactMessage(text), e.symbol(), makeContext(text, codec));
    } catch (const cppcodec::parse_error& e) {
        UUIDC_LOG_DEBUG("Rejected {} string: {}", encodingName(codec.encoding), e.what());
        throw DecodeError(notCompactMessage(text), makeContext(text, codec));
    }

    if (bytes.size() != kUuidBytes) {
        UUIDC_LOG_DEBUG("Rejected {} string decoding to {} bytes",
                        encodingName(codec.encoding), bytes.size());
        throw FormatError(notCompactMessage(text), makeContext(text, codec));
    }
    return unpackUuid(std::span<const std::uint8_t>(bytes).first<kUuidBytes>());
}

/// @brief Entry-point length check for expand64() and expand32().
void requireLength(std::string_view text, const CodecTraits& codec) {
    if (text.size() != codec.compactLength) {
        UUIDC_LOG_DEBUG("Rejected {} string of length {}", encodingName(codec.encoding),
                        text.size());
        throw LengthError(codec.compactLength, makeContext(text, codec));
    }
}

}  // namespace

// =============================================================================
// CompactorConfig Implementation
// =============================================================================

VoidResult CompactorConfig::validate() const {
    if (defaultEncoding != Encoding::kBase64 && defaultEncoding != Encoding::kBase32) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("Unknown compact encoding: {}",
                                         static_cast<int>(defaultEncoding)));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Compactor Implementation
// =============================================================================

Compactor::Compactor(CompactorConfig config) : config_(std::move(config)) {
    unwrapOrThrow(config_.validate());
}

std::string Compactor::compact64(std::int64_t high, std::int64_t low) const {
    return compactWith(Uuid{high, low}, kBase64Codec);
}

std::string Compactor::compact32(std::int64_t high, std::int64_t low) const {
    return compactWith(Uuid{high, low}, kBase32Codec);
}

std::string Compactor::compact64(const Uuid& uuid) const {
    return compactWith(uuid, kBase64Codec);
}

std::string Compactor::compact32(const Uuid& uuid) const {
    return compactWith(uuid, kBase32Codec);
}

std::string Compactor::compact64(const boost::uuids::uuid& uuid) const {
    return compactWith(Uuid::fromBoost(uuid), kBase64Codec);
}

std::string Compactor::compact32(const boost::uuids::uuid& uuid) const {
    return compactWith(Uuid::fromBoost(uuid), kBase32Codec);
}

std::string Compactor::compact64(std::string_view uuidString) const {
    return compactWith(Uuid::parse(uuidString), kBase64Codec);
}

std::string Compactor::compact32(std::string_view uuidString) const {
    return compactWith(Uuid::parse(uuidString), kBase32Codec);
}

std::string Compactor::compact(const Uuid& uuid, Encoding encoding) const {
    return compactWith(uuid, traitsFor(encoding));
}

std::string Compactor::compact(const Uuid& uuid) const {
    return compact(uuid, config_.defaultEncoding);
}

Uuid Compactor::expand(std::string_view compactUuid) const {
    const std::optional<Encoding> encoding = encodingForLength(compactUuid.size());
    if (!encoding.has_value()) {
        UUIDC_LOG_DEBUG("Rejected compact uuid string of length {}", compactUuid.size());
        throw FormatError(notCompactMessage(compactUuid), ErrorContext{std::string(compactUuid)});
    }
    return expandWith(compactUuid, traitsFor(*encoding));
}

Uuid Compactor::expand64(std::string_view compactUuid) const {
    requireLength(compactUuid, kBase64Codec);
    return expandWith(compactUuid, kBase64Codec);
}

Uuid Compactor::expand32(std::string_view compactUuid) const {
    requireLength(compactUuid, kBase32Codec);
    return expandWith(compactUuid, kBase32Codec);
}

Result<Uuid> Compactor::tryExpand(std::string_view compactUuid) const {
    return tryExecute([&] { return expand(compactUuid); });
}

Result<Uuid> Compactor::tryExpand64(std::string_view compactUuid) const {
    return tryExecute([&] { return expand64(compactUuid); });
}

Result<Uuid> Compactor::tryExpand32(std::string_view compactUuid) const {
    return tryExecute([&] { return expand32(compactUuid); });
}

}  // namespace uuidc::codec
