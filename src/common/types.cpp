// =============================================================================
// uuid-compactor - Common Type Implementation
// =============================================================================

#include "uuidc/common/types.h"

#include <algorithm>
#include <climits>
#include <stdexcept>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

#include "uuidc/common/error.h"

namespace uuidc {

namespace {

/// @brief Write one word into bytes [offset, offset + 8), most-significant first.
void packWord(std::int64_t word, UuidBytes& bytes, std::size_t offset) noexcept {
    auto bits = static_cast<std::uint64_t>(word);
    for (std::size_t i = kBytesPerWord; i > 0; --i) {
        bytes[offset + i - 1] = static_cast<std::uint8_t>(bits & 0xFFU);
        bits >>= CHAR_BIT;
    }
}

/// @brief Read one word from bytes [offset, offset + 8), most-significant first.
/// @note Accumulates in an unsigned word so no byte is sign-extended.
std::int64_t unpackWord(std::span<const std::uint8_t, kUuidBytes> bytes,
                        std::size_t offset) noexcept {
    std::uint64_t bits = 0;
    for (std::size_t i = 0; i < kBytesPerWord; ++i) {
        bits = (bits << CHAR_BIT) | static_cast<std::uint64_t>(bytes[offset + i]);
    }
    return static_cast<std::int64_t>(bits);
}

}  // namespace

// =============================================================================
// Byte Packing
// =============================================================================

UuidBytes packUuid(const Uuid& uuid) noexcept {
    UuidBytes bytes{};
    packWord(uuid.high, bytes, 0);
    packWord(uuid.low, bytes, kBytesPerWord);
    return bytes;
}

Uuid unpackUuid(std::span<const std::uint8_t, kUuidBytes> bytes) noexcept {
    return Uuid{unpackWord(bytes, 0), unpackWord(bytes, kBytesPerWord)};
}

// =============================================================================
// Uuid Implementation
// =============================================================================

Uuid Uuid::parse(std::string_view text) {
    boost::uuids::string_generator generator;
    try {
        return fromBoost(generator(text.begin(), text.end()));
    } catch (const std::runtime_error&) {
        throw FormatError(fmt::format("Invalid uuid string: {}", text),
                          ErrorContext{std::string(text)});
    }
}

Uuid Uuid::fromBoost(const boost::uuids::uuid& value) noexcept {
    UuidBytes bytes{};
    std::copy(value.begin(), value.end(), bytes.begin());
    return unpackUuid(bytes);
}

boost::uuids::uuid Uuid::toBoost() const noexcept {
    const UuidBytes bytes = packUuid(*this);
    boost::uuids::uuid value{};
    std::copy(bytes.begin(), bytes.end(), value.begin());
    return value;
}

std::string Uuid::toString() const {
    return boost::uuids::to_string(toBoost());
}

}  // namespace uuidc
