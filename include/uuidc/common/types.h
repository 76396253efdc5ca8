// =============================================================================
// uuid-compactor - Common Type Definitions
// =============================================================================
// Core type definitions for the uuidc library.
//
// This module defines:
// - Uuid: a 128-bit identifier held as two signed 64-bit words
// - UuidBytes: the 16-byte big-endian form of a Uuid
// - packUuid / unpackUuid: conversion between the two
//
// Byte Layout:
//   index 0  = most-significant byte of high
//   index 7  = least-significant byte of high
//   index 8  = most-significant byte of low
//   index 15 = least-significant byte of low
// This is also the layout of boost::uuids::uuid::data.
// =============================================================================

#ifndef UUIDC_COMMON_TYPES_H
#define UUIDC_COMMON_TYPES_H

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <boost/uuid/uuid.hpp>

namespace uuidc {

// =============================================================================
// Constants
// =============================================================================

/// @brief Number of bytes in one 64-bit word.
inline constexpr std::size_t kBytesPerWord = sizeof(std::uint64_t);

/// @brief Number of bytes in a packed Uuid.
inline constexpr std::size_t kUuidBytes = kBytesPerWord * 2;

/// @brief Length of the canonical hyphenated text form.
inline constexpr std::size_t kCanonicalUuidLength = 36;

/// @brief Packed form of a Uuid.
using UuidBytes = std::array<std::uint8_t, kUuidBytes>;

// =============================================================================
// Uuid Value Type
// =============================================================================

/// @brief A 128-bit identifier as most- and least-significant 64-bit words.
/// @note Every bit pattern is valid; no version or variant is implied.
struct Uuid {
    /// @brief Most-significant 64 bits.
    std::int64_t high = 0;

    /// @brief Least-significant 64 bits.
    std::int64_t low = 0;

    constexpr Uuid() noexcept = default;
    constexpr Uuid(std::int64_t highBits, std::int64_t lowBits) noexcept
        : high(highBits), low(lowBits) {}

    friend constexpr bool operator==(const Uuid&, const Uuid&) noexcept = default;
    friend constexpr auto operator<=>(const Uuid&, const Uuid&) noexcept = default;

    /// @brief Parse the canonical form, e.g. "be177dbe-5639-4ee1-90b1-09e108ffdddc".
    /// @throws FormatError if Boost.Uuid rejects the text.
    [[nodiscard]] static Uuid parse(std::string_view text);

    /// @brief Convert from a Boost.Uuid value.
    [[nodiscard]] static Uuid fromBoost(const boost::uuids::uuid& value) noexcept;

    /// @brief Convert to a Boost.Uuid value.
    [[nodiscard]] boost::uuids::uuid toBoost() const noexcept;

    /// @brief Lower-case canonical 36-character form.
    [[nodiscard]] std::string toString() const;
};

// =============================================================================
// Byte Packing
// =============================================================================

/// @brief Split a Uuid into 16 big-endian bytes.
[[nodiscard]] UuidBytes packUuid(const Uuid& uuid) noexcept;

/// @brief Reassemble a Uuid from 16 big-endian bytes.
[[nodiscard]] Uuid unpackUuid(std::span<const std::uint8_t, kUuidBytes> bytes) noexcept;

}  // namespace uuidc

#endif  // UUIDC_COMMON_TYPES_H
