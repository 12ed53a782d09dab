#pragma once

/// @file word_types.hpp
/// @brief Word and checksum types of the four Fletcher variants
///
/// Each variant packs two k-bit running sums into a 2k-bit checksum:
///   Fletcher16  <- uint8_t words
///   Fletcher32  <- uint16_t words
///   Fletcher64  <- uint32_t words
///   Fletcher128 <- uint64_t words
///
/// All sums are reduced modulo 2^k by plain unsigned wraparound.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "simdfletcher/platform/platform.hpp"

namespace sfl {

/// Native 128-bit checksum type
using uint128_t = unsigned __int128;

// ============================================================================
// Word / Checksum Concepts
// ============================================================================

/// One input unit of a Fletcher checksum
template<typename W>
concept FletcherWord =
    std::same_as<W, uint8_t> || std::same_as<W, uint16_t> ||
    std::same_as<W, uint32_t> || std::same_as<W, uint64_t>;

/// Maps a checksum type to its word type
template<typename Checksum>
struct ChecksumTraits;

template<> struct ChecksumTraits<uint16_t> { using word_type = uint8_t; };
template<> struct ChecksumTraits<uint32_t> { using word_type = uint16_t; };
template<> struct ChecksumTraits<uint64_t> { using word_type = uint32_t; };
template<> struct ChecksumTraits<uint128_t> { using word_type = uint64_t; };

/// A supported checksum result type
template<typename Checksum>
concept FletcherChecksum = requires {
    typename ChecksumTraits<Checksum>::word_type;
} && sizeof(Checksum) == 2 * sizeof(typename ChecksumTraits<Checksum>::word_type);

template<FletcherChecksum Checksum>
using word_type_t = typename ChecksumTraits<Checksum>::word_type;

/// Bit width k of a word
template<FletcherWord W>
inline constexpr unsigned WORD_BITS = sizeof(W) * 8;

// ============================================================================
// Wrapping Arithmetic
// ============================================================================

namespace detail {

/// Unsigned type at least as wide as int, so uint8_t/uint16_t operands never
/// promote to signed int (65535 * 65535 would overflow it)
template<FletcherWord W>
using promoted_t = std::conditional_t<(sizeof(W) < sizeof(unsigned)), unsigned, W>;

}  // namespace detail

/// (a + b) mod 2^k
template<FletcherWord W>
[[nodiscard]] SFL_FORCE_INLINE constexpr W wrapping_add(W a, W b) noexcept {
    using P = detail::promoted_t<W>;
    return static_cast<W>(static_cast<P>(a) + static_cast<P>(b));
}

/// (a * b) mod 2^k
template<FletcherWord W>
[[nodiscard]] SFL_FORCE_INLINE constexpr W wrapping_mul(W a, W b) noexcept {
    using P = detail::promoted_t<W>;
    return static_cast<W>(static_cast<P>(a) * static_cast<P>(b));
}

// ============================================================================
// Running Sums
// ============================================================================

/// The two modular running sums of a Fletcher checksum
template<FletcherWord W>
struct FletcherState {
    W sum1{0};  ///< Sum of words (low half of the checksum)
    W sum2{0};  ///< Sum of the running sum1 history (high half)

    [[nodiscard]] constexpr bool operator==(const FletcherState&) const noexcept = default;
};

/// Pack (sum2 << k) | sum1
template<FletcherChecksum Checksum>
[[nodiscard]] constexpr Checksum pack_checksum(
        FletcherState<word_type_t<Checksum>> state) noexcept {
    constexpr unsigned shift = WORD_BITS<word_type_t<Checksum>>;
    return static_cast<Checksum>(
        (static_cast<Checksum>(state.sum2) << shift) | static_cast<Checksum>(state.sum1));
}

}  // namespace sfl
