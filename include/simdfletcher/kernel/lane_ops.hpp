#pragma once

/// @file lane_ops.hpp
/// @brief Static lane-operation interface consumed by the vector kernel
///
/// A lane-ops type wraps one vector register shape (instruction set x word
/// width). The vector kernel is written once against this interface and
/// instantiated per (k, L) pair:
///
///   zero()          all lanes 0
///   load(p)         L consecutive words, unaligned
///   add(a, b)       lane-wise wrapping add
///   prefix_sum(v)   inclusive scan: lane j = v[0] + ... + v[j]
///   last_lane(v)    v[L-1]
///   reduce_sum(v)   v[0] + ... + v[L-1]
///   lanes()         L
///
/// EmulatedLanes below implements the interface on a plain array for any
/// power-of-two L, so the kernel can be verified for every lane width on
/// any host.

#include <array>
#include <concepts>
#include <cstddef>
#include <cstring>

#include "simdfletcher/types/word_types.hpp"

namespace sfl::kernel {

template<typename Ops>
concept LaneOps = requires(const typename Ops::word_type* ptr,
                           typename Ops::vector_type v) {
    requires FletcherWord<typename Ops::word_type>;
    { Ops::lanes() } -> std::convertible_to<size_t>;
    { Ops::zero() } -> std::same_as<typename Ops::vector_type>;
    { Ops::load(ptr) } -> std::same_as<typename Ops::vector_type>;
    { Ops::add(v, v) } -> std::same_as<typename Ops::vector_type>;
    { Ops::prefix_sum(v) } -> std::same_as<typename Ops::vector_type>;
    { Ops::last_lane(v) } -> std::same_as<typename Ops::word_type>;
    { Ops::reduce_sum(v) } -> std::same_as<typename Ops::word_type>;
};

// ============================================================================
// Emulated Register (portable)
// ============================================================================

template<FletcherWord W, size_t L>
    requires (L >= 2 && (L & (L - 1)) == 0)
struct EmulatedLanes {
    using word_type = W;
    using vector_type = std::array<W, L>;

    [[nodiscard]] static constexpr size_t lanes() noexcept { return L; }

    [[nodiscard]] static constexpr vector_type zero() noexcept { return {}; }

    [[nodiscard]] static vector_type load(const W* ptr) noexcept {
        vector_type v;
        std::memcpy(v.data(), ptr, sizeof(v));
        return v;
    }

    [[nodiscard]] static constexpr vector_type add(vector_type a, const vector_type& b) noexcept {
        for (size_t i = 0; i < L; ++i) {
            a[i] = wrapping_add(a[i], b[i]);
        }
        return a;
    }

    /// Hillis-Steele scan, log2(L) shift-and-add steps
    [[nodiscard]] static constexpr vector_type prefix_sum(vector_type v) noexcept {
        for (size_t shift = 1; shift < L; shift <<= 1) {
            vector_type shifted{};
            for (size_t i = shift; i < L; ++i) {
                shifted[i] = v[i - shift];
            }
            v = add(v, shifted);
        }
        return v;
    }

    [[nodiscard]] static constexpr W last_lane(const vector_type& v) noexcept {
        return v[L - 1];
    }

    /// Pairwise tree reduction
    [[nodiscard]] static constexpr W reduce_sum(vector_type v) noexcept {
        for (size_t width = L / 2; width > 0; width >>= 1) {
            for (size_t i = 0; i < width; ++i) {
                v[i] = wrapping_add(v[i], v[i + width]);
            }
        }
        return v[0];
    }
};

}  // namespace sfl::kernel
