/*
    SimdFletcher x86 Lane Operations

    Hand-written SSE2 / AVX2 / AVX-512BW registers for the vector kernel.

    Lane counts per word width:
    - SSE2    (128-bit): 16 x u8,  8 x u16,  4 x u32, 2 x u64
    - AVX2    (256-bit): 32 x u8, 16 x u16,  8 x u32, 4 x u64
    - AVX-512 (512-bit): 64 x u8, 32 x u16, 16 x u32, 8 x u64

    The prefix scan is Hillis-Steele inside each 128-bit block (byte shifts
    never cross blocks on AVX2/AVX-512), followed by carrying each block's
    total into the blocks above it.
*/

#pragma once

#include <cstddef>
#include <cstdint>

#include "simdfletcher/platform/platform.hpp"
#include "simdfletcher/types/word_types.hpp"

#if SFL_HAS_SSE2
    #include <immintrin.h>
#endif

namespace sfl::kernel {

// ============================================================================
// SSE2 (128-bit)
// ============================================================================

#if SFL_HAS_SSE2

template<FletcherWord W>
struct Sse2Lanes {
    using word_type = W;
    using vector_type = __m128i;

    static constexpr size_t WIDTH = sizeof(W);

    [[nodiscard]] static constexpr size_t lanes() noexcept { return 16 / WIDTH; }

    [[nodiscard]] SFL_FORCE_INLINE static __m128i zero() noexcept {
        return _mm_setzero_si128();
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m128i load(const W* ptr) noexcept {
        return _mm_loadu_si128(reinterpret_cast<const __m128i*>(ptr));
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m128i add(__m128i a, __m128i b) noexcept {
        if constexpr (WIDTH == 1) {
            return _mm_add_epi8(a, b);
        } else if constexpr (WIDTH == 2) {
            return _mm_add_epi16(a, b);
        } else if constexpr (WIDTH == 4) {
            return _mm_add_epi32(a, b);
        } else {
            return _mm_add_epi64(a, b);
        }
    }

    /// Inclusive scan within the 16-byte register
    [[nodiscard]] SFL_FORCE_INLINE static __m128i prefix_sum(__m128i v) noexcept {
        v = add(v, _mm_slli_si128(v, WIDTH));
        if constexpr (WIDTH * 2 < 16) {
            v = add(v, _mm_slli_si128(v, WIDTH * 2));
        }
        if constexpr (WIDTH * 4 < 16) {
            v = add(v, _mm_slli_si128(v, WIDTH * 4));
        }
        if constexpr (WIDTH * 8 < 16) {
            v = add(v, _mm_slli_si128(v, WIDTH * 8));
        }
        return v;
    }

    /// Lane 0 as a word
    [[nodiscard]] SFL_FORCE_INLINE static W first_lane(__m128i v) noexcept {
        if constexpr (WIDTH == 8) {
#if SFL_ARCH_X64
            return static_cast<W>(_mm_cvtsi128_si64(v));
#else
            uint64_t lane;
            _mm_storel_epi64(reinterpret_cast<__m128i*>(&lane), v);
            return lane;
#endif
        } else {
            return static_cast<W>(static_cast<uint32_t>(_mm_cvtsi128_si32(v)));
        }
    }

    [[nodiscard]] SFL_FORCE_INLINE static W last_lane(__m128i v) noexcept {
        return first_lane(_mm_srli_si128(v, 16 - WIDTH));
    }

    /// Fold upper halves onto lower halves until lane 0 holds the total
    [[nodiscard]] SFL_FORCE_INLINE static W reduce_sum(__m128i v) noexcept {
        v = add(v, _mm_srli_si128(v, 8));
        if constexpr (WIDTH <= 4) {
            v = add(v, _mm_srli_si128(v, 4));
        }
        if constexpr (WIDTH <= 2) {
            v = add(v, _mm_srli_si128(v, 2));
        }
        if constexpr (WIDTH == 1) {
            v = add(v, _mm_srli_si128(v, 1));
        }
        return first_lane(v);
    }
};

#endif  // SFL_HAS_SSE2

// ============================================================================
// Block broadcast masks (pshufb indices of each block's last lane)
// ============================================================================

#if SFL_HAS_AVX2

namespace detail {

/// Byte indices of the highest lane in a 16-byte block, repeated per lane
template<FletcherWord W>
[[nodiscard]] constexpr int64_t last_lane_shuffle_pattern() noexcept {
    if constexpr (sizeof(W) == 1) {
        return 0x0F0F0F0F0F0F0F0FLL;
    } else if constexpr (sizeof(W) == 2) {
        return 0x0F0E0F0E0F0E0F0ELL;
    } else if constexpr (sizeof(W) == 4) {
        return 0x0F0E0D0C0F0E0D0CLL;
    } else {
        return 0x0F0E0D0C0B0A0908LL;
    }
}

}  // namespace detail

// ============================================================================
// AVX2 (256-bit)
// ============================================================================

template<FletcherWord W>
struct Avx2Lanes {
    using word_type = W;
    using vector_type = __m256i;

    static constexpr size_t WIDTH = sizeof(W);

    [[nodiscard]] static constexpr size_t lanes() noexcept { return 32 / WIDTH; }

    [[nodiscard]] SFL_FORCE_INLINE static __m256i zero() noexcept {
        return _mm256_setzero_si256();
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m256i load(const W* ptr) noexcept {
        return _mm256_loadu_si256(reinterpret_cast<const __m256i*>(ptr));
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m256i add(__m256i a, __m256i b) noexcept {
        if constexpr (WIDTH == 1) {
            return _mm256_add_epi8(a, b);
        } else if constexpr (WIDTH == 2) {
            return _mm256_add_epi16(a, b);
        } else if constexpr (WIDTH == 4) {
            return _mm256_add_epi32(a, b);
        } else {
            return _mm256_add_epi64(a, b);
        }
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m256i prefix_sum(__m256i v) noexcept {
        // Scan each 128-bit block independently
        v = add(v, _mm256_slli_si256(v, WIDTH));
        if constexpr (WIDTH * 2 < 16) {
            v = add(v, _mm256_slli_si256(v, WIDTH * 2));
        }
        if constexpr (WIDTH * 4 < 16) {
            v = add(v, _mm256_slli_si256(v, WIDTH * 4));
        }
        if constexpr (WIDTH * 8 < 16) {
            v = add(v, _mm256_slli_si256(v, WIDTH * 8));
        }

        // Broadcast the low block's total into the high block
        const __m256i totals = _mm256_shuffle_epi8(
            v, _mm256_set1_epi64x(detail::last_lane_shuffle_pattern<W>()));
        return add(v, _mm256_permute2x128_si256(totals, totals, 0x08));
    }

    [[nodiscard]] SFL_FORCE_INLINE static W last_lane(__m256i v) noexcept {
        return Sse2Lanes<W>::last_lane(_mm256_extracti128_si256(v, 1));
    }

    [[nodiscard]] SFL_FORCE_INLINE static W reduce_sum(__m256i v) noexcept {
        return Sse2Lanes<W>::reduce_sum(Sse2Lanes<W>::add(
            _mm256_castsi256_si128(v), _mm256_extracti128_si256(v, 1)));
    }
};

#endif  // SFL_HAS_AVX2

// ============================================================================
// AVX-512BW (512-bit)
// ============================================================================

#if SFL_HAS_AVX512

template<FletcherWord W>
struct Avx512Lanes {
    using word_type = W;
    using vector_type = __m512i;

    static constexpr size_t WIDTH = sizeof(W);

    [[nodiscard]] static constexpr size_t lanes() noexcept { return 64 / WIDTH; }

    [[nodiscard]] SFL_FORCE_INLINE static __m512i zero() noexcept {
        return _mm512_setzero_si512();
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m512i load(const W* ptr) noexcept {
        return _mm512_loadu_si512(ptr);
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m512i add(__m512i a, __m512i b) noexcept {
        if constexpr (WIDTH == 1) {
            return _mm512_add_epi8(a, b);
        } else if constexpr (WIDTH == 2) {
            return _mm512_add_epi16(a, b);
        } else if constexpr (WIDTH == 4) {
            return _mm512_add_epi32(a, b);
        } else {
            return _mm512_add_epi64(a, b);
        }
    }

    [[nodiscard]] SFL_FORCE_INLINE static __m512i prefix_sum(__m512i v) noexcept {
        // Scan each of the four 128-bit blocks independently
        v = add(v, _mm512_bslli_epi128(v, WIDTH));
        if constexpr (WIDTH * 2 < 16) {
            v = add(v, _mm512_bslli_epi128(v, WIDTH * 2));
        }
        if constexpr (WIDTH * 4 < 16) {
            v = add(v, _mm512_bslli_epi128(v, WIDTH * 4));
        }
        if constexpr (WIDTH * 8 < 16) {
            v = add(v, _mm512_bslli_epi128(v, WIDTH * 8));
        }

        // Block totals t0..t3 broadcast within their blocks, then an
        // exclusive scan over blocks: [0, t0, t0+t1, t0+t1+t2]
        const __m512i none = _mm512_setzero_si512();
        const __m512i totals = _mm512_shuffle_epi8(
            v, _mm512_set1_epi64(detail::last_lane_shuffle_pattern<W>()));
        __m512i carry = _mm512_alignr_epi64(totals, none, 6);
        carry = add(carry, _mm512_alignr_epi64(carry, none, 6));
        carry = add(carry, _mm512_alignr_epi64(carry, none, 4));
        return add(v, carry);
    }

    [[nodiscard]] SFL_FORCE_INLINE static W last_lane(__m512i v) noexcept {
        return Sse2Lanes<W>::last_lane(_mm512_extracti32x4_epi32(v, 3));
    }

    [[nodiscard]] SFL_FORCE_INLINE static W reduce_sum(__m512i v) noexcept {
        return Avx2Lanes<W>::reduce_sum(Avx2Lanes<W>::add(
            _mm512_castsi512_si256(v), _mm512_extracti64x4_epi64(v, 1)));
    }
};

#endif  // SFL_HAS_AVX512

}  // namespace sfl::kernel
