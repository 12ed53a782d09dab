/*
    SimdFletcher Highway Lane Operations

    Portable SIMD register using Google Highway.
    Supports x86 (SSE4, AVX2, AVX-512), ARM (NEON, SVE), RISC-V, WASM.
    Static dispatch: the register shape is the compile target's.
*/

#pragma once

#include <cstddef>
#include <cstdint>

#include "simdfletcher/platform/platform.hpp"
#include "simdfletcher/types/word_types.hpp"

#if SFL_HIGHWAY_AVAILABLE

#include "hwy/highway.h"

namespace sfl::kernel {

namespace hn = hwy::HWY_NAMESPACE;

template<FletcherWord W>
struct HighwayLanes {
    using word_type = W;
    using tag_type = hn::ScalableTag<W>;
    using vector_type = hn::Vec<tag_type>;

    /// Runtime on scalable targets (SVE, RVV)
    [[nodiscard]] static size_t lanes() noexcept {
        return hn::Lanes(tag_type{});
    }

    [[nodiscard]] static vector_type zero() noexcept {
        return hn::Zero(tag_type{});
    }

    [[nodiscard]] static vector_type load(const W* ptr) noexcept {
        return hn::LoadU(tag_type{}, ptr);
    }

    [[nodiscard]] static vector_type add(vector_type a, vector_type b) noexcept {
        return hn::Add(a, b);
    }

    /// Hillis-Steele scan; SlideUpLanes crosses 128-bit blocks
    [[nodiscard]] static vector_type prefix_sum(vector_type v) noexcept {
        const tag_type d;
        const size_t n = hn::Lanes(d);
        for (size_t shift = 1; shift < n; shift <<= 1) {
            v = hn::Add(v, hn::SlideUpLanes(d, v, shift));
        }
        return v;
    }

    [[nodiscard]] static W last_lane(vector_type v) noexcept {
        return hn::ExtractLane(v, hn::Lanes(tag_type{}) - 1);
    }

    [[nodiscard]] static W reduce_sum(vector_type v) noexcept {
        if constexpr (sizeof(W) == 1) {
            // Byte lanes: widen groups of 8 into u64 lanes first
            const hn::Repartition<uint64_t, tag_type> d64;
            return static_cast<W>(hn::ReduceSum(d64, hn::SumsOf8(v)));
        } else {
            return hn::ReduceSum(tag_type{}, v);
        }
    }
};

}  // namespace sfl::kernel

#endif  // SFL_HIGHWAY_AVAILABLE
