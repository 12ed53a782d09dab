#pragma once

/// @file fletcher.hpp
/// @brief Fletcher checksum accumulator (16/32/64/128-bit variants)
///
/// Sums are reduced modulo 2^k, not the classical 2^k - 1, so results differ
/// from RFC 1146 style Fletcher implementations.
///
/// Usage:
///   sfl::Fletcher16 f;
///   f.update(std::span<const uint8_t>{bytes, len});
///   uint16_t cs = f.value();
///
///   sfl::Fletcher128 g;
///   g.update_batch(words_view);   // any input range of uint64_t
///   sfl::uint128_t cs128 = g.value();

#include <array>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <span>

#include "simdfletcher/types/word_types.hpp"
#include "simdfletcher/kernel/scalar_kernel.hpp"
#include "simdfletcher/dispatch/dispatch.hpp"

namespace sfl {

/// Words staged on the stack by update_batch(); a multiple of every lane
/// count (at most 64), so only the final flush has a scalar tail
inline constexpr size_t STAGING_WORDS = 256;

template<FletcherChecksum Checksum>
class Fletcher {
public:
    using checksum_type = Checksum;
    using word_type = word_type_t<Checksum>;
    using state_type = FletcherState<word_type>;

    /// Zero state, kernel chosen by the process-wide dispatcher
    Fletcher() noexcept
        : Fletcher(simd::active_simd_impl()) {}

    /// Zero state with an explicit kernel; unsupported choices fall back to scalar
    explicit Fletcher(simd::SimdImpl impl) noexcept
        : impl_{simd::is_simd_impl_supported(impl) ? impl : simd::SimdImpl::Scalar}
        , kernel_{simd::kernel_for<word_type>(impl_)} {}

    /// Seeded state: `a` is sum1 (low half), `b` is sum2 (high half)
    [[nodiscard]] static Fletcher with_initial_values(word_type a, word_type b) noexcept {
        Fletcher f;
        f.state_ = {a, b};
        return f;
    }

    // ------------------------------------------------------------------------
    // Updates
    // ------------------------------------------------------------------------

    /// Add a single word
    void update(word_type word) noexcept {
        state_ = kernel::update_one(state_, word);
    }

    /// Add a contiguous run of words: whole lane batches through the
    /// selected kernel, the tail through the scalar kernel
    SFL_HOT void update(std::span<const word_type> words) noexcept {
        if (words.empty()) {
            return;
        }
        state_ = kernel_(state_, words);
    }

    void update(const word_type* data, size_t len) noexcept {
        update(std::span<const word_type>{data, len});
    }

    /// Add words from any input range (lazy, single-pass or unbounded views
    /// are fine). Words are staged into lane-sized batches on the stack.
    template<std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, word_type>
    void update_batch(R&& words) {
        if constexpr (std::ranges::contiguous_range<R> && std::ranges::sized_range<R> &&
                      std::same_as<std::ranges::range_value_t<R>, word_type>) {
            update(std::span<const word_type>{std::ranges::data(words), std::ranges::size(words)});
        } else {
            std::array<word_type, STAGING_WORDS> staging;
            size_t staged = 0;

            for (auto&& word : words) {
                staging[staged++] = static_cast<word_type>(word);
                if (staged == STAGING_WORDS) {
                    state_ = kernel_(state_, std::span<const word_type>{staging.data(), staged});
                    staged = 0;
                }
            }

            if (staged > 0) {
                state_ = kernel_(state_, std::span<const word_type>{staging.data(), staged});
            }
        }
    }

    /// Add words from any input range using only the scalar kernel
    template<std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, word_type>
    void update_scalar(R&& words) {
        state_ = kernel::update_scalar<word_type>(
            state_, std::ranges::begin(words), std::ranges::end(words));
    }

    // ------------------------------------------------------------------------
    // Results
    // ------------------------------------------------------------------------

    /// Checksum so far: (sum2 << k) | sum1. Does not modify the state.
    [[nodiscard]] checksum_type value() const noexcept {
        return pack_checksum<Checksum>(state_);
    }

    [[nodiscard]] word_type sum1() const noexcept { return state_.sum1; }
    [[nodiscard]] word_type sum2() const noexcept { return state_.sum2; }
    [[nodiscard]] state_type state() const noexcept { return state_; }

    /// Kernel used by this accumulator
    [[nodiscard]] simd::SimdImpl simd_impl() const noexcept { return impl_; }

    /// Back to zero; keeps the kernel
    void reset() noexcept {
        state_ = {};
    }

    /// Equal running sums; the kernel is not compared
    [[nodiscard]] bool operator==(const Fletcher& other) const noexcept {
        return state_ == other.state_;
    }

private:
    state_type state_{};
    simd::SimdImpl impl_;
    simd::UpdateFn<word_type> kernel_;
};

/// 16-bit checksum over bytes
using Fletcher16 = Fletcher<uint16_t>;

/// 32-bit checksum over 16-bit words
using Fletcher32 = Fletcher<uint32_t>;

/// 64-bit checksum over 32-bit words
using Fletcher64 = Fletcher<uint64_t>;

/// 128-bit checksum over 64-bit words
using Fletcher128 = Fletcher<uint128_t>;

}  // namespace sfl
