#pragma once

/// @file scalar_kernel.hpp
/// @brief Reference sequential Fletcher update
///
///   sum1' = (sum1 + word)  mod 2^k
///   sum2' = (sum2 + sum1') mod 2^k
///
/// Every vector kernel must reproduce these (sum1, sum2) pairs bit for bit.

#include <iterator>
#include <span>
#include <type_traits>

#include "simdfletcher/types/word_types.hpp"

namespace sfl::kernel {

/// Apply one word
template<FletcherWord W>
[[nodiscard]] SFL_FORCE_INLINE constexpr FletcherState<W> update_one(
        FletcherState<W> state, W word) noexcept {
    state.sum1 = wrapping_add(state.sum1, word);
    state.sum2 = wrapping_add(state.sum2, state.sum1);
    return state;
}

/// Apply an iterator range word by word
template<FletcherWord W, std::input_iterator It, std::sentinel_for<It> S>
[[nodiscard]] constexpr FletcherState<W> update_scalar(
        FletcherState<W> state, It first, S last) {
    for (; first != last; ++first) {
        state = update_one(state, static_cast<W>(*first));
    }
    return state;
}

/// Apply a contiguous run of words
template<FletcherWord W>
[[nodiscard]] constexpr FletcherState<W> update_scalar(
        FletcherState<W> state, std::type_identity_t<std::span<const W>> words) noexcept {
    W sum1 = state.sum1;
    W sum2 = state.sum2;
    for (W word : words) {
        sum1 = wrapping_add(sum1, word);
        sum2 = wrapping_add(sum2, sum1);
    }
    return {sum1, sum2};
}

// Dispatch-table signature (see dispatch/dispatch.hpp)
template<FletcherWord W>
[[nodiscard]] inline FletcherState<W> update_words_scalar(
        FletcherState<W> state, std::span<const W> words) noexcept {
    return update_scalar(state, words);
}

}  // namespace sfl::kernel
