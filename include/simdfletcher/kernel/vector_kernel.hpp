#pragma once

/// @file vector_kernel.hpp
/// @brief Lane-parallel Fletcher update: prefix scan + triangular correction
///
/// The scalar recurrence is strictly sequential. For a batch w_1..w_L with
/// in-batch prefix sums p_j = w_1 + ... + w_j, the exit state is
///
///   sum1 = sum1_0 + p_L
///   sum2 = sum2_0 + L * sum1_0 + (p_1 + ... + p_L)
///
/// since sum1 after word j is sum1_0 + p_j and sum2 adds every one of them.
/// All p_j come from one log-depth scan of the register. Everything is mod
/// 2^k, so reordering and wraparound inside the scan are harmless.
///
/// The horizontal sum of the p_j is linear, so over a run of batches the
/// prefix registers are accumulated lane-wise and reduced once at the end.
/// Only `sum2 += L*sum1; sum1 += p_L` stays on the per-batch scalar chain.

#include <cstddef>
#include <span>
#include <type_traits>

#include "simdfletcher/kernel/lane_ops.hpp"
#include "simdfletcher/kernel/scalar_kernel.hpp"

namespace sfl::kernel {

/// Apply one batch of exactly Ops::lanes() words
template<LaneOps Ops>
[[nodiscard]] SFL_FORCE_INLINE FletcherState<typename Ops::word_type> update_batch(
        FletcherState<typename Ops::word_type> state,
        const typename Ops::word_type* batch) noexcept {
    using W = typename Ops::word_type;

    const auto prefix = Ops::prefix_sum(Ops::load(batch));
    const W lane_count = static_cast<W>(Ops::lanes());

    state.sum2 = wrapping_add(state.sum2, wrapping_mul(lane_count, state.sum1));
    state.sum2 = wrapping_add(state.sum2, Ops::reduce_sum(prefix));
    state.sum1 = wrapping_add(state.sum1, Ops::last_lane(prefix));
    return state;
}

/// Apply every whole batch in `words`; returns the state and leaves the
/// trailing words.size() % L words untouched
template<LaneOps Ops>
[[nodiscard]] SFL_HOT inline FletcherState<typename Ops::word_type> update_batches(
        FletcherState<typename Ops::word_type> state,
        std::type_identity_t<std::span<const typename Ops::word_type>> words) noexcept {
    using W = typename Ops::word_type;

    const size_t lanes = Ops::lanes();
    const size_t full = words.size() - words.size() % lanes;
    if (full == 0) {
        return state;
    }

    const W* SFL_RESTRICT ptr = words.data();
    const W lane_count = static_cast<W>(lanes);

    W sum1 = state.sum1;
    W sum2 = state.sum2;
    auto prefix_acc = Ops::zero();

    for (size_t i = 0; i < full; i += lanes) {
        const auto prefix = Ops::prefix_sum(Ops::load(ptr + i));
        sum2 = wrapping_add(sum2, wrapping_mul(lane_count, sum1));
        sum1 = wrapping_add(sum1, Ops::last_lane(prefix));
        prefix_acc = Ops::add(prefix_acc, prefix);
    }

    sum2 = wrapping_add(sum2, Ops::reduce_sum(prefix_acc));
    return {sum1, sum2};
}

/// Whole batches through the vector path, tail through the scalar kernel.
/// This is the function the dispatcher hands out.
template<LaneOps Ops>
[[nodiscard]] SFL_HOT inline FletcherState<typename Ops::word_type> update_words(
        FletcherState<typename Ops::word_type> state,
        std::span<const typename Ops::word_type> words) noexcept {
    const size_t full = words.size() - words.size() % Ops::lanes();
    state = update_batches<Ops>(state, words.first(full));
    return update_scalar(state, words.subspan(full));
}

}  // namespace sfl::kernel
