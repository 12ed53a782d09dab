#pragma once

/// @file dispatch.hpp
/// @brief Kernel selection by host vector capability
///
/// Two policies:
///   Static  - SFL_STATIC_DISPATCH: widest instruction set compiled in,
///             no probing
///   Runtime - CPUID probe on first use, memoized for the process
///
/// Under the runtime policy SFL_SIMD_IMPL=scalar|sse2|avx2|avx512|highway
/// overrides the probe (for testing). Nothing here ever fails: an unusable
/// request or a host without vector support ends up on the scalar kernel.

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "simdfletcher/platform/platform.hpp"
#include "simdfletcher/types/word_types.hpp"
#include "simdfletcher/kernel/scalar_kernel.hpp"
#include "simdfletcher/kernel/vector_kernel.hpp"
#include "simdfletcher/kernel/x86_lane_ops.hpp"
#include "simdfletcher/kernel/highway_lane_ops.hpp"
#include "simdfletcher/util/logger.hpp"

namespace sfl::simd {

// ============================================================================
// Implementation Tags
// ============================================================================

/// SIMD implementation level
enum class SimdImpl : uint8_t {
    Scalar = 0,
    SSE2 = 1,
    AVX2 = 2,
    AVX512 = 3,
    Highway = 4
};

enum class DispatchPolicy : uint8_t {
    Static = 0,
    Runtime = 1
};

/// Get implementation name
[[nodiscard]] inline constexpr const char* simd_impl_name(SimdImpl impl) noexcept {
    switch (impl) {
        case SimdImpl::Scalar:  return "Scalar";
        case SimdImpl::SSE2:    return "SSE2";
        case SimdImpl::AVX2:    return "AVX2";
        case SimdImpl::AVX512:  return "AVX-512";
        case SimdImpl::Highway: return "Highway";
    }
    return "Unknown";
}

[[nodiscard]] inline constexpr const char* dispatch_policy_name(DispatchPolicy policy) noexcept {
    return policy == DispatchPolicy::Static ? "static" : "runtime";
}

/// Parse an SFL_SIMD_IMPL value (lower case)
[[nodiscard]] inline constexpr std::optional<SimdImpl> parse_simd_impl(std::string_view text) noexcept {
    if (text == "scalar") return SimdImpl::Scalar;
    if (text == "sse2") return SimdImpl::SSE2;
    if (text == "avx2") return SimdImpl::AVX2;
    if (text == "avx512" || text == "avx-512") return SimdImpl::AVX512;
    if (text == "highway") return SimdImpl::Highway;
    return std::nullopt;
}

/// Build-time policy
[[nodiscard]] inline constexpr DispatchPolicy dispatch_policy() noexcept {
    return SFL_DISPATCH_STATIC ? DispatchPolicy::Static : DispatchPolicy::Runtime;
}

// ============================================================================
// Capability Queries
// ============================================================================

/// True if the implementation was compiled into this binary
[[nodiscard]] inline constexpr bool is_simd_impl_compiled(SimdImpl impl) noexcept {
    switch (impl) {
        case SimdImpl::Scalar:  return true;
        case SimdImpl::SSE2:    return SFL_HAS_SSE2;
        case SimdImpl::AVX2:    return SFL_HAS_AVX2;
        case SimdImpl::AVX512:  return SFL_HAS_AVX512;
        case SimdImpl::Highway: return SFL_HIGHWAY_AVAILABLE;
    }
    return false;
}

/// Widest implementation compiled in; the static-policy choice
[[nodiscard]] inline constexpr SimdImpl static_simd_impl() noexcept {
#if SFL_HAS_AVX512
    return SimdImpl::AVX512;
#elif SFL_HAS_AVX2
    return SimdImpl::AVX2;
#elif SFL_HAS_SSE2
    return SimdImpl::SSE2;
#elif SFL_HIGHWAY_AVAILABLE
    return SimdImpl::Highway;
#else
    return SimdImpl::Scalar;
#endif
}

/// True if the running CPU can execute the implementation (CPUID).
/// Highway is compiled for its static target, which the build already
/// assumes the host has.
[[nodiscard]] inline bool cpu_supports(SimdImpl impl) noexcept {
    switch (impl) {
        case SimdImpl::Scalar:
        case SimdImpl::Highway:
            return true;
#if (SFL_ARCH_X64 || SFL_ARCH_X86) && (SFL_COMPILER_GCC || SFL_COMPILER_CLANG)
        case SimdImpl::SSE2:
            return __builtin_cpu_supports("sse2");
        case SimdImpl::AVX2:
            return __builtin_cpu_supports("avx2");
        case SimdImpl::AVX512:
            return __builtin_cpu_supports("avx512f") && __builtin_cpu_supports("avx512bw");
#endif
        default:
            return false;
    }
}

/// Compiled in and executable on this CPU. The static policy trusts the
/// build flags and never probes.
[[nodiscard]] inline bool is_simd_impl_supported(SimdImpl impl) noexcept {
    if constexpr (dispatch_policy() == DispatchPolicy::Static) {
        return is_simd_impl_compiled(impl);
    } else {
        return is_simd_impl_compiled(impl) && cpu_supports(impl);
    }
}

/// Every implementation usable on this host, scalar first
[[nodiscard]] inline std::vector<SimdImpl> available_simd_impls() {
    std::vector<SimdImpl> impls;
    for (SimdImpl impl : {SimdImpl::Scalar, SimdImpl::SSE2, SimdImpl::AVX2,
                          SimdImpl::AVX512, SimdImpl::Highway}) {
        if (is_simd_impl_supported(impl)) {
            impls.push_back(impl);
        }
    }
    return impls;
}

// ============================================================================
// Kernel Table
// ============================================================================

/// Update function signature shared by every kernel
template<FletcherWord W>
using UpdateFn = FletcherState<W> (*)(FletcherState<W>, std::span<const W>) noexcept;

/// Select the update function for a word width. Implementations that are
/// not compiled in resolve to the scalar kernel.
template<FletcherWord W>
[[nodiscard]] inline constexpr UpdateFn<W> kernel_for(SimdImpl impl) noexcept {
    switch (impl) {
#if SFL_HAS_AVX512
        case SimdImpl::AVX512:
            return &kernel::update_words<kernel::Avx512Lanes<W>>;
#endif
#if SFL_HAS_AVX2
        case SimdImpl::AVX2:
            return &kernel::update_words<kernel::Avx2Lanes<W>>;
#endif
#if SFL_HAS_SSE2
        case SimdImpl::SSE2:
            return &kernel::update_words<kernel::Sse2Lanes<W>>;
#endif
#if SFL_HIGHWAY_AVAILABLE
        case SimdImpl::Highway:
            return &kernel::update_words<kernel::HighwayLanes<W>>;
#endif
        case SimdImpl::Scalar:
        default:
            return &kernel::update_words_scalar<W>;
    }
}

// ============================================================================
// Runtime Dispatch
// ============================================================================

namespace detail {

inline std::atomic<bool> g_initialized{false};
inline SimdImpl g_active_impl = SimdImpl::Scalar;

/// Detect CPU capabilities at runtime using CPUID
[[nodiscard]] inline SimdImpl detect_best_impl() noexcept {
    for (SimdImpl impl : {SimdImpl::AVX512, SimdImpl::AVX2, SimdImpl::SSE2, SimdImpl::Highway}) {
        if (is_simd_impl_supported(impl)) {
            return impl;
        }
    }
    return SimdImpl::Scalar;
}

/// Apply SFL_SIMD_IMPL on top of the probed choice
[[nodiscard]] inline SimdImpl apply_env_override(SimdImpl detected) noexcept {
    const char* value = std::getenv("SFL_SIMD_IMPL");
    if (value == nullptr || *value == '\0') {
        return detected;
    }

    const auto requested = parse_simd_impl(value);
    if (!requested) {
        SFL_LOG_WARN("SFL_SIMD_IMPL={} not recognized, keeping {}",
                     value, simd_impl_name(detected));
        return detected;
    }
    if (!is_simd_impl_supported(*requested)) {
        SFL_LOG_WARN("SFL_SIMD_IMPL={} not supported on this host, keeping {}",
                     value, simd_impl_name(detected));
        return detected;
    }
    return *requested;
}

}  // namespace detail

/// Initialize SIMD dispatch (idempotent; runs the probe once per process)
inline void init_simd_dispatch() noexcept {
    static std::once_flag flag;
    std::call_once(flag, []() {
        if constexpr (dispatch_policy() == DispatchPolicy::Static) {
            detail::g_active_impl = static_simd_impl();
        } else {
            detail::g_active_impl = detail::apply_env_override(detail::detect_best_impl());
        }

        SFL_LOG_INFO("Fletcher kernel: {} ({} dispatch, {} {})",
                     simd_impl_name(detail::g_active_impl),
                     dispatch_policy_name(dispatch_policy()),
                     platform::arch_name(), platform::compiler_name());

        detail::g_initialized.store(true, std::memory_order_release);
    });
}

/// Get current active SIMD implementation
[[nodiscard]] inline SimdImpl active_simd_impl() noexcept {
    if (!detail::g_initialized.load(std::memory_order_acquire)) [[unlikely]] {
        init_simd_dispatch();
    }
    return detail::g_active_impl;
}

}  // namespace sfl::simd
