#pragma once

/// @file simdfletcher.hpp
/// @brief Main header for SimdFletcher vectorized Fletcher checksums

// Platform
#include "simdfletcher/platform/platform.hpp"

// Types
#include "simdfletcher/types/word_types.hpp"

// Kernels
#include "simdfletcher/kernel/scalar_kernel.hpp"
#include "simdfletcher/kernel/lane_ops.hpp"
#include "simdfletcher/kernel/x86_lane_ops.hpp"
#include "simdfletcher/kernel/highway_lane_ops.hpp"
#include "simdfletcher/kernel/vector_kernel.hpp"

// Dispatch
#include "simdfletcher/dispatch/dispatch.hpp"

// Accumulator
#include "simdfletcher/fletcher.hpp"

// Logging
#include "simdfletcher/util/logger.hpp"

namespace sfl {

/// Library version
inline constexpr struct {
    int major = 0;
    int minor = 1;
    int patch = 0;

    [[nodiscard]] constexpr const char* string() const noexcept {
        return "0.1.0";
    }
} VERSION;

} // namespace sfl
