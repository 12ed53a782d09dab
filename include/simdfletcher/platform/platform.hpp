#pragma once

/// @file platform.hpp
/// @brief Platform, compiler and SIMD detection for the checksum kernels

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define SFL_PLATFORM_WINDOWS 1
    #define SFL_PLATFORM_LINUX 0
    #define SFL_PLATFORM_MACOS 0
    #define SFL_PLATFORM_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define SFL_PLATFORM_WINDOWS 0
    #define SFL_PLATFORM_LINUX 0
    #define SFL_PLATFORM_MACOS 1
    #define SFL_PLATFORM_NAME "macOS"
#elif defined(__linux__)
    #define SFL_PLATFORM_WINDOWS 0
    #define SFL_PLATFORM_LINUX 1
    #define SFL_PLATFORM_MACOS 0
    #define SFL_PLATFORM_NAME "Linux"
#else
    #define SFL_PLATFORM_WINDOWS 0
    #define SFL_PLATFORM_LINUX 0
    #define SFL_PLATFORM_MACOS 0
    #define SFL_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Compiler Detection
// ============================================================================

#if defined(_MSC_VER) && !defined(__clang__)
    #define SFL_COMPILER_MSVC 1
    #define SFL_COMPILER_GCC 0
    #define SFL_COMPILER_CLANG 0
    #define SFL_COMPILER_NAME "MSVC"
#elif defined(__clang__)
    #define SFL_COMPILER_MSVC 0
    #define SFL_COMPILER_GCC 0
    #define SFL_COMPILER_CLANG 1
    #define SFL_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
    #define SFL_COMPILER_MSVC 0
    #define SFL_COMPILER_GCC 1
    #define SFL_COMPILER_CLANG 0
    #define SFL_COMPILER_NAME "GCC"
#else
    #define SFL_COMPILER_MSVC 0
    #define SFL_COMPILER_GCC 0
    #define SFL_COMPILER_CLANG 0
    #define SFL_COMPILER_NAME "Unknown"
#endif

// Fletcher128 packs two 64-bit sums and needs a native 128-bit integer
#if !defined(__SIZEOF_INT128__)
    #error "SimdFletcher requires a compiler with unsigned __int128 (GCC or Clang)"
#endif

// ============================================================================
// Architecture Detection
// ============================================================================

#if defined(__x86_64__) || defined(_M_X64)
    #define SFL_ARCH_X64 1
    #define SFL_ARCH_X86 0
    #define SFL_ARCH_ARM64 0
    #define SFL_ARCH_NAME "x86_64"
#elif defined(__i386__) || defined(_M_IX86)
    #define SFL_ARCH_X64 0
    #define SFL_ARCH_X86 1
    #define SFL_ARCH_ARM64 0
    #define SFL_ARCH_NAME "x86"
#elif defined(__aarch64__) || defined(_M_ARM64)
    #define SFL_ARCH_X64 0
    #define SFL_ARCH_X86 0
    #define SFL_ARCH_ARM64 1
    #define SFL_ARCH_NAME "ARM64"
#else
    #define SFL_ARCH_X64 0
    #define SFL_ARCH_X86 0
    #define SFL_ARCH_ARM64 0
    #define SFL_ARCH_NAME "Unknown"
#endif

// ============================================================================
// SIMD Detection
// ============================================================================

// SFL_HAS_SIMD is defined by CMake (SFL_ENABLE_SIMD) and gates all
// hand-written x86 kernels. The instruction sets themselves come from the
// compiler flags (-msse2 is implied on x86_64, -mavx2, -mavx512bw, -march=native).

// SSE2 (128-bit)
#if defined(SFL_HAS_SIMD) && SFL_HAS_SIMD && (SFL_ARCH_X64 || SFL_ARCH_X86) && defined(__SSE2__)
    #define SFL_HAS_SSE2 1
#else
    #define SFL_HAS_SSE2 0
#endif

// AVX2 (256-bit)
#if SFL_HAS_SSE2 && defined(__AVX2__)
    #define SFL_HAS_AVX2 1
#else
    #define SFL_HAS_AVX2 0
#endif

// AVX-512 (512-bit); byte and word lanes need the BW extension
#if SFL_HAS_AVX2 && defined(__AVX512F__) && defined(__AVX512BW__)
    #define SFL_HAS_AVX512 1
#else
    #define SFL_HAS_AVX512 0
#endif

// ARM NEON (ARM64), reached through Highway
#if SFL_ARCH_ARM64 && (defined(__ARM_NEON) || defined(__ARM_NEON__))
    #define SFL_HAS_NEON 1
#else
    #define SFL_HAS_NEON 0
#endif

// Google Highway portable SIMD, defined by CMake when hwy is found
#if defined(SFL_HAS_HIGHWAY) && SFL_HAS_HIGHWAY
    #define SFL_HIGHWAY_AVAILABLE 1
#else
    #define SFL_HIGHWAY_AVAILABLE 0
#endif

// Dispatch policy: fixed at build time or probed at first use
#if defined(SFL_STATIC_DISPATCH) && SFL_STATIC_DISPATCH
    #define SFL_DISPATCH_STATIC 1
#else
    #define SFL_DISPATCH_STATIC 0
#endif

// ============================================================================
// Compiler-specific Attributes
// ============================================================================

// Force inline
#if SFL_COMPILER_MSVC
    #define SFL_FORCE_INLINE __forceinline
#elif SFL_COMPILER_GCC || SFL_COMPILER_CLANG
    #define SFL_FORCE_INLINE __attribute__((always_inline)) inline
#else
    #define SFL_FORCE_INLINE inline
#endif

// Restrict pointer
#if SFL_COMPILER_MSVC
    #define SFL_RESTRICT __restrict
#elif SFL_COMPILER_GCC || SFL_COMPILER_CLANG
    #define SFL_RESTRICT __restrict__
#else
    #define SFL_RESTRICT
#endif

// Hot function (optimize for speed, place in hot section)
#if SFL_COMPILER_GCC || SFL_COMPILER_CLANG
    #define SFL_HOT [[gnu::hot]]
    #define SFL_COLD [[gnu::cold]]
#else
    #define SFL_HOT
    #define SFL_COLD
#endif

// ============================================================================
// Platform Info Functions (constexpr)
// ============================================================================

namespace sfl::platform {

/// Get platform name
[[nodiscard]] constexpr const char* name() noexcept {
    return SFL_PLATFORM_NAME;
}

/// Get compiler name
[[nodiscard]] constexpr const char* compiler_name() noexcept {
    return SFL_COMPILER_NAME;
}

/// Get architecture name
[[nodiscard]] constexpr const char* arch_name() noexcept {
    return SFL_ARCH_NAME;
}

[[nodiscard]] constexpr bool is_x86() noexcept {
    return SFL_ARCH_X64 || SFL_ARCH_X86;
}

/// True if the SSE2 kernels were compiled in
[[nodiscard]] constexpr bool has_sse2() noexcept {
    return SFL_HAS_SSE2;
}

/// True if the AVX2 kernels were compiled in
[[nodiscard]] constexpr bool has_avx2() noexcept {
    return SFL_HAS_AVX2;
}

/// True if the AVX-512BW kernels were compiled in
[[nodiscard]] constexpr bool has_avx512() noexcept {
    return SFL_HAS_AVX512;
}

/// True if the Highway kernels were compiled in
[[nodiscard]] constexpr bool has_highway() noexcept {
    return SFL_HIGHWAY_AVAILABLE;
}

/// True if the kernel choice is fixed at build time
[[nodiscard]] constexpr bool is_static_dispatch() noexcept {
    return SFL_DISPATCH_STATIC;
}

} // namespace sfl::platform
