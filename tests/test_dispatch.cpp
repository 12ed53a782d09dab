#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "simdfletcher/dispatch/dispatch.hpp"

using namespace sfl;
using namespace sfl::simd;

// ============================================================================
// Names and Parsing
// ============================================================================

TEST_CASE("SimdImpl names", "[dispatch]") {
    REQUIRE(std::string_view{simd_impl_name(SimdImpl::Scalar)} == "Scalar");
    REQUIRE(std::string_view{simd_impl_name(SimdImpl::SSE2)} == "SSE2");
    REQUIRE(std::string_view{simd_impl_name(SimdImpl::AVX2)} == "AVX2");
    REQUIRE(std::string_view{simd_impl_name(SimdImpl::AVX512)} == "AVX-512");
    REQUIRE(std::string_view{simd_impl_name(SimdImpl::Highway)} == "Highway");
}

TEST_CASE("SFL_SIMD_IMPL parsing", "[dispatch][config]") {
    SECTION("Known values") {
        REQUIRE(parse_simd_impl("scalar") == SimdImpl::Scalar);
        REQUIRE(parse_simd_impl("sse2") == SimdImpl::SSE2);
        REQUIRE(parse_simd_impl("avx2") == SimdImpl::AVX2);
        REQUIRE(parse_simd_impl("avx512") == SimdImpl::AVX512);
        REQUIRE(parse_simd_impl("avx-512") == SimdImpl::AVX512);
        REQUIRE(parse_simd_impl("highway") == SimdImpl::Highway);
    }

    SECTION("Unknown values") {
        REQUIRE_FALSE(parse_simd_impl("").has_value());
        REQUIRE_FALSE(parse_simd_impl("AVX2").has_value());
        REQUIRE_FALSE(parse_simd_impl("neon").has_value());
    }

    STATIC_REQUIRE(parse_simd_impl("sse2") == SimdImpl::SSE2);
}

TEST_CASE("SFL_SIMD_IMPL override", "[dispatch][config]") {
    const char* saved = std::getenv("SFL_SIMD_IMPL");
    const std::optional<std::string> previous =
        saved ? std::optional<std::string>{saved} : std::nullopt;

    const SimdImpl detected = detail::detect_best_impl();

    SECTION("Unset or empty keeps the probe") {
        ::unsetenv("SFL_SIMD_IMPL");
        REQUIRE(detail::apply_env_override(detected) == detected);

        ::setenv("SFL_SIMD_IMPL", "", 1);
        REQUIRE(detail::apply_env_override(detected) == detected);
    }

    SECTION("Supported value wins") {
        ::setenv("SFL_SIMD_IMPL", "scalar", 1);
        REQUIRE(detail::apply_env_override(detected) == SimdImpl::Scalar);

        const char* names[] = {"sse2", "avx2", "avx512", "highway"};
        for (const char* name : names) {
            const SimdImpl impl = *parse_simd_impl(name);
            if (!is_simd_impl_supported(impl)) {
                continue;
            }
            INFO("SFL_SIMD_IMPL=" << name);
            ::setenv("SFL_SIMD_IMPL", name, 1);
            REQUIRE(detail::apply_env_override(SimdImpl::Scalar) == impl);
        }
    }

    SECTION("Unknown value is ignored") {
        ::setenv("SFL_SIMD_IMPL", "bogus", 1);
        REQUIRE(detail::apply_env_override(detected) == detected);
    }

    SECTION("Unusable level is ignored") {
        const char* names[] = {"sse2", "avx2", "avx512", "highway"};
        for (const char* name : names) {
            if (is_simd_impl_supported(*parse_simd_impl(name))) {
                continue;
            }
            INFO("SFL_SIMD_IMPL=" << name);
            ::setenv("SFL_SIMD_IMPL", name, 1);
            REQUIRE(detail::apply_env_override(detected) == detected);
        }
    }

    if (previous) {
        ::setenv("SFL_SIMD_IMPL", previous->c_str(), 1);
    } else {
        ::unsetenv("SFL_SIMD_IMPL");
    }
}

// ============================================================================
// Capabilities
// ============================================================================

TEST_CASE("Scalar kernel is always available", "[dispatch]") {
    STATIC_REQUIRE(is_simd_impl_compiled(SimdImpl::Scalar));
    REQUIRE(is_simd_impl_supported(SimdImpl::Scalar));

    auto impls = available_simd_impls();
    REQUIRE_FALSE(impls.empty());
    REQUIRE(impls.front() == SimdImpl::Scalar);
}

TEST_CASE("Compiled-in flags match platform detection", "[dispatch][platform]") {
    REQUIRE(is_simd_impl_compiled(SimdImpl::SSE2) == platform::has_sse2());
    REQUIRE(is_simd_impl_compiled(SimdImpl::AVX2) == platform::has_avx2());
    REQUIRE(is_simd_impl_compiled(SimdImpl::AVX512) == platform::has_avx512());
    REQUIRE(is_simd_impl_compiled(SimdImpl::Highway) == platform::has_highway());

    // Wider x86 levels imply the narrower ones
    if (platform::has_avx512()) REQUIRE(platform::has_avx2());
    if (platform::has_avx2()) REQUIRE(platform::has_sse2());
}

TEST_CASE("Static choice is the widest compiled-in kernel", "[dispatch]") {
    constexpr SimdImpl impl = static_simd_impl();
    STATIC_REQUIRE(is_simd_impl_compiled(impl));

    if (platform::has_avx512()) {
        REQUIRE(impl == SimdImpl::AVX512);
    } else if (platform::has_avx2()) {
        REQUIRE(impl == SimdImpl::AVX2);
    } else if (platform::has_sse2()) {
        REQUIRE(impl == SimdImpl::SSE2);
    }
}

TEST_CASE("Uncompiled kernels resolve to scalar", "[dispatch]") {
    const auto scalar = kernel_for<uint32_t>(SimdImpl::Scalar);
    for (SimdImpl impl : {SimdImpl::SSE2, SimdImpl::AVX2, SimdImpl::AVX512, SimdImpl::Highway}) {
        if (!is_simd_impl_compiled(impl)) {
            REQUIRE((kernel_for<uint32_t>(impl) == scalar));
        } else {
            REQUIRE((kernel_for<uint32_t>(impl) != scalar));
        }
    }
}

TEST_CASE("Static policy trusts the build flags", "[dispatch][static]") {
    for (SimdImpl impl : {SimdImpl::Scalar, SimdImpl::SSE2, SimdImpl::AVX2,
                          SimdImpl::AVX512, SimdImpl::Highway}) {
        INFO("kernel: " << simd_impl_name(impl));
        if constexpr (dispatch_policy() == DispatchPolicy::Static) {
            REQUIRE(is_simd_impl_supported(impl) == is_simd_impl_compiled(impl));
        } else {
            REQUIRE(is_simd_impl_supported(impl) ==
                    (is_simd_impl_compiled(impl) && cpu_supports(impl)));
        }
    }
}

// ============================================================================
// Active Selection
// ============================================================================

TEST_CASE("Active kernel is usable and memoized", "[dispatch]") {
    const SimdImpl first = active_simd_impl();
    REQUIRE(is_simd_impl_supported(first));
    REQUIRE(active_simd_impl() == first);

    init_simd_dispatch();
    REQUIRE(active_simd_impl() == first);

    if constexpr (dispatch_policy() == DispatchPolicy::Static) {
        REQUIRE(first == static_simd_impl());
    }
}

TEST_CASE("Active kernel is the same on every thread", "[dispatch][threads]") {
    constexpr size_t THREADS = 8;
    std::array<SimdImpl, THREADS> seen{};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (size_t i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            seen[i] = active_simd_impl();
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(std::all_of(seen.begin(), seen.end(),
                        [&](SimdImpl impl) { return impl == seen[0]; }));
}
