#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <list>
#include <span>
#include <vector>

#include "simdfletcher/kernel/scalar_kernel.hpp"

using namespace sfl;
using namespace sfl::kernel;

// ============================================================================
// Compile-time Known Answers
// ============================================================================

namespace {

constexpr std::array<uint8_t, 8> ABCDEFGH = {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'};

constexpr FletcherState<uint8_t> abcdefgh_state() {
    return update_scalar(FletcherState<uint8_t>{}, std::span<const uint8_t>{ABCDEFGH});
}

}  // namespace

static_assert(abcdefgh_state().sum1 == 0x24);
static_assert(abcdefgh_state().sum2 == 0xF8);
static_assert(pack_checksum<uint16_t>(abcdefgh_state()) == 0xF824);

// ============================================================================
// Update Rule
// ============================================================================

TEST_CASE("Scalar kernel single word", "[kernel][scalar]") {
    SECTION("8-bit") {
        auto s = update_one(FletcherState<uint8_t>{}, uint8_t{0xAB});
        REQUIRE(s.sum1 == 0xAB);
        REQUIRE(s.sum2 == 0xAB);
    }

    SECTION("16-bit") {
        auto s = update_one(FletcherState<uint16_t>{}, uint16_t{0xBEEF});
        REQUIRE(s.sum1 == 0xBEEF);
        REQUIRE(s.sum2 == 0xBEEF);
    }

    SECTION("32-bit") {
        auto s = update_one(FletcherState<uint32_t>{}, uint32_t{0xDEADBEEF});
        REQUIRE(s.sum1 == 0xDEADBEEF);
        REQUIRE(s.sum2 == 0xDEADBEEF);
    }

    SECTION("64-bit") {
        auto s = update_one(FletcherState<uint64_t>{}, uint64_t{0x6867666564636261});
        REQUIRE(s.sum1 == 0x6867666564636261);
        REQUIRE(s.sum2 == 0x6867666564636261);
    }
}

TEST_CASE("Scalar kernel recurrence", "[kernel][scalar]") {
    FletcherState<uint16_t> s{};
    s = update_one(s, uint16_t{1});
    s = update_one(s, uint16_t{2});
    s = update_one(s, uint16_t{3});

    // sum1: 1, 3, 6 / sum2: 1, 4, 10
    REQUIRE(s.sum1 == 6);
    REQUIRE(s.sum2 == 10);
}

TEST_CASE("Scalar kernel empty input", "[kernel][scalar]") {
    const FletcherState<uint32_t> start{7, 9};
    auto s = update_scalar(start, std::span<const uint32_t>{});
    REQUIRE(s == start);
}

// ============================================================================
// Wraparound
// ============================================================================

TEST_CASE("Scalar kernel wraps modulo 2^k", "[kernel][scalar][wrap]") {
    SECTION("8-bit saturating input") {
        std::vector<uint8_t> words(3, 0xFF);
        auto s = update_scalar(FletcherState<uint8_t>{}, std::span<const uint8_t>{words});

        // sum1: 255, 254, 253 / sum2: 255, 253, 250 (mod 256)
        REQUIRE(s.sum1 == 253);
        REQUIRE(s.sum2 == 250);
    }

    SECTION("16-bit matches closed form") {
        // n copies of w: sum1 = n*w, sum2 = w*n*(n+1)/2 (mod 2^16)
        constexpr uint64_t n = 5000;
        constexpr uint64_t w = 0xFFF1;
        std::vector<uint16_t> words(n, static_cast<uint16_t>(w));
        auto s = update_scalar(FletcherState<uint16_t>{}, std::span<const uint16_t>{words});

        REQUIRE(s.sum1 == static_cast<uint16_t>(n * w));
        REQUIRE(s.sum2 == static_cast<uint16_t>(w * (n * (n + 1) / 2)));
    }

    SECTION("64-bit matches closed form") {
        constexpr uint64_t n = 1000;
        constexpr uint64_t w = UINT64_MAX;
        std::vector<uint64_t> words(n, w);
        auto s = update_scalar(FletcherState<uint64_t>{}, std::span<const uint64_t>{words});

        const uint128_t expected1 = static_cast<uint128_t>(n) * w;
        const uint128_t expected2 = static_cast<uint128_t>(w) * (n * (n + 1) / 2);
        REQUIRE(s.sum1 == static_cast<uint64_t>(expected1));
        REQUIRE(s.sum2 == static_cast<uint64_t>(expected2));
    }
}

// ============================================================================
// Iterator Form
// ============================================================================

TEST_CASE("Scalar kernel iterator and span forms agree", "[kernel][scalar]") {
    std::vector<uint32_t> words;
    for (uint32_t i = 0; i < 100; ++i) {
        words.push_back(i * 0x9E3779B9u);
    }
    std::list<uint32_t> linked(words.begin(), words.end());

    auto from_span = update_scalar(FletcherState<uint32_t>{}, std::span<const uint32_t>{words});
    auto from_iter = update_scalar<uint32_t>(FletcherState<uint32_t>{}, linked.begin(), linked.end());

    REQUIRE(from_span == from_iter);
}

TEST_CASE("Scalar kernel continues from a seeded state", "[kernel][scalar]") {
    std::vector<uint8_t> words = {10, 20, 30, 40};

    auto whole = update_scalar(FletcherState<uint8_t>{}, std::span<const uint8_t>{words});

    auto first = update_scalar(FletcherState<uint8_t>{}, std::span<const uint8_t>{words}.first(2));
    auto rest = update_scalar(first, std::span<const uint8_t>{words}.subspan(2));

    REQUIRE(whole == rest);
}
