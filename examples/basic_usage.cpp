// basic_usage.cpp
// SimdFletcher example: the four checksum variants over one byte stream
//
// Word decoding (width and byte order) is the caller's job; here the bytes
// are read as little-endian words.

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <ranges>
#include <span>
#include <string_view>
#include <vector>

#include "simdfletcher/simdfletcher.hpp"

namespace {

/// Split bytes into little-endian words of W (trailing bytes are dropped)
template<typename W>
std::vector<W> to_le_words(std::string_view bytes) {
    std::vector<W> words(bytes.size() / sizeof(W));
    for (size_t i = 0; i < words.size(); ++i) {
        W w = 0;
        for (size_t b = 0; b < sizeof(W); ++b) {
            w |= static_cast<W>(static_cast<W>(static_cast<uint8_t>(bytes[i * sizeof(W) + b])) << (8 * b));
        }
        words[i] = w;
    }
    return words;
}

void print_hex128(sfl::uint128_t v) {
    std::cout << std::hex << std::setfill('0')
              << std::setw(16) << static_cast<uint64_t>(v >> 64)
              << std::setw(16) << static_cast<uint64_t>(v)
              << std::dec << std::setfill(' ');
}

}  // namespace

int main() {
    sfl::logging::init();

    constexpr std::string_view data = "abcdefgh";

    std::cout << "SimdFletcher " << sfl::VERSION.string()
              << " on " << sfl::platform::arch_name()
              << ", kernel: " << sfl::simd::simd_impl_name(sfl::simd::active_simd_impl())
              << "\n\n";

    // Contiguous input
    sfl::Fletcher16 f16;
    auto bytes = to_le_words<uint8_t>(data);
    f16.update(std::span<const uint8_t>{bytes});
    std::cout << "Fletcher16  = 0x" << std::hex << f16.value() << std::dec << "\n";

    sfl::Fletcher32 f32;
    f32.update(std::span<const uint16_t>{to_le_words<uint16_t>(data)});
    std::cout << "Fletcher32  = 0x" << std::hex << f32.value() << std::dec << "\n";

    // Lazy input: any range of words works
    sfl::Fletcher64 f64;
    auto words32 = to_le_words<uint32_t>(data);
    f64.update_batch(words32 | std::views::transform([](uint32_t w) { return w; }));
    std::cout << "Fletcher64  = 0x" << std::hex << f64.value() << std::dec << "\n";

    sfl::Fletcher128 f128;
    for (uint64_t w : to_le_words<uint64_t>(data)) {
        f128.update(w);
    }
    std::cout << "Fletcher128 = 0x";
    print_hex128(f128.value());
    std::cout << "\n";

    sfl::logging::flush();
    sfl::logging::shutdown();
    return 0;
}
