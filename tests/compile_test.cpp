// Compilation test - verifies all headers compile correctly
#include "simdfletcher/simdfletcher.hpp"

#include <cstdint>
#include <iostream>
#include <span>

int main() {
    using namespace sfl;

    // "abcdefgh" as words of each width, little-endian
    const uint8_t bytes[] = {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'};
    const uint16_t halves[] = {0x6261, 0x6463, 0x6665, 0x6867};
    const uint32_t words[] = {0x64636261, 0x68676665};

    Fletcher16 f16;
    f16.update(std::span<const uint8_t>{bytes});
    std::cout << "Fletcher16: 0x" << std::hex << f16.value() << "\n";

    Fletcher32 f32;
    f32.update_batch(halves);
    std::cout << "Fletcher32: 0x" << f32.value() << "\n";

    Fletcher64 f64;
    f64.update(words, 2);
    std::cout << "Fletcher64: 0x" << f64.value() << "\n";

    Fletcher128 f128;
    f128.update(uint64_t{0x6867666564636261});
    std::cout << "Fletcher128: 0x" << static_cast<uint64_t>(f128.value() >> 64)
              << static_cast<uint64_t>(f128.value()) << std::dec << "\n";

    // Lane operations over the emulated register
    using Lanes = kernel::EmulatedLanes<uint16_t, 4>;
    auto state = kernel::update_words<Lanes>(FletcherState<uint16_t>{}, std::span<const uint16_t>{halves});
    std::cout << "Emulated kernel matches: " << (pack_checksum<uint32_t>(state) == f32.value() ? "yes" : "no") << "\n";

    std::cout << "Kernel: " << simd::simd_impl_name(f16.simd_impl()) << "\n";
    std::cout << "SimdFletcher version: " << VERSION.string() << "\n";

    bool ok = f16.value() == 0xF824 && f32.value() == 0xEBDE9590u &&
              f64.value() == 0x312E2B27CCCAC8C6ULL;
    if (!ok) {
        std::cout << "Unexpected checksum\n";
        return 1;
    }
    std::cout << "All tests passed!\n";

    return 0;
}
