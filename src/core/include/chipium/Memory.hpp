#ifndef CHIPIUM_MEMORY_HPP
#define CHIPIUM_MEMORY_HPP

#include "Types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace chipium {

// 4KB working memory.
// The font table occupies 0x000-0x04F; programs load at 0x200.
// Every access is bounds checked and faults with AddressError.
class Memory {
public:
    Memory();

    uint8_t read(uint32_t addr) const;
    void write(uint32_t addr, uint8_t value);

    // Two consecutive bytes merged big-endian (instruction fetch)
    uint16_t read_word(uint32_t addr) const;

    // Copy bytes starting at offset, stopping at the end of memory.
    // Returns the number of bytes copied.
    size_t load(uint32_t offset, std::span<const uint8_t> bytes);

    // Direct access (for testing/debugging)
    uint8_t* data() { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }
    static constexpr size_t size() { return kMemorySize; }

    // Zero everything, then preload the font table
    void reset();

    // Throws AddressError unless [addr, addr + length) lies in memory.
    // Multi-byte instructions call this before touching anything.
    static void check_range(uint32_t addr, size_t length);

private:
    static void check_address(uint32_t addr);

    std::array<uint8_t, kMemorySize> bytes_{};
};

} // namespace chipium

#endif // CHIPIUM_MEMORY_HPP
