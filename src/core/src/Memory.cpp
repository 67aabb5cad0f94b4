#include "chipium/Memory.hpp"
#include "chipium/Errors.hpp"
#include <algorithm>
#include <cstring>
#include <string>

namespace chipium {

Memory::Memory() {
    reset();
}

void Memory::reset() {
    std::fill(bytes_.begin(), bytes_.end(), 0);
    std::copy(kFontSet.begin(), kFontSet.end(), bytes_.begin() + kFontStart);
}

void Memory::check_address(uint32_t addr) {
    if (addr >= kMemorySize) {
        throw AddressError("memory address " + hex_string(addr, 4) + " out of range");
    }
}

void Memory::check_range(uint32_t addr, size_t length) {
    if (length == 0) {
        return;
    }
    if (addr >= kMemorySize || length > kMemorySize - addr) {
        throw AddressError("memory range " + hex_string(addr, 4) + "+" +
                           std::to_string(length) + " out of range");
    }
}

uint8_t Memory::read(uint32_t addr) const {
    check_address(addr);
    return bytes_[addr];
}

void Memory::write(uint32_t addr, uint8_t value) {
    check_address(addr);
    bytes_[addr] = value;
}

uint16_t Memory::read_word(uint32_t addr) const {
    check_address(addr);
    check_address(addr + 1);
    return static_cast<uint16_t>((bytes_[addr] << 8) | bytes_[addr + 1]);
}

size_t Memory::load(uint32_t offset, std::span<const uint8_t> bytes) {
    if (offset >= kMemorySize) {
        return 0;
    }
    size_t copy_size = std::min(bytes.size(), kMemorySize - offset);
    std::memcpy(bytes_.data() + offset, bytes.data(), copy_size);
    return copy_size;
}

} // namespace chipium
