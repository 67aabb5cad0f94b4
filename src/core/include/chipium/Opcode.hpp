#ifndef CHIPIUM_OPCODE_HPP
#define CHIPIUM_OPCODE_HPP

#include <cstdint>

namespace chipium {

// One 16-bit instruction with its operand fields.
//
//   group  x     y     n
//   [15:12][11:8][7:4] [3:0]
//               kk = [7:0]
//         nnn = [11:0]
struct Opcode {
    uint16_t value = 0;

    constexpr uint8_t group() const { return static_cast<uint8_t>((value & 0xF000) >> 12); }
    constexpr uint8_t x() const { return static_cast<uint8_t>((value & 0x0F00) >> 8); }
    constexpr uint8_t y() const { return static_cast<uint8_t>((value & 0x00F0) >> 4); }
    constexpr uint8_t n() const { return static_cast<uint8_t>(value & 0x000F); }
    constexpr uint8_t kk() const { return static_cast<uint8_t>(value & 0x00FF); }
    constexpr uint16_t nnn() const { return static_cast<uint16_t>(value & 0x0FFF); }
};

} // namespace chipium

#endif // CHIPIUM_OPCODE_HPP
