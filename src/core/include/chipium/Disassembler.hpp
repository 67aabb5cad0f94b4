#ifndef CHIPIUM_DISASSEMBLER_HPP
#define CHIPIUM_DISASSEMBLER_HPP

#include <cstdint>
#include <string>

namespace chipium {

class Memory;

// Render one instruction as assembly text, e.g. "LD V3, 0x1F".
// Undefined opcodes render as a data word: "DW 0x5AB1".
std::string disassemble(uint16_t opcode);

// Disassemble the instruction stored at address
std::string disassemble(const Memory& memory, uint16_t address);

} // namespace chipium

#endif // CHIPIUM_DISASSEMBLER_HPP
