#ifndef CHIPIUM_CPU_HPP
#define CHIPIUM_CPU_HPP

#include "ChipiumState.hpp"
#include "Opcode.hpp"
#include <cstdint>

namespace chipium {

// Instruction handler signature (see Instructions.hpp)
using InstructionHandler = void (*)(ChipiumState&, Opcode);

// Look up the handler for an opcode.
// Returns nullptr if the opcode matches no instruction.
InstructionHandler decode(Opcode op);

// Read the instruction at PC (big-endian) into s.opcode and return it
uint16_t fetch(ChipiumState& s);

// Decode and execute one instruction. The PC must still point at the
// instruction; throws DecodeError for undefined opcodes.
void execute(ChipiumState& s, uint16_t opcode);

// Decrement delay and sound timers, floored at zero
void update_timers(ChipiumState& s);

// One full cycle: fetch, decode-execute, timers
void cycle(ChipiumState& s);

} // namespace chipium

#endif // CHIPIUM_CPU_HPP
