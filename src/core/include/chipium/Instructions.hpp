#ifndef CHIPIUM_INSTRUCTIONS_HPP
#define CHIPIUM_INSTRUCTIONS_HPP

#include "ChipiumState.hpp"
#include "Opcode.hpp"

// Instruction handlers.
//
// One free function per instruction, each taking the machine state and
// the decoded opcode. Every handler leaves the program counter pointing
// at the next instruction to execute. Dispatch lives in Cpu.cpp.
namespace chipium::instructions {

void cls(ChipiumState& s, Opcode op);         // 00E0
void ret(ChipiumState& s, Opcode op);         // 00EE
void jp(ChipiumState& s, Opcode op);          // 1nnn
void call(ChipiumState& s, Opcode op);        // 2nnn
void se_byte(ChipiumState& s, Opcode op);     // 3xkk
void sne_byte(ChipiumState& s, Opcode op);    // 4xkk
void se_reg(ChipiumState& s, Opcode op);      // 5xy0
void ld_byte(ChipiumState& s, Opcode op);     // 6xkk
void add_byte(ChipiumState& s, Opcode op);    // 7xkk
void ld_reg(ChipiumState& s, Opcode op);      // 8xy0
void or_reg(ChipiumState& s, Opcode op);      // 8xy1
void and_reg(ChipiumState& s, Opcode op);     // 8xy2
void xor_reg(ChipiumState& s, Opcode op);     // 8xy3
void add_reg(ChipiumState& s, Opcode op);     // 8xy4
void sub_reg(ChipiumState& s, Opcode op);     // 8xy5
void shr(ChipiumState& s, Opcode op);         // 8xy6
void subn_reg(ChipiumState& s, Opcode op);    // 8xy7
void shl(ChipiumState& s, Opcode op);         // 8xyE
void sne_reg(ChipiumState& s, Opcode op);     // 9xy0
void ld_i(ChipiumState& s, Opcode op);        // Annn
void jp_v0(ChipiumState& s, Opcode op);       // Bnnn
void rnd(ChipiumState& s, Opcode op);         // Cxkk
void drw(ChipiumState& s, Opcode op);         // Dxyn
void skp(ChipiumState& s, Opcode op);         // Ex9E
void sknp(ChipiumState& s, Opcode op);        // ExA1
void ld_get_dt(ChipiumState& s, Opcode op);   // Fx07
void ld_wait_key(ChipiumState& s, Opcode op); // Fx0A
void ld_set_dt(ChipiumState& s, Opcode op);   // Fx15
void ld_set_st(ChipiumState& s, Opcode op);   // Fx18
void add_i(ChipiumState& s, Opcode op);       // Fx1E
void ld_font(ChipiumState& s, Opcode op);     // Fx29
void ld_bcd(ChipiumState& s, Opcode op);      // Fx33
void ld_store(ChipiumState& s, Opcode op);    // Fx55
void ld_load(ChipiumState& s, Opcode op);     // Fx65

} // namespace chipium::instructions

#endif // CHIPIUM_INSTRUCTIONS_HPP
