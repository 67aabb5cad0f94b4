#include "chipium/Cpu.hpp"
#include "chipium/Errors.hpp"
#include "chipium/Instructions.hpp"

namespace chipium {

namespace ins = instructions;

namespace {

// 0x0 group: exact opcodes
InstructionHandler decode_system(Opcode op) {
    switch (op.value) {
        case 0x00E0: return &ins::cls;
        case 0x00EE: return &ins::ret;
        default:     return nullptr;
    }
}

// 0x8 group: selected by the low nibble
InstructionHandler decode_alu(Opcode op) {
    switch (op.n()) {
        case 0x0: return &ins::ld_reg;
        case 0x1: return &ins::or_reg;
        case 0x2: return &ins::and_reg;
        case 0x3: return &ins::xor_reg;
        case 0x4: return &ins::add_reg;
        case 0x5: return &ins::sub_reg;
        case 0x6: return &ins::shr;
        case 0x7: return &ins::subn_reg;
        case 0xE: return &ins::shl;
        default:  return nullptr;
    }
}

// 0xE group: selected by the low byte
InstructionHandler decode_key(Opcode op) {
    switch (op.kk()) {
        case 0x9E: return &ins::skp;
        case 0xA1: return &ins::sknp;
        default:   return nullptr;
    }
}

// 0xF group: selected by the low byte
InstructionHandler decode_misc(Opcode op) {
    switch (op.kk()) {
        case 0x07: return &ins::ld_get_dt;
        case 0x0A: return &ins::ld_wait_key;
        case 0x15: return &ins::ld_set_dt;
        case 0x18: return &ins::ld_set_st;
        case 0x1E: return &ins::add_i;
        case 0x29: return &ins::ld_font;
        case 0x33: return &ins::ld_bcd;
        case 0x55: return &ins::ld_store;
        case 0x65: return &ins::ld_load;
        default:   return nullptr;
    }
}

} // anonymous namespace

InstructionHandler decode(Opcode op) {
    switch (op.group()) {
        case 0x0: return decode_system(op);
        case 0x1: return &ins::jp;
        case 0x2: return &ins::call;
        case 0x3: return &ins::se_byte;
        case 0x4: return &ins::sne_byte;
        case 0x5: return op.n() == 0 ? &ins::se_reg : nullptr;
        case 0x6: return &ins::ld_byte;
        case 0x7: return &ins::add_byte;
        case 0x8: return decode_alu(op);
        case 0x9: return op.n() == 0 ? &ins::sne_reg : nullptr;
        case 0xA: return &ins::ld_i;
        case 0xB: return &ins::jp_v0;
        case 0xC: return &ins::rnd;
        case 0xD: return &ins::drw;
        case 0xE: return decode_key(op);
        case 0xF: return decode_misc(op);
        default:  return nullptr;
    }
}

uint16_t fetch(ChipiumState& s) {
    s.opcode = s.memory.read_word(s.pc);
    return s.opcode;
}

void execute(ChipiumState& s, uint16_t opcode) {
    const Opcode op{opcode};
    const InstructionHandler handler = decode(op);
    if (!handler) {
        throw DecodeError(opcode, s.pc);
    }
    handler(s, op);
}

void update_timers(ChipiumState& s) {
    if (s.delay_timer > 0) {
        --s.delay_timer;
    }
    if (s.sound_timer > 0) {
        --s.sound_timer;
    }
}

void cycle(ChipiumState& s) {
    s.draw_flag = false;
    execute(s, fetch(s));
    update_timers(s);
}

} // namespace chipium
