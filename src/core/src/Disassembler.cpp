#include "chipium/Disassembler.hpp"
#include "chipium/Cpu.hpp"
#include "chipium/Errors.hpp"
#include "chipium/Memory.hpp"
#include "chipium/Opcode.hpp"

namespace chipium {

namespace {

std::string reg(uint8_t r) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    return std::string("V") + kDigits[r & 0x0F];
}

std::string addr(uint16_t a) {
    return hex_string(a, 3);
}

std::string byte(uint8_t b) {
    return hex_string(b, 2);
}

std::string vx_vy(const char* mnemonic, Opcode op) {
    return std::string(mnemonic) + " " + reg(op.x()) + ", " + reg(op.y());
}

std::string vx_byte(const char* mnemonic, Opcode op) {
    return std::string(mnemonic) + " " + reg(op.x()) + ", " + byte(op.kk());
}

std::string format_alu(Opcode op) {
    switch (op.n()) {
        case 0x0: return vx_vy("LD", op);
        case 0x1: return vx_vy("OR", op);
        case 0x2: return vx_vy("AND", op);
        case 0x3: return vx_vy("XOR", op);
        case 0x4: return vx_vy("ADD", op);
        case 0x5: return vx_vy("SUB", op);
        case 0x6: return vx_vy("SHR", op);
        case 0x7: return vx_vy("SUBN", op);
        case 0xE: return vx_vy("SHL", op);
        default:  return {};
    }
}

std::string format_misc(Opcode op) {
    const std::string vx = reg(op.x());
    switch (op.kk()) {
        case 0x07: return "LD " + vx + ", DT";
        case 0x0A: return "LD " + vx + ", K";
        case 0x15: return "LD DT, " + vx;
        case 0x18: return "LD ST, " + vx;
        case 0x1E: return "ADD I, " + vx;
        case 0x29: return "LD F, " + vx;
        case 0x33: return "LD B, " + vx;
        case 0x55: return "LD [I], " + vx;
        case 0x65: return "LD " + vx + ", [I]";
        default:   return {};
    }
}

} // anonymous namespace

std::string disassemble(uint16_t opcode) {
    const Opcode op{opcode};

    // Anything the decoder rejects is data
    if (!decode(op)) {
        return "DW " + hex_string(opcode, 4);
    }

    switch (op.group()) {
        case 0x0: return op.value == 0x00E0 ? "CLS" : "RET";
        case 0x1: return "JP " + addr(op.nnn());
        case 0x2: return "CALL " + addr(op.nnn());
        case 0x3: return vx_byte("SE", op);
        case 0x4: return vx_byte("SNE", op);
        case 0x5: return vx_vy("SE", op);
        case 0x6: return vx_byte("LD", op);
        case 0x7: return vx_byte("ADD", op);
        case 0x8: return format_alu(op);
        case 0x9: return vx_vy("SNE", op);
        case 0xA: return "LD I, " + addr(op.nnn());
        case 0xB: return "JP V0, " + addr(op.nnn());
        case 0xC: return vx_byte("RND", op);
        case 0xD: return vx_vy("DRW", op) + ", " + std::to_string(op.n());
        case 0xE: return (op.kk() == 0x9E ? "SKP " : "SKNP ") + reg(op.x());
        default:  return format_misc(op);
    }
}

std::string disassemble(const Memory& memory, uint16_t address) {
    return disassemble(memory.read_word(address));
}

} // namespace chipium
