#include "chipium/Instructions.hpp"
#include "chipium/Errors.hpp"
#include <random>
#include <string>

namespace chipium::instructions {

namespace {

constexpr uint16_t kInstructionSize = 2;

void advance(ChipiumState& s) {
    s.pc += kInstructionSize;
}

void skip_if(ChipiumState& s, bool condition) {
    if (condition) {
        s.pc += kInstructionSize;
    }
    s.pc += kInstructionSize;
}

} // anonymous namespace

void cls(ChipiumState& s, Opcode /*op*/) {
    s.display.clear();
    s.draw_flag = true;
    advance(s);
}

void ret(ChipiumState& s, Opcode /*op*/) {
    s.pc = s.pop();
    advance(s);
}

void jp(ChipiumState& s, Opcode op) {
    s.pc = op.nnn();
}

void call(ChipiumState& s, Opcode op) {
    s.push(s.pc);
    s.pc = op.nnn();
}

void se_byte(ChipiumState& s, Opcode op) {
    skip_if(s, s.v[op.x()] == op.kk());
}

void sne_byte(ChipiumState& s, Opcode op) {
    skip_if(s, s.v[op.x()] != op.kk());
}

void se_reg(ChipiumState& s, Opcode op) {
    skip_if(s, s.v[op.x()] == s.v[op.y()]);
}

void ld_byte(ChipiumState& s, Opcode op) {
    s.v[op.x()] = op.kk();
    advance(s);
}

void add_byte(ChipiumState& s, Opcode op) {
    // Wraps; VF is untouched
    s.v[op.x()] = static_cast<uint8_t>(s.v[op.x()] + op.kk());
    advance(s);
}

void ld_reg(ChipiumState& s, Opcode op) {
    s.v[op.x()] = s.v[op.y()];
    advance(s);
}

void or_reg(ChipiumState& s, Opcode op) {
    s.v[op.x()] |= s.v[op.y()];
    advance(s);
}

void and_reg(ChipiumState& s, Opcode op) {
    s.v[op.x()] &= s.v[op.y()];
    advance(s);
}

void xor_reg(ChipiumState& s, Opcode op) {
    s.v[op.x()] ^= s.v[op.y()];
    advance(s);
}

// In the arithmetic handlers below VF is written before Vx, so when
// x is F the result overwrites the flag.

void add_reg(ChipiumState& s, Opcode op) {
    const unsigned sum = s.v[op.x()] + s.v[op.y()];
    s.v[kFlagRegister] = sum > 0xFF ? 1 : 0;
    s.v[op.x()] = static_cast<uint8_t>(sum);
    advance(s);
}

void sub_reg(ChipiumState& s, Opcode op) {
    const uint8_t vx = s.v[op.x()];
    const uint8_t vy = s.v[op.y()];
    s.v[kFlagRegister] = vy > vx ? 0 : 1;  // 1 means no borrow
    s.v[op.x()] = static_cast<uint8_t>(vx - vy);
    advance(s);
}

void shr(ChipiumState& s, Opcode op) {
    s.v[kFlagRegister] = s.v[op.x()] & 0x01;
    s.v[op.x()] >>= 1;
    advance(s);
}

void subn_reg(ChipiumState& s, Opcode op) {
    const uint8_t vx = s.v[op.x()];
    const uint8_t vy = s.v[op.y()];
    s.v[kFlagRegister] = vx > vy ? 0 : 1;  // 1 means no borrow
    s.v[op.x()] = static_cast<uint8_t>(vy - vx);
    advance(s);
}

void shl(ChipiumState& s, Opcode op) {
    // The flag is the raw bit (0x00 or 0x80), not normalised to 0/1
    s.v[kFlagRegister] = s.v[op.x()] & 0x80;
    s.v[op.x()] = static_cast<uint8_t>(s.v[op.x()] << 1);
    advance(s);
}

void sne_reg(ChipiumState& s, Opcode op) {
    skip_if(s, s.v[op.x()] != s.v[op.y()]);
}

void ld_i(ChipiumState& s, Opcode op) {
    s.i = op.nnn();
    advance(s);
}

void jp_v0(ChipiumState& s, Opcode op) {
    s.pc = static_cast<uint16_t>(op.nnn() + s.v[0]);
}

void rnd(ChipiumState& s, Opcode op) {
    std::uniform_int_distribution<int> byte_dist(0, 0xFF);
    s.v[op.x()] = static_cast<uint8_t>(byte_dist(s.rng) & op.kk());
    advance(s);
}

namespace {

// Target pixel for one sprite bit. Two independent corrections are
// applied in order:
//   1. an index past the last pixel moves up 31 rows;
//   2. a column past the right edge moves back one row width, onto the
//      sprite's own row.
size_t sprite_target(size_t col, size_t row, size_t sprite_row, size_t bit) {
    size_t target = col + (row + sprite_row) * kDisplayWidth + bit;
    if (target > kPixelCount - 1) {
        target -= kDisplayWidth * (kDisplayHeight - 1);
    }
    if (col + bit >= kDisplayWidth) {
        target -= kDisplayWidth;
    }
    return target;
}

} // anonymous namespace

// Draw an n-row sprite from memory[I] at (Vx, Vy).
// VF is set if any target pixel was already on before drawing. Sprite
// bytes and targets are validated first, so a fault draws nothing.
void drw(ChipiumState& s, Opcode op) {
    const size_t col = s.v[op.x()];
    const size_t row = s.v[op.y()];

    s.memory.check_range(s.i, op.n());
    for (size_t sprite_row = 0; sprite_row < op.n(); ++sprite_row) {
        for (size_t bit = 0; bit < 8; ++bit) {
            const size_t target = sprite_target(col, row, sprite_row, bit);
            if (target >= kPixelCount) {
                throw AddressError("sprite pixel " + std::to_string(target) + " out of range");
            }
        }
    }

    s.v[kFlagRegister] = 0;

    for (size_t sprite_row = 0; sprite_row < op.n(); ++sprite_row) {
        const uint8_t bits = s.memory.read(s.i + sprite_row);

        for (size_t bit = 0; bit < 8; ++bit) {
            const bool sprite_pixel = (bits & (0x80 >> bit)) != 0;
            const size_t target = sprite_target(col, row, sprite_row, bit);

            if (s.display.get_pixel(target)) {
                s.v[kFlagRegister] = 1;
            }
            s.display.xor_pixel(target, sprite_pixel);
        }
    }

    s.draw_flag = true;
    advance(s);
}

void skp(ChipiumState& s, Opcode op) {
    skip_if(s, s.keypad.is_pressed(s.v[op.x()]));
}

void sknp(ChipiumState& s, Opcode op) {
    skip_if(s, !s.keypad.is_pressed(s.v[op.x()]));
}

void ld_get_dt(ChipiumState& s, Opcode op) {
    s.v[op.x()] = s.delay_timer;
    advance(s);
}

// Holds the program counter until a key is down, so the instruction
// re-executes on every cycle until then. Timers keep running.
void ld_wait_key(ChipiumState& s, Opcode op) {
    if (auto key = s.keypad.first_pressed()) {
        s.v[op.x()] = *key;
        s.waiting_for_key = false;
        advance(s);
    } else {
        s.waiting_for_key = true;
    }
}

void ld_set_dt(ChipiumState& s, Opcode op) {
    s.delay_timer = s.v[op.x()];
    advance(s);
}

void ld_set_st(ChipiumState& s, Opcode op) {
    s.sound_timer = s.v[op.x()];
    advance(s);
}

void add_i(ChipiumState& s, Opcode op) {
    s.i = static_cast<uint16_t>(s.i + s.v[op.x()]);
    advance(s);
}

void ld_font(ChipiumState& s, Opcode op) {
    const uint8_t digit = s.v[op.x()] & 0x0F;
    s.i = static_cast<uint16_t>(kFontStart + digit * kFontGlyphBytes);
    advance(s);
}

void ld_bcd(ChipiumState& s, Opcode op) {
    const uint8_t value = s.v[op.x()];
    s.memory.check_range(s.i, 3);
    s.memory.write(s.i + 0, static_cast<uint8_t>(value / 100));
    s.memory.write(s.i + 1, static_cast<uint8_t>((value / 10) % 10));
    s.memory.write(s.i + 2, static_cast<uint8_t>(value % 10));
    advance(s);
}

// Fx55 and Fx65 validate the whole range first, so a fault leaves
// memory and registers untouched.
void ld_store(ChipiumState& s, Opcode op) {
    s.memory.check_range(s.i, op.x() + 1u);
    for (uint8_t r = 0; r <= op.x(); ++r) {
        s.memory.write(s.i + r, s.v[r]);
    }
    advance(s);
}

void ld_load(ChipiumState& s, Opcode op) {
    s.memory.check_range(s.i, op.x() + 1u);
    for (uint8_t r = 0; r <= op.x(); ++r) {
        s.v[r] = s.memory.read(s.i + r);
    }
    advance(s);
}

} // namespace chipium::instructions
