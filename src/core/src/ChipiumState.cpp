#include "chipium/ChipiumState.hpp"
#include "chipium/Errors.hpp"

namespace chipium {

void ChipiumState::push(uint16_t addr) {
    if (sp >= kStackDepth) {
        throw StackError("stack overflow calling from " + hex_string(pc, 3));
    }
    stack[sp++] = addr;
}

uint16_t ChipiumState::pop() {
    if (sp == 0) {
        throw StackError("stack underflow returning from " + hex_string(pc, 3));
    }
    return stack[--sp];
}

void ChipiumState::reset() {
    memory.reset();
    v.fill(0);
    i = 0;
    pc = kProgramStart;
    stack.fill(0);
    sp = 0;
    delay_timer = 0;
    sound_timer = 0;
    display.clear();
    keypad.clear();
    opcode = 0;
    draw_flag = false;
    waiting_for_key = false;
}

} // namespace chipium
