// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Chipium.
//
// Chipium is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Chipium is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Chipium.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef CHIPIUM_STATE_HPP
#define CHIPIUM_STATE_HPP

#include "Types.hpp"
#include "Memory.hpp"
#include "Display.hpp"
#include "Keypad.hpp"
#include <array>
#include <cstdint>
#include <random>

namespace chipium {

// Complete machine state.
// Owned by a Machine (or directly by tests); instruction handlers
// receive it by reference. Nothing here is global, so independent
// instances never interfere.
struct ChipiumState {
    Memory memory;

    // General registers V0-VF (VF doubles as the flag register)
    std::array<uint8_t, kRegisterCount> v{};

    // Address register
    uint16_t i = 0;

    // Program counter (byte offset into memory)
    uint16_t pc = kProgramStart;

    // Call stack of return addresses; sp is the number of entries in use
    std::array<uint16_t, kStackDepth> stack{};
    uint8_t sp = 0;

    // Countdown timers, decremented once per cycle while non-zero
    uint8_t delay_timer = 0;
    uint8_t sound_timer = 0;

    Display display;
    Keypad keypad;

    // Most recently fetched instruction
    uint16_t opcode = 0;

    // Set when the last instruction changed the display
    bool draw_flag = false;

    // Set while Fx0A is holding the program counter for a key press
    bool waiting_for_key = false;

    // Random source for Cxkk
    std::mt19937 rng;

    // Push a return address. Throws StackError when the stack is full.
    void push(uint16_t addr);

    // Pop a return address. Throws StackError when the stack is empty.
    uint16_t pop();

    // Reset to power-on defaults (font preloaded, PC at 0x200)
    void reset();
};

} // namespace chipium

#endif // CHIPIUM_STATE_HPP
