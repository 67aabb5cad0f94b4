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

#include <catch2/catch_test_macros.hpp>
#include <chipium/ChipiumState.hpp>
#include <chipium/Cpu.hpp>
#include <chipium/Errors.hpp>

using namespace chipium;

namespace {

// State with the given instruction at 0x200, executed once
struct Executor {
    ChipiumState s;

    void run(uint16_t opcode) {
        s.memory.write(s.pc, static_cast<uint8_t>(opcode >> 8));
        s.memory.write(s.pc + 1, static_cast<uint8_t>(opcode & 0xFF));
        execute(s, fetch(s));
    }
};

} // anonymous namespace

TEST_CASE("Power-on state", "[instructions][init]") {
    ChipiumState s;
    CHECK(s.pc == 0x200);
    CHECK(s.sp == 0);
    CHECK(s.i == 0);
    for (size_t addr = 0; addr < kFontSet.size(); ++addr) {
        REQUIRE(s.memory.read(addr) == kFontSet[addr]);
    }
}

TEST_CASE("Fetch merges two bytes big-endian", "[instructions][fetch]") {
    ChipiumState s;
    s.memory.write(0x200, 0xD6);
    s.memory.write(0x201, 0x3E);
    REQUIRE(fetch(s) == 0xD63E);
    REQUIRE(s.opcode == 0xD63E);
}

TEST_CASE("00E0 clears the display", "[instructions][cls]") {
    Executor e;
    e.s.display.set_pixel(0, true);
    e.s.display.set_pixel(kPixelCount - 1, true);

    e.run(0x00E0);

    for (size_t i = 0; i < kPixelCount; ++i) {
        REQUIRE_FALSE(e.s.display.get_pixel(i));
    }
    CHECK(e.s.draw_flag);
    CHECK(e.s.pc == 0x202);
}

TEST_CASE("Subroutines", "[instructions][stack]") {
    Executor e;

    SECTION("00EE returns past the stored address") {
        e.s.stack[0] = 21;
        e.s.sp = 1;
        e.run(0x00EE);
        CHECK(e.s.pc == 23);
        CHECK(e.s.sp == 0);
    }

    SECTION("Call then return resumes after the call site") {
        e.run(0x2300);
        CHECK(e.s.pc == 0x300);
        CHECK(e.s.sp == 1);

        e.run(0x00EE);
        CHECK(e.s.pc == 0x202);
        CHECK(e.s.sp == 0);
    }

    SECTION("Seventeenth nested call overflows") {
        for (int depth = 0; depth < 16; ++depth) {
            e.run(0x2200);  // calls itself
        }
        REQUIRE(e.s.sp == 16);
        REQUIRE_THROWS_AS(e.run(0x2200), StackError);
    }

    SECTION("Return with an empty stack underflows") {
        REQUIRE_THROWS_AS(e.run(0x00EE), StackError);
    }
}

TEST_CASE("Jumps", "[instructions][jump]") {
    Executor e;

    SECTION("1nnn") {
        e.run(0x1ABC);
        CHECK(e.s.pc == 0xABC);
    }

    SECTION("Bnnn adds V0") {
        e.s.v[0] = 0x10;
        e.run(0xB300);
        CHECK(e.s.pc == 0x310);
    }
}

TEST_CASE("Conditional skips", "[instructions][skip]") {
    Executor e;
    e.s.v[1] = 0x42;
    e.s.v[2] = 0x42;
    e.s.v[3] = 0x07;

    SECTION("3xkk skips on equal") {
        e.run(0x3142);
        CHECK(e.s.pc == 0x204);
    }
    SECTION("3xkk falls through on different") {
        e.run(0x3143);
        CHECK(e.s.pc == 0x202);
    }
    SECTION("4xkk skips on different") {
        e.run(0x4143);
        CHECK(e.s.pc == 0x204);
    }
    SECTION("5xy0 skips on equal registers") {
        e.run(0x5120);
        CHECK(e.s.pc == 0x204);
    }
    SECTION("9xy0 skips on different registers") {
        e.run(0x9130);
        CHECK(e.s.pc == 0x204);
    }
    SECTION("9xy0 falls through on equal registers") {
        e.run(0x9120);
        CHECK(e.s.pc == 0x202);
    }
}

TEST_CASE("Register loads and byte arithmetic", "[instructions][alu]") {
    Executor e;

    SECTION("6xkk") {
        e.run(0x6A5F);
        CHECK(e.s.v[0xA] == 0x5F);
        CHECK(e.s.pc == 0x202);
    }

    SECTION("7xkk wraps without touching VF") {
        e.s.v[2] = 0xFF;
        e.s.v[0xF] = 0x33;
        e.run(0x7202);
        CHECK(e.s.v[2] == 0x01);
        CHECK(e.s.v[0xF] == 0x33);
    }

    SECTION("8xy0 copies") {
        e.s.v[4] = 0x99;
        e.run(0x8340);
        CHECK(e.s.v[3] == 0x99);
    }

    SECTION("8xy1/8xy2/8xy3 bitwise") {
        e.s.v[0] = 0b1100;
        e.s.v[1] = 0b1010;
        e.run(0x8011);
        CHECK(e.s.v[0] == 0b1110);

        e.s.v[0] = 0b1100;
        e.run(0x8012);
        CHECK(e.s.v[0] == 0b1000);

        e.s.v[0] = 0b1100;
        e.run(0x8013);
        CHECK(e.s.v[0] == 0b0110);
    }
}

TEST_CASE("8xy4 add with carry", "[instructions][alu]") {
    Executor e;

    SECTION("Overflow sets VF") {
        e.s.v[0] = 0xFF;
        e.s.v[1] = 0x01;
        e.run(0x8014);
        CHECK(e.s.v[0] == 0x00);
        CHECK(e.s.v[0xF] == 1);
    }

    SECTION("No overflow clears VF") {
        e.s.v[0] = 0x01;
        e.s.v[1] = 0x01;
        e.s.v[0xF] = 1;
        e.run(0x8014);
        CHECK(e.s.v[0] == 0x02);
        CHECK(e.s.v[0xF] == 0);
    }

    SECTION("Result overwrites the flag when x is F") {
        e.s.v[0xF] = 0xFF;
        e.s.v[1] = 0x02;
        e.run(0x8F14);
        CHECK(e.s.v[0xF] == 0x01);
    }
}

TEST_CASE("8xy5 and 8xy7 subtract with inverted borrow", "[instructions][alu]") {
    Executor e;

    SECTION("8xy5 without borrow") {
        e.s.v[0] = 0x05;
        e.s.v[1] = 0x01;
        e.run(0x8015);
        CHECK(e.s.v[0] == 0x04);
        CHECK(e.s.v[0xF] == 1);
    }

    SECTION("8xy5 with borrow") {
        e.s.v[0] = 0x01;
        e.s.v[1] = 0x05;
        e.run(0x8015);
        CHECK(e.s.v[0] == 0xFC);
        CHECK(e.s.v[0xF] == 0);
    }

    SECTION("8xy5 equal operands do not borrow") {
        e.s.v[0] = 0x07;
        e.s.v[1] = 0x07;
        e.run(0x8015);
        CHECK(e.s.v[0] == 0x00);
        CHECK(e.s.v[0xF] == 1);
    }

    SECTION("8xy7 without borrow") {
        e.s.v[0] = 0x01;
        e.s.v[1] = 0x05;
        e.run(0x8017);
        CHECK(e.s.v[0] == 0x04);
        CHECK(e.s.v[0xF] == 1);
    }

    SECTION("8xy7 with borrow") {
        e.s.v[0] = 0x05;
        e.s.v[1] = 0x01;
        e.run(0x8017);
        CHECK(e.s.v[0] == 0xFC);
        CHECK(e.s.v[0xF] == 0);
    }
}

TEST_CASE("Shifts", "[instructions][alu]") {
    Executor e;

    SECTION("8xy6 moves the low bit into VF") {
        e.s.v[5] = 0x03;
        e.run(0x8506);
        CHECK(e.s.v[5] == 0x01);
        CHECK(e.s.v[0xF] == 1);
    }

    SECTION("8xyE stores the raw high bit in VF") {
        e.s.v[5] = 0x81;
        e.run(0x850E);
        CHECK(e.s.v[5] == 0x02);
        CHECK(e.s.v[0xF] == 0x80);
    }

    SECTION("8xyE with a clear high bit") {
        e.s.v[5] = 0x41;
        e.run(0x850E);
        CHECK(e.s.v[5] == 0x82);
        CHECK(e.s.v[0xF] == 0x00);
    }
}

TEST_CASE("Index register", "[instructions][index]") {
    Executor e;

    SECTION("Annn") {
        e.run(0xA123);
        CHECK(e.s.i == 0x123);
    }

    SECTION("Fx1E adds Vx") {
        e.s.i = 0x100;
        e.s.v[3] = 0x20;
        e.run(0xF31E);
        CHECK(e.s.i == 0x120);
    }

    SECTION("Fx29 points at the glyph for digit A") {
        e.s.v[2] = 0xA;
        e.run(0xF229);
        REQUIRE(e.s.i == 0xA * 5);
        CHECK(e.s.memory.read(e.s.i + 0) == 0xF0);
        CHECK(e.s.memory.read(e.s.i + 1) == 0x90);
        CHECK(e.s.memory.read(e.s.i + 2) == 0xF0);
        CHECK(e.s.memory.read(e.s.i + 3) == 0x90);
        CHECK(e.s.memory.read(e.s.i + 4) == 0x90);
    }

    SECTION("Fx29 uses only the low nibble") {
        e.s.v[2] = 0x1B;
        e.run(0xF229);
        CHECK(e.s.i == 0xB * 5);
    }
}

TEST_CASE("Random byte is masked", "[instructions][rnd]") {
    Executor e;
    e.s.rng.seed(1234);

    for (int n = 0; n < 32; ++n) {
        e.s.pc = 0x200;
        e.run(0xC40F);
        REQUIRE((e.s.v[4] & 0xF0) == 0);
    }

    SECTION("A zero mask always yields zero") {
        e.s.pc = 0x200;
        e.run(0xC400);
        CHECK(e.s.v[4] == 0);
    }
}

TEST_CASE("Memory transfer", "[instructions][memory]") {
    Executor e;
    e.s.i = 0x300;

    SECTION("Fx33 stores BCD digits") {
        e.s.v[7] = 235;
        e.run(0xF733);
        CHECK(e.s.memory.read(0x300) == 2);
        CHECK(e.s.memory.read(0x301) == 3);
        CHECK(e.s.memory.read(0x302) == 5);
    }

    SECTION("Fx33 past the end of memory throws without writing") {
        e.s.v[7] = 235;
        e.s.i = 0xFFF;
        REQUIRE_THROWS_AS(e.run(0xF733), AddressError);
        CHECK(e.s.memory.read(0xFFF) == 0x00);

        e.s.i = 0xFFE;
        REQUIRE_THROWS_AS(e.run(0xF733), AddressError);
        CHECK(e.s.memory.read(0xFFE) == 0x00);
        CHECK(e.s.memory.read(0xFFF) == 0x00);
        CHECK(e.s.pc == 0x200);
    }

    SECTION("Fx33 ending on the last byte succeeds") {
        e.s.v[7] = 235;
        e.s.i = 0xFFD;
        e.run(0xF733);
        CHECK(e.s.memory.read(0xFFF) == 5);
    }

    SECTION("Fx55 past the end of memory throws without writing") {
        e.s.v[0] = 0xAA;
        e.s.v[1] = 0xBB;
        e.s.v[2] = 0xCC;
        e.s.i = 0xFFE;
        REQUIRE_THROWS_AS(e.run(0xF255), AddressError);
        CHECK(e.s.memory.read(0xFFE) == 0x00);
        CHECK(e.s.memory.read(0xFFF) == 0x00);
        CHECK(e.s.pc == 0x200);
    }

    SECTION("Fx65 past the end of memory throws without loading") {
        e.s.memory.write(0xFFE, 0x11);
        e.s.memory.write(0xFFF, 0x22);
        e.s.v[0] = 0xAA;
        e.s.v[1] = 0xBB;
        e.s.i = 0xFFE;
        REQUIRE_THROWS_AS(e.run(0xF265), AddressError);
        CHECK(e.s.v[0] == 0xAA);
        CHECK(e.s.v[1] == 0xBB);
    }

    SECTION("Fx55 stores V0..Vx inclusive") {
        for (uint8_t r = 0; r < 16; ++r) {
            e.s.v[r] = static_cast<uint8_t>(0x10 + r);
        }
        e.run(0xF355);
        CHECK(e.s.memory.read(0x300) == 0x10);
        CHECK(e.s.memory.read(0x303) == 0x13);
        CHECK(e.s.memory.read(0x304) == 0x00);
        CHECK(e.s.i == 0x300);
    }

    SECTION("Fx65 loads V0..Vx inclusive") {
        e.s.memory.write(0x300, 0xAA);
        e.s.memory.write(0x301, 0xBB);
        e.s.memory.write(0x302, 0xCC);
        e.run(0xF165);
        CHECK(e.s.v[0] == 0xAA);
        CHECK(e.s.v[1] == 0xBB);
        CHECK(e.s.v[2] == 0x00);
    }
}

TEST_CASE("Timers", "[instructions][timers]") {
    Executor e;

    SECTION("Fx15 and Fx07") {
        e.s.v[1] = 0x3C;
        e.run(0xF115);
        CHECK(e.s.delay_timer == 0x3C);

        e.run(0xF207);
        CHECK(e.s.v[2] == 0x3C);
    }

    SECTION("Fx18 sets the sound timer") {
        e.s.v[1] = 0x05;
        e.run(0xF118);
        CHECK(e.s.sound_timer == 0x05);
    }
}

TEST_CASE("Key skips", "[instructions][keypad]") {
    Executor e;
    e.s.v[3] = 0xA;

    SECTION("Key A pressed") {
        e.s.keypad.key_down(0xA);

        e.run(0xE39E);
        CHECK(e.s.pc == 0x204);

        e.s.pc = 0x200;
        e.run(0xE3A1);
        CHECK(e.s.pc == 0x202);
    }

    SECTION("Key A released") {
        e.run(0xE39E);
        CHECK(e.s.pc == 0x202);

        e.s.pc = 0x200;
        e.run(0xE3A1);
        CHECK(e.s.pc == 0x204);
    }
}

TEST_CASE("Fx0A waits for a key", "[instructions][keypad]") {
    Executor e;

    e.run(0xF50A);
    CHECK(e.s.pc == 0x200);
    CHECK(e.s.waiting_for_key);

    e.s.keypad.key_down(0x9);
    e.s.keypad.key_down(0x6);
    e.run(0xF50A);
    CHECK(e.s.pc == 0x202);
    CHECK(e.s.v[5] == 0x6);
    CHECK_FALSE(e.s.waiting_for_key);
}
