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

#ifndef CHIPIUM_TYPES_HPP
#define CHIPIUM_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace chipium {

// Memory map
constexpr size_t kMemorySize = 4096;
constexpr uint16_t kFontStart = 0x000;
constexpr uint16_t kFontEnd = 0x04F;
constexpr uint16_t kProgramStart = 0x200;
constexpr size_t kMaxImageSize = kMemorySize - kProgramStart;  // 3584 bytes

constexpr size_t kRegisterCount = 16;
constexpr uint8_t kFlagRegister = 0xF;  // VF: carry, borrow and collision
constexpr size_t kStackDepth = 16;
constexpr size_t kKeyCount = 16;

// Display: 64x32 monochrome, exported as RGB24
constexpr size_t kDisplayWidth = 64;
constexpr size_t kDisplayHeight = 32;
constexpr size_t kPixelCount = kDisplayWidth * kDisplayHeight;
constexpr size_t kBytesPerPixel = 3;
constexpr size_t kDisplayBytes = kPixelCount * kBytesPerPixel;  // 6144
constexpr uint8_t kPixelOff = 0x00;
constexpr uint8_t kPixelOn = 0xFF;

// Nominal timer and frame rate
constexpr uint32_t kFrameRateHz = 60;

// Hexadecimal digit sprites, 5 bytes each, preloaded at kFontStart
constexpr size_t kFontGlyphBytes = 5;
constexpr std::array<uint8_t, 80> kFontSet = {
    0xF0, 0x90, 0x90, 0x90, 0xF0,  // 0
    0x20, 0x60, 0x20, 0x20, 0x70,  // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0,  // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0,  // 3
    0x90, 0x90, 0xF0, 0x10, 0x10,  // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0,  // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0,  // 6
    0xF0, 0x10, 0x20, 0x40, 0x40,  // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0,  // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0,  // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90,  // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0,  // B
    0xF0, 0x80, 0x80, 0x80, 0xF0,  // C
    0xE0, 0x90, 0x90, 0x90, 0xE0,  // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0,  // E
    0xF0, 0x80, 0xF0, 0x80, 0x80,  // F
};

} // namespace chipium

#endif // CHIPIUM_TYPES_HPP
