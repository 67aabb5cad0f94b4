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

#ifndef CHIPIUM_DISPLAY_HPP
#define CHIPIUM_DISPLAY_HPP

#include "Types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace chipium {

// 64x32 monochrome display.
//
// Each logical pixel is stored as an RGB24 triplet so that the whole
// buffer can be uploaded to a renderer unchanged. The three bytes of a
// triplet are always identical: 0x00 (off) or 0xFF (on). Pixel (col, row)
// starts at byte 3 * (row * 64 + col).
//
class Display {
public:
    static constexpr size_t WIDTH = kDisplayWidth;
    static constexpr size_t HEIGHT = kDisplayHeight;

    // State of one pixel. Throws PixelStateError if the triplet holds
    // anything other than the two legal encodings.
    bool get_pixel(size_t index) const;
    // Throws AddressError if either coordinate is off the screen.
    bool get_pixel(size_t col, size_t row) const;

    void set_pixel(size_t index, bool on);

    // XOR-style blend: a pixel whose state equals `on` turns off,
    // otherwise it turns on.
    void xor_pixel(size_t index, bool on);

    // Turn every pixel off
    void clear();

    // RGB24 export buffer
    std::span<const uint8_t> bytes() const { return bytes_; }

    // Raw mutable access (for testing/debugging)
    uint8_t* data() { return bytes_.data(); }

private:
    static size_t triplet_offset(size_t index);

    std::array<uint8_t, kDisplayBytes> bytes_{};
};

} // namespace chipium

#endif // CHIPIUM_DISPLAY_HPP
