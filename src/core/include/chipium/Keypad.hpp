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

#pragma once

#include "Types.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <optional>

namespace chipium {

// Hexadecimal keypad (16 keys, 0-F)
//
// Historical layout:
//   1 2 3 C
//   4 5 6 D
//   7 8 9 E
//   A 0 B F
//
// Thread Safety:
// This class is thread-safe. It can be written from one thread (e.g., gRPC)
// and read from another (e.g., emulator main loop) without external locking.
// All state lives in one atomic bitmask, bit N set meaning key N is down.
//
class Keypad {
public:
    static constexpr uint8_t NUM_KEYS = kKeyCount;

    // Set a key as pressed (thread-safe)
    void key_down(uint8_t key) {
        if (key < NUM_KEYS) {
            pressed_.fetch_or(static_cast<uint16_t>(1 << key),
                              std::memory_order_release);
        }
    }

    // Set a key as released (thread-safe)
    void key_up(uint8_t key) {
        if (key < NUM_KEYS) {
            pressed_.fetch_and(static_cast<uint16_t>(~(1 << key)),
                               std::memory_order_release);
        }
    }

    void set(uint8_t key, bool pressed) {
        if (pressed) {
            key_down(key);
        } else {
            key_up(key);
        }
    }

    // Check if a specific key is pressed (thread-safe)
    bool is_pressed(uint8_t key) const {
        if (key < NUM_KEYS) {
            return (pressed_.load(std::memory_order_acquire) & (1 << key)) != 0;
        }
        return false;
    }

    // Bitmask of all pressed keys (thread-safe snapshot)
    uint16_t pressed_mask() const {
        return pressed_.load(std::memory_order_acquire);
    }

    // Lowest-numbered pressed key, if any
    std::optional<uint8_t> first_pressed() const {
        const uint16_t mask = pressed_mask();
        for (uint8_t key = 0; key < NUM_KEYS; ++key) {
            if (mask & (1 << key)) {
                return key;
            }
        }
        return std::nullopt;
    }

    // Release all keys (thread-safe)
    void clear() {
        pressed_.store(0, std::memory_order_release);
    }

private:
    std::atomic<uint16_t> pressed_{0};
};

// Map a host key identifier to its keypad slot.
//
// Host keys are character codes. The left-hand 4x4 block of a QWERTY
// keyboard mirrors the keypad layout:
//   1 2 3 4      1 2 3 C
//   Q W E R  ->  4 5 6 D
//   A S D F      7 8 9 E
//   Z X C V      A 0 B F
// Letters match in either case. Any other key is unmapped.
std::optional<uint8_t> host_key_to_slot(uint32_t host_key);

} // namespace chipium
