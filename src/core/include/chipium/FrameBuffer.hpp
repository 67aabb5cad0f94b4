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

#ifndef CHIPIUM_FRAME_BUFFER_HPP
#define CHIPIUM_FRAME_BUFFER_HPP

#include "Types.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace chipium {

// Double-buffered RGB24 frame buffer for video output.
//
// The core copies its display into the front buffer and swaps it to the
// back when an instruction changed the screen. Clients read from the back
// buffer (immutable between swaps).
//
// Thread safety:
// - present(): Called only by the emulation thread, locks for the swap
// - copy_frame()/snapshot(): Called by clients, acquires lock briefly
// - version(): Lock-free read of atomic counter
// - wait_for_new_frame(): Blocks a client until present() swaps or the timeout passes
//
class FrameBuffer {
public:
    FrameBuffer() = default;

    // Non-copyable, non-movable
    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;
    FrameBuffer(FrameBuffer&&) = delete;
    FrameBuffer& operator=(FrameBuffer&&) = delete;

    // --- Core interface ---

    // Publish a complete frame.
    // Increments version counter so clients can detect new frames.
    void present(std::span<const uint8_t> pixels) {
        const size_t count = std::min(pixels.size(), front_->size());
        std::copy(pixels.begin(), pixels.begin() + count, front_->begin());

        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(front_, back_);
            version_.fetch_add(1, std::memory_order_release);
        }
        presented_.notify_all();
    }

    // --- Client interface ---

    // Copy the last complete frame to a destination
    void copy_frame(uint8_t* dest, size_t max_bytes) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = std::min(max_bytes, back_->size());
        std::copy(back_->begin(), back_->begin() + count, dest);
    }

    // Copy of the last complete frame
    std::vector<uint8_t> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<uint8_t>(back_->begin(), back_->end());
    }

    // Get the frame version counter.
    // Incremented each time present() is called.
    uint64_t version() const {
        return version_.load(std::memory_order_acquire);
    }

    // Block until the version differs from last_version, or until timeout.
    // Returns the version current on wake, which equals last_version on timeout.
    uint64_t wait_for_new_frame(uint64_t last_version, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        presented_.wait_for(lock, timeout, [&] {
            return version_.load(std::memory_order_acquire) != last_version;
        });
        return version_.load(std::memory_order_acquire);
    }

    // --- Query interface ---

    size_t width() const { return kDisplayWidth; }
    size_t height() const { return kDisplayHeight; }
    size_t stride() const { return kDisplayWidth * kBytesPerPixel; }
    size_t byte_size() const { return kDisplayBytes; }

private:
    using Frame = std::array<uint8_t, kDisplayBytes>;

    Frame frame_a_{};
    Frame frame_b_{};
    Frame* front_ = &frame_a_;  // Core writes here
    Frame* back_ = &frame_b_;   // Clients read here

    mutable std::mutex mutex_;          // Protects swap operations
    mutable std::condition_variable presented_;
    std::atomic<uint64_t> version_{0};  // Frame version counter
};

} // namespace chipium

#endif // CHIPIUM_FRAME_BUFFER_HPP
