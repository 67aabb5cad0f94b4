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

#ifndef CHIPIUM_MACHINE_HPP
#define CHIPIUM_MACHINE_HPP

#include "ChipiumState.hpp"
#include "FrameBuffer.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace chipium {

// Instruction callback: called before each instruction executes during run()
using InstructionCallback = std::function<bool(uint16_t pc, uint64_t instruction)>;  // return false to stop

// Virtual CPU with its memory, display, keypad and timers.
//
// All mutation happens through load_image(), step()/run() and the
// accessors below. Callers must serialize those calls: another thread
// takes lock_execution() first. The keypad, the published frame buffer
// and the published sound timer need no lock.
class Machine {
public:
    // The seed feeds the random source used by Cxkk
    explicit Machine(uint32_t seed = std::random_device{}());

    // Non-copyable
    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // Reset to power-on state, then reload the most recent image
    void reset();

    // Copy an image into memory at 0x200. Bytes beyond the end of memory
    // are not copied; returns the number of bytes that were.
    size_t load_image(std::span<const uint8_t> image);

    // Read a whole image file, then load it. Throws ImageLoadError if the
    // file cannot be read, in which case memory is untouched.
    size_t load_image_file(const std::filesystem::path& filepath);

    // Fetch, decode and execute one instruction, then tick the timers.
    // Machine faults propagate as MachineError subclasses.
    void step();

    // Execute up to count instructions. Stops early if the machine is
    // paused or the instruction callback returns false.
    // Holds the execution lock for the whole batch.
    // Returns the number of instructions executed.
    uint64_t run(uint64_t count);

    // Exclusive access to machine state from outside the emulation thread.
    // Blocks until any run() in progress has returned; combined with
    // pause() this parks the emulation loop until the lock is released.
    std::unique_lock<std::mutex> lock_execution() {
        return std::unique_lock<std::mutex>(execution_mutex_);
    }

    // Apply a host key event through the fixed key table.
    // Returns false (and changes nothing) if the key is unmapped.
    bool update_keypad(uint32_t host_key, bool pressed);

    // Pixel accessors over the RGB24 display. Writes publish a new frame.
    bool get_pixel(size_t index) const { return state_.display.get_pixel(index); }
    void set_pixel(size_t index, bool on);
    void xor_pixel(size_t index, bool on);

    // Live display bytes (emulation thread only)
    std::span<const uint8_t> framebuffer() const { return state_.display.bytes(); }

    // Published frames (safe from any thread)
    FrameBuffer& frame_buffer() { return frame_buffer_; }
    const FrameBuffer& frame_buffer() const { return frame_buffer_; }

    // Audio: a tone should sound while the sound timer is non-zero
    uint8_t sound_timer() const { return state_.sound_timer; }
    bool sound_active() const { return state_.sound_timer > 0; }

    // Sound timer as of the last completed step (safe from any thread)
    uint8_t published_sound_timer() const { return published_sound_timer_.load(); }

    // State access
    const ChipiumState& state() const { return state_; }
    ChipiumState& state() { return state_; }

    // Instructions executed since reset
    uint64_t instruction_count() const { return instruction_count_; }

    // Sequence counter (increments on any mutation, for change detection)
    uint64_t sequence() const { return sequence_.load(); }

    // Debug pause/resume for debugger integration
    bool is_paused() const { return paused_.load(); }
    void pause();
    void resume();

    // Pause and record why (fault, breakpoint, debugger request)
    void halt(const std::string& reason);
    std::string halt_reason() const;

    // Block until not paused or the timeout expires - call from emulation loop.
    // Returns true if the machine is running.
    bool wait_if_paused(std::chrono::milliseconds timeout);

    // Register accessors (debugger convenience)
    uint8_t v(uint8_t reg) const { return state_.v[reg & 0x0F]; }
    uint16_t i() const { return state_.i; }
    uint16_t pc() const { return state_.pc; }
    uint8_t sp() const { return state_.sp; }
    uint8_t delay_timer() const { return state_.delay_timer; }

    // Register setters (for debugger) - each increments sequence_
    void set_v(uint8_t reg, uint8_t value) { state_.v[reg & 0x0F] = value; ++sequence_; }
    void set_i(uint16_t value) { state_.i = value; ++sequence_; }
    void set_pc(uint16_t value) { state_.pc = value; ++sequence_; }
    void set_delay_timer(uint8_t value) { state_.delay_timer = value; ++sequence_; }
    void set_sound_timer(uint8_t value) {
        state_.sound_timer = value;
        published_sound_timer_.store(value);
        ++sequence_;
    }

    // Direct memory access (bounds checked)
    uint8_t peek(uint16_t addr) const { return state_.memory.read(addr); }
    void poke(uint16_t addr, uint8_t value) { state_.memory.write(addr, value); ++sequence_; }

    // Instruction callback
    void set_instruction_callback(InstructionCallback cb) { on_instruction_ = std::move(cb); }

private:
    ChipiumState state_;
    FrameBuffer frame_buffer_;
    std::vector<uint8_t> image_;
    uint64_t instruction_count_ = 0;
    InstructionCallback on_instruction_;

    // Held by run(); taken by debugger clients via lock_execution()
    std::mutex execution_mutex_;

    // Debug pause/resume state (for debugger attach)
    mutable std::mutex debug_mutex_;
    std::condition_variable debug_cv_;
    std::atomic<bool> paused_{false};
    std::atomic<bool> skip_callback_{false};  // Step off a breakpoint after resume
    std::atomic<uint64_t> sequence_{0};       // Increments on any mutation
    std::atomic<uint8_t> published_sound_timer_{0};
    std::string halt_reason_;
};

} // namespace chipium

#endif // CHIPIUM_MACHINE_HPP
