#include "chipium/Machine.hpp"
#include "chipium/Cpu.hpp"
#include "chipium/Errors.hpp"
#include "chipium/Keypad.hpp"

#include <fstream>

namespace chipium {

namespace {

std::vector<uint8_t> read_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        throw ImageLoadError("Cannot open file: " + filepath.string());
    }

    auto size = file.tellg();
    if (size < 0) {
        throw ImageLoadError("Cannot determine size of file: " + filepath.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw ImageLoadError("Cannot read file: " + filepath.string());
    }

    return data;
}

} // anonymous namespace

Machine::Machine(uint32_t seed) {
    state_.rng.seed(seed);
    reset();
}

void Machine::reset() {
    state_.reset();
    state_.memory.load(kProgramStart, image_);
    instruction_count_ = 0;
    published_sound_timer_.store(0);
    frame_buffer_.present(state_.display.bytes());
    ++sequence_;
}

size_t Machine::load_image(std::span<const uint8_t> image) {
    const size_t copied = state_.memory.load(kProgramStart, image);
    image_.assign(image.begin(), image.begin() + copied);
    ++sequence_;
    return copied;
}

size_t Machine::load_image_file(const std::filesystem::path& filepath) {
    const auto data = read_file(filepath);
    return load_image(data);
}

void Machine::step() {
    cycle(state_);
    ++instruction_count_;
    ++sequence_;
    published_sound_timer_.store(state_.sound_timer);

    if (state_.draw_flag) {
        frame_buffer_.present(state_.display.bytes());
    }
}

uint64_t Machine::run(uint64_t count) {
    std::lock_guard<std::mutex> lock(execution_mutex_);
    uint64_t executed = 0;
    while (executed < count && !paused_.load()) {
        const bool skip = skip_callback_.exchange(false);
        if (on_instruction_ && !skip) {
            if (!on_instruction_(state_.pc, instruction_count_)) {
                break;  // Callback requested stop
            }
        }
        step();
        ++executed;
    }
    return executed;
}

bool Machine::update_keypad(uint32_t host_key, bool pressed) {
    const auto slot = host_key_to_slot(host_key);
    if (!slot) {
        return false;
    }
    state_.keypad.set(*slot, pressed);
    ++sequence_;
    return true;
}

void Machine::set_pixel(size_t index, bool on) {
    state_.display.set_pixel(index, on);
    frame_buffer_.present(state_.display.bytes());
    ++sequence_;
}

void Machine::xor_pixel(size_t index, bool on) {
    state_.display.xor_pixel(index, on);
    frame_buffer_.present(state_.display.bytes());
    ++sequence_;
}

void Machine::pause() {
    paused_.store(true);
    ++sequence_;
}

void Machine::resume() {
    {
        std::lock_guard<std::mutex> lock(debug_mutex_);
        halt_reason_.clear();
        skip_callback_.store(true);
        paused_.store(false);
    }
    debug_cv_.notify_all();
    ++sequence_;
}

void Machine::halt(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(debug_mutex_);
        halt_reason_ = reason;
    }
    pause();
}

std::string Machine::halt_reason() const {
    std::lock_guard<std::mutex> lock(debug_mutex_);
    return halt_reason_;
}

bool Machine::wait_if_paused(std::chrono::milliseconds timeout) {
    if (!paused_.load()) {
        return true;
    }
    std::unique_lock<std::mutex> lock(debug_mutex_);
    return debug_cv_.wait_for(lock, timeout, [this] { return !paused_.load(); });
}

} // namespace chipium
