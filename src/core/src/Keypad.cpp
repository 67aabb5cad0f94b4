#include "chipium/Keypad.hpp"
#include <utility>

namespace chipium {

namespace {

constexpr std::array<std::pair<char, uint8_t>, kKeyCount> kHostKeyLayout = {{
    {'1', 0x1}, {'2', 0x2}, {'3', 0x3}, {'4', 0xC},
    {'Q', 0x4}, {'W', 0x5}, {'E', 0x6}, {'R', 0xD},
    {'A', 0x7}, {'S', 0x8}, {'D', 0x9}, {'F', 0xE},
    {'Z', 0xA}, {'X', 0x0}, {'C', 0xB}, {'V', 0xF},
}};

} // anonymous namespace

std::optional<uint8_t> host_key_to_slot(uint32_t host_key) {
    if (host_key >= 'a' && host_key <= 'z') {
        host_key -= 'a' - 'A';
    }
    for (const auto& [key, slot] : kHostKeyLayout) {
        if (static_cast<uint32_t>(key) == host_key) {
            return slot;
        }
    }
    return std::nullopt;
}

} // namespace chipium
