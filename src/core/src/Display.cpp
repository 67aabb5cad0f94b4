#include "chipium/Display.hpp"
#include "chipium/Errors.hpp"
#include <algorithm>
#include <string>

namespace chipium {

size_t Display::triplet_offset(size_t index) {
    if (index >= kPixelCount) {
        throw AddressError("pixel index " + std::to_string(index) + " out of range");
    }
    return index * kBytesPerPixel;
}

bool Display::get_pixel(size_t index) const {
    // Only the first byte is inspected; set_pixel keeps all three equal
    const uint8_t value = bytes_[triplet_offset(index)];
    switch (value) {
        case kPixelOn:
            return true;
        case kPixelOff:
            return false;
        default:
            throw PixelStateError("pixel " + std::to_string(index) +
                                  " holds invalid value " + hex_string(value, 2));
    }
}

bool Display::get_pixel(size_t col, size_t row) const {
    if (col >= WIDTH || row >= HEIGHT) {
        throw AddressError("pixel (" + std::to_string(col) + ", " + std::to_string(row) +
                           ") out of range");
    }
    return get_pixel(row * WIDTH + col);
}

void Display::set_pixel(size_t index, bool on) {
    const size_t offset = triplet_offset(index);
    const uint8_t value = on ? kPixelOn : kPixelOff;
    bytes_[offset + 0] = value;
    bytes_[offset + 1] = value;
    bytes_[offset + 2] = value;
}

void Display::xor_pixel(size_t index, bool on) {
    set_pixel(index, get_pixel(index) != on);
}

void Display::clear() {
    std::fill(bytes_.begin(), bytes_.end(), kPixelOff);
}

} // namespace chipium
