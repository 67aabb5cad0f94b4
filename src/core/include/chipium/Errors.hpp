#ifndef CHIPIUM_ERRORS_HPP
#define CHIPIUM_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chipium {

// Base for every fault raised by the machine. Faults are fatal to the
// running program: the caller decides whether to halt, reset or exit.
class MachineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Opcode that matches no instruction
class DecodeError : public MachineError {
public:
    DecodeError(uint16_t opcode, uint16_t pc);

    uint16_t opcode() const { return opcode_; }
    uint16_t pc() const { return pc_; }

private:
    uint16_t opcode_;
    uint16_t pc_;
};

// Call stack overflow (more than 16 nested calls) or underflow (return
// with nothing on the stack)
class StackError : public MachineError {
public:
    using MachineError::MachineError;
};

// Memory address or pixel index outside the machine's fixed arrays
class AddressError : public MachineError {
public:
    using MachineError::MachineError;
};

// A framebuffer byte that is neither the "off" nor the "on" encoding.
// Indicates a bug in drawing, not a condition a program can cause.
class PixelStateError : public MachineError {
public:
    using MachineError::MachineError;
};

// Program image could not be read from its backing file
class ImageLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Format a value as 0xNNN... with the given number of hex digits
std::string hex_string(uint32_t value, int digits);

} // namespace chipium

#endif // CHIPIUM_ERRORS_HPP
