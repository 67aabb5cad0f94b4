#include "chipium/Errors.hpp"
#include <iomanip>
#include <sstream>

namespace chipium {

std::string hex_string(uint32_t value, int digits) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase
        << std::setw(digits) << std::setfill('0') << value;
    return oss.str();
}

DecodeError::DecodeError(uint16_t opcode, uint16_t pc)
    : MachineError("unknown opcode " + hex_string(opcode, 4) + " at " + hex_string(pc, 3))
    , opcode_(opcode)
    , pc_(pc)
{
}

} // namespace chipium
