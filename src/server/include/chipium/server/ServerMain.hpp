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

#ifndef CHIPIUM_SERVER_SERVER_MAIN_HPP
#define CHIPIUM_SERVER_SERVER_MAIN_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chipium::server {

constexpr uint16_t DEFAULT_GRPC_PORT = 0xC808;  // 51208
constexpr uint32_t DEFAULT_INSTRUCTIONS_PER_FRAME = 10;

// Launcher configuration, filled from the command line
struct ServerOptions {
    std::string rom_filepath;
    std::string address = "0.0.0.0";
    uint16_t port = DEFAULT_GRPC_PORT;
    uint32_t instructions_per_frame = DEFAULT_INSTRUCTIONS_PER_FRAME;
    std::optional<uint32_t> seed;
    bool start_paused = false;
    bool show_help = false;
    bool show_info = false;
};

// Parse arguments (excluding the program name).
// Throws std::invalid_argument for unknown flags, missing or malformed
// values, or a missing ROM path.
ServerOptions parse_arguments(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const char* program_name);

// JSON machine description for frontend discovery
void print_info(std::ostream& out, const char* program_name);

int server_main(int argc, char* argv[]);

} // namespace chipium::server

#endif // CHIPIUM_SERVER_SERVER_MAIN_HPP
