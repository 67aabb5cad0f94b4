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

#include "chipium/server/ServerMain.hpp"
#include "chipium/Errors.hpp"
#include "chipium/Machine.hpp"
#include "chipium/Types.hpp"
#include "chipium/service/Server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <thread>

namespace chipium::server {

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int /*signal*/) {
    g_running = false;
}

uint32_t parse_number(const std::string& flag, const std::string& text, uint32_t min, uint32_t max) {
    size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &consumed, 0);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    }
    if (consumed != text.size() || value < min || value > max) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    }
    return static_cast<uint32_t>(value);
}

} // anonymous namespace

ServerOptions parse_arguments(const std::vector<std::string>& args) {
    ServerOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return options;
        } else if (arg == "--info") {
            options.show_info = true;
            return options;
        } else if (arg == "--paused") {
            options.start_paused = true;
        } else if (arg == "--rom" && has_value) {
            options.rom_filepath = args[++i];
        } else if (arg == "--address" && has_value) {
            options.address = args[++i];
        } else if (arg == "--port" && has_value) {
            options.port = static_cast<uint16_t>(parse_number(arg, args[++i], 1, 65535));
        } else if (arg == "--ipf" && has_value) {
            options.instructions_per_frame = parse_number(arg, args[++i], 1, 100000);
        } else if (arg == "--seed" && has_value) {
            options.seed = parse_number(arg, args[++i], 0, std::numeric_limits<uint32_t>::max());
        } else if (!arg.empty() && arg[0] != '-' && options.rom_filepath.empty()) {
            options.rom_filepath = arg;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (options.rom_filepath.empty()) {
        throw std::invalid_argument("A ROM filepath is required");
    }

    return options;
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [options] <rom>\n"
        << "\n"
        << "Required:\n"
        << "  --rom <filepath>     Program image, loaded at 0x200 (or pass it positionally)\n"
        << "\n"
        << "Optional:\n"
        << "  --address <host>     gRPC bind address (default: 0.0.0.0)\n"
        << "  --port <port>        gRPC port (default: " << DEFAULT_GRPC_PORT << ")\n"
        << "  --ipf <count>        Instructions per frame (default: "
        << DEFAULT_INSTRUCTIONS_PER_FRAME << ")\n"
        << "  --seed <value>       Seed for the random number instruction\n"
        << "  --paused             Start halted, waiting for a debugger\n"
        << "  --info               Show machine information and exit\n"
        << "  --help               Show this help message\n";
}

void print_info(std::ostream& out, const char* program_name) {
    out << "{\n"
        << "  \"executable\": \"" << program_name << "\",\n"
        << "  \"machine_type\": \"chip8\",\n"
        << "  \"display_name\": \"CHIP-8\",\n"
        << "  \"version\": \"" << CHIPIUM_VERSION << "\",\n"
        << "  \"display_width\": " << kDisplayWidth << ",\n"
        << "  \"display_height\": " << kDisplayHeight << ",\n"
        << "  \"memory_size\": " << kMemorySize << ",\n"
        << "  \"program_start\": " << kProgramStart << "\n"
        << "}\n";
}

int server_main(int argc, char* argv[]) {
    ServerOptions options;
    try {
        options = parse_arguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    if (options.show_help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    if (options.show_info) {
        print_info(std::cout, argv[0]);
        return 0;
    }

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        const uint32_t seed = options.seed ? *options.seed : std::random_device{}();

        std::cout << "Initializing CHIP-8...\n";
        Machine machine(seed);

        std::cout << "Loading ROM: " << options.rom_filepath << "\n";
        const size_t loaded = machine.load_image_file(options.rom_filepath);
        const auto file_size = std::filesystem::file_size(options.rom_filepath);
        if (loaded < file_size) {
            std::cerr << "Warning: ROM is " << file_size << " bytes, only the first "
                      << loaded << " fit in memory\n";
        }

        if (options.start_paused) {
            machine.halt("waiting for debugger");
        }

        // Start gRPC server
        std::cout << "Starting gRPC server on port " << options.port << "...\n";
        service::Server server(machine, options.address, options.port);
        server.start();

        std::cout << "chipium-server running. Press Ctrl+C to stop.\n";

        // Main emulation loop, one batch of instructions per nominal frame
        const auto frame_interval = std::chrono::microseconds(1'000'000 / kFrameRateHz);
        while (g_running) {
            // Wait while the debugger holds the machine
            if (!machine.wait_if_paused(std::chrono::milliseconds(100))) {
                continue;
            }

            const auto frame_start = std::chrono::steady_clock::now();
            try {
                machine.run(options.instructions_per_frame);
            } catch (const MachineError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                std::cerr << "Machine halted; attach a debugger to inspect or reset\n";
                machine.halt(e.what());
            }
            std::this_thread::sleep_until(frame_start + frame_interval);
        }

        std::cout << "\nShutting down...\n";
        server.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

} // namespace chipium::server
