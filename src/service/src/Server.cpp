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

#include "chipium/service/Server.hpp"
#include "chipium/service/AudioService.hpp"
#include "chipium/service/DebuggerService.hpp"
#include "chipium/service/KeypadService.hpp"
#include "chipium/service/VideoService.hpp"
#include "chipium/Machine.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace chipium::service {

struct Server::Impl {
    Machine& machine;
    std::string address;
    uint16_t port;

    std::unique_ptr<VideoServiceImpl> video_service;
    std::unique_ptr<KeypadServiceImpl> keypad_service;
    std::unique_ptr<AudioServiceImpl> audio_service;
    std::unique_ptr<DebuggerControlServiceImpl> debugger_control_service;
    std::unique_ptr<DebuggerChip8ServiceImpl> debugger_chip8_service;
    std::unique_ptr<grpc::Server> grpc_server;

    std::atomic<bool> running{false};

    Impl(Machine& m, const std::string& addr, uint16_t p)
        : machine(m), address(addr), port(p) {}

    void release_services() {
        video_service.reset();
        keypad_service.reset();
        audio_service.reset();
        debugger_control_service.reset();
        debugger_chip8_service.reset();
    }
};

Server::Server(Machine& machine, const std::string& address, uint16_t port)
    : impl_(std::make_unique<Impl>(machine, address, port)) {
}

Server::~Server() {
    stop();
}

void Server::start() {
    if (impl_->running) {
        return;
    }

    // Create services
    impl_->video_service = std::make_unique<VideoServiceImpl>(impl_->machine.frame_buffer());
    impl_->keypad_service = std::make_unique<KeypadServiceImpl>(impl_->machine);
    impl_->audio_service = std::make_unique<AudioServiceImpl>(impl_->machine);
    impl_->debugger_control_service = std::make_unique<DebuggerControlServiceImpl>(impl_->machine);
    impl_->debugger_chip8_service = std::make_unique<DebuggerChip8ServiceImpl>(impl_->machine);

    // Build server address
    std::ostringstream addr_stream;
    addr_stream << impl_->address << ":" << impl_->port;
    std::string server_address = addr_stream.str();

    // Create and start gRPC server
    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(impl_->video_service.get());
    builder.RegisterService(impl_->keypad_service.get());
    builder.RegisterService(impl_->audio_service.get());
    builder.RegisterService(impl_->debugger_control_service.get());
    builder.RegisterService(impl_->debugger_chip8_service.get());

    impl_->grpc_server = builder.BuildAndStart();
    if (!impl_->grpc_server) {
        impl_->release_services();
        throw std::runtime_error("Cannot start gRPC server on " + server_address);
    }
    impl_->running = true;
}

void Server::stop() {
    if (!impl_->running) {
        return;
    }

    impl_->running = false;

    if (impl_->grpc_server) {
        // Streaming calls (SubscribeFrames) end when their context is cancelled
        impl_->grpc_server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
        impl_->grpc_server.reset();
    }

    impl_->release_services();
}

bool Server::is_running() const {
    return impl_->running;
}

std::string Server::address() const {
    return impl_->address;
}

uint16_t Server::port() const {
    return impl_->port;
}

} // namespace chipium::service
