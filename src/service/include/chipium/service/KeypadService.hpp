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

#ifndef CHIPIUM_SERVICE_KEYPAD_SERVICE_HPP
#define CHIPIUM_SERVICE_KEYPAD_SERVICE_HPP

#include "keypad.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <mutex>

namespace chipium {

class Machine;

namespace service {

/// gRPC service implementation for keypad input
class KeypadServiceImpl final : public KeypadService::Service {
public:
    explicit KeypadServiceImpl(Machine& machine);
    ~KeypadServiceImpl() override;

    // Non-copyable
    KeypadServiceImpl(const KeypadServiceImpl&) = delete;
    KeypadServiceImpl& operator=(const KeypadServiceImpl&) = delete;

    grpc::Status KeyDown(
        grpc::ServerContext* context,
        const KeyRequest* request,
        KeyResponse* response) override;

    grpc::Status KeyUp(
        grpc::ServerContext* context,
        const KeyRequest* request,
        KeyResponse* response) override;

    grpc::Status PressSlot(
        grpc::ServerContext* context,
        const SlotRequest* request,
        KeyResponse* response) override;

    grpc::Status ReleaseSlot(
        grpc::ServerContext* context,
        const SlotRequest* request,
        KeyResponse* response) override;

    grpc::Status GetState(
        grpc::ServerContext* context,
        const GetStateRequest* request,
        KeypadState* response) override;

private:
    void apply_host_key(const KeyRequest* request, KeyResponse* response, bool pressed);
    void apply_slot(const SlotRequest* request, KeyResponse* response, bool pressed);

    Machine& machine_;
    std::mutex mutex_;
};

} // namespace service
} // namespace chipium

#endif // CHIPIUM_SERVICE_KEYPAD_SERVICE_HPP
