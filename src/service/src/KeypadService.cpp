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

#include "chipium/service/KeypadService.hpp"
#include "chipium/Keypad.hpp"
#include "chipium/Machine.hpp"

namespace chipium::service {

KeypadServiceImpl::KeypadServiceImpl(Machine& machine)
    : machine_(machine) {
}

KeypadServiceImpl::~KeypadServiceImpl() = default;

void KeypadServiceImpl::apply_host_key(const KeyRequest* request, KeyResponse* response,
                                       bool pressed) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto slot = host_key_to_slot(request->key());
    if (!slot) {
        response->set_accepted(false);
        return;
    }

    machine_.update_keypad(request->key(), pressed);
    response->set_accepted(true);
    response->set_slot(*slot);
}

void KeypadServiceImpl::apply_slot(const SlotRequest* request, KeyResponse* response,
                                   bool pressed) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t slot = request->slot();
    if (slot >= Keypad::NUM_KEYS) {
        response->set_accepted(false);
        return;
    }

    machine_.state().keypad.set(static_cast<uint8_t>(slot), pressed);
    response->set_accepted(true);
    response->set_slot(slot);
}

grpc::Status KeypadServiceImpl::KeyDown(
    grpc::ServerContext* /*context*/,
    const KeyRequest* request,
    KeyResponse* response) {

    apply_host_key(request, response, true);
    return grpc::Status::OK;
}

grpc::Status KeypadServiceImpl::KeyUp(
    grpc::ServerContext* /*context*/,
    const KeyRequest* request,
    KeyResponse* response) {

    apply_host_key(request, response, false);
    return grpc::Status::OK;
}

grpc::Status KeypadServiceImpl::PressSlot(
    grpc::ServerContext* /*context*/,
    const SlotRequest* request,
    KeyResponse* response) {

    apply_slot(request, response, true);
    return grpc::Status::OK;
}

grpc::Status KeypadServiceImpl::ReleaseSlot(
    grpc::ServerContext* /*context*/,
    const SlotRequest* request,
    KeyResponse* response) {

    apply_slot(request, response, false);
    return grpc::Status::OK;
}

grpc::Status KeypadServiceImpl::GetState(
    grpc::ServerContext* /*context*/,
    const GetStateRequest* /*request*/,
    KeypadState* response) {

    response->set_pressed_mask(machine_.state().keypad.pressed_mask());
    return grpc::Status::OK;
}

} // namespace chipium::service
