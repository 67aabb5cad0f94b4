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

#include "chipium/service/AudioService.hpp"
#include "chipium/Machine.hpp"

namespace chipium::service {

AudioServiceImpl::AudioServiceImpl(const Machine& machine)
    : machine_(machine) {
}

AudioServiceImpl::~AudioServiceImpl() = default;

grpc::Status AudioServiceImpl::GetState(
    grpc::ServerContext* /*context*/,
    const GetAudioStateRequest* /*request*/,
    AudioState* response) {

    const uint8_t timer = machine_.published_sound_timer();
    response->set_sound_timer(timer);
    response->set_tone_active(timer > 0);

    return grpc::Status::OK;
}

} // namespace chipium::service
