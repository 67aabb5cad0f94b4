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

#ifndef CHIPIUM_SERVICE_AUDIO_SERVICE_HPP
#define CHIPIUM_SERVICE_AUDIO_SERVICE_HPP

#include "audio.grpc.pb.h"
#include <grpcpp/grpcpp.h>

namespace chipium {

class Machine;

namespace service {

/// gRPC service implementation for sound timer polling.
/// Clients generate the tone themselves while tone_active is set.
class AudioServiceImpl final : public AudioService::Service {
public:
    explicit AudioServiceImpl(const Machine& machine);
    ~AudioServiceImpl() override;

    // Non-copyable
    AudioServiceImpl(const AudioServiceImpl&) = delete;
    AudioServiceImpl& operator=(const AudioServiceImpl&) = delete;

    grpc::Status GetState(
        grpc::ServerContext* context,
        const GetAudioStateRequest* request,
        AudioState* response) override;

private:
    const Machine& machine_;
};

} // namespace service
} // namespace chipium

#endif // CHIPIUM_SERVICE_AUDIO_SERVICE_HPP
