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

#ifndef CHIPIUM_SERVICE_VIDEO_SERVICE_HPP
#define CHIPIUM_SERVICE_VIDEO_SERVICE_HPP

#include "video.grpc.pb.h"
#include <grpcpp/grpcpp.h>

#include <chrono>

namespace chipium {

class FrameBuffer;

namespace service {

/// gRPC service implementation for video frame streaming.
///
/// Each subscriber blocks on the frame buffer and receives one message per
/// presented frame. wait_interval bounds how long a cancelled subscription
/// can stay blocked.
class VideoServiceImpl final : public VideoService::Service {
public:
    explicit VideoServiceImpl(const FrameBuffer& frame_buffer,
                              std::chrono::milliseconds wait_interval = std::chrono::milliseconds(100));
    ~VideoServiceImpl() override;

    // Non-copyable
    VideoServiceImpl(const VideoServiceImpl&) = delete;
    VideoServiceImpl& operator=(const VideoServiceImpl&) = delete;

    grpc::Status SubscribeFrames(
        grpc::ServerContext* context,
        const SubscribeFramesRequest* request,
        grpc::ServerWriter<Frame>* writer) override;

    grpc::Status GetConfig(
        grpc::ServerContext* context,
        const GetConfigRequest* request,
        VideoConfig* response) override;

private:
    const FrameBuffer& frame_buffer_;
    std::chrono::milliseconds wait_interval_;
};

} // namespace service
} // namespace chipium

#endif // CHIPIUM_SERVICE_VIDEO_SERVICE_HPP
