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

#include "chipium/service/VideoService.hpp"
#include "chipium/FrameBuffer.hpp"
#include "chipium/Types.hpp"


namespace chipium::service {

VideoServiceImpl::VideoServiceImpl(const FrameBuffer& frame_buffer,
                                   std::chrono::milliseconds wait_interval)
    : frame_buffer_(frame_buffer)
    , wait_interval_(wait_interval) {
}

VideoServiceImpl::~VideoServiceImpl() = default;

grpc::Status VideoServiceImpl::SubscribeFrames(
    grpc::ServerContext* context,
    const SubscribeFramesRequest* /*request*/,
    grpc::ServerWriter<Frame>* writer) {

    uint64_t sent = 0;
    while (!context->IsCancelled()) {
        // The timeout only bounds how long a cancelled stream goes unnoticed.
        const uint64_t version = frame_buffer_.wait_for_new_frame(sent, wait_interval_);
        if (version == sent) {
            continue;
        }

        Frame frame;
        frame.set_frame_number(version);
        frame.set_width(static_cast<uint32_t>(frame_buffer_.width()));
        frame.set_height(static_cast<uint32_t>(frame_buffer_.height()));
        const auto pixels = frame_buffer_.snapshot();
        frame.set_pixels(pixels.data(), pixels.size());

        if (!writer->Write(frame)) {
            break;
        }
        sent = version;
    }

    return grpc::Status::OK;
}

grpc::Status VideoServiceImpl::GetConfig(
    grpc::ServerContext* /*context*/,
    const GetConfigRequest* /*request*/,
    VideoConfig* response) {

    response->set_width(static_cast<uint32_t>(frame_buffer_.width()));
    response->set_height(static_cast<uint32_t>(frame_buffer_.height()));
    response->set_bytes_per_pixel(static_cast<uint32_t>(kBytesPerPixel));
    response->set_framerate_hz(kFrameRateHz);

    return grpc::Status::OK;
}

} // namespace chipium::service
