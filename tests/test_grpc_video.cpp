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

// Test gRPC VideoService and AudioService
//
// These tests verify the video and audio service implementations by acting as
// gRPC clients against a local server.

#include <catch2/catch_test_macros.hpp>

#include "chipium/Machine.hpp"
#include "chipium/service/Server.hpp"

#include "audio.grpc.pb.h"
#include "video.grpc.pb.h"
#include <grpcpp/grpcpp.h>

#include <array>
#include <chrono>

namespace {

// Test fixture that sets up a machine and server
class VideoTestFixture {
public:
    VideoTestFixture() : machine_(1) {
        server_ = std::make_unique<chipium::service::Server>(machine_, "127.0.0.1", 50210);
        server_->start();

        channel_ = grpc::CreateChannel("127.0.0.1:50210",
                                       grpc::InsecureChannelCredentials());
        video_stub_ = chipium::VideoService::NewStub(channel_);
        audio_stub_ = chipium::AudioService::NewStub(channel_);
    }

    ~VideoTestFixture() {
        server_->stop();
    }

    chipium::Machine& machine() { return machine_; }
    chipium::VideoService::Stub& video() { return *video_stub_; }
    chipium::AudioService::Stub& audio() { return *audio_stub_; }

private:
    chipium::Machine machine_;
    std::unique_ptr<chipium::service::Server> server_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<chipium::VideoService::Stub> video_stub_;
    std::unique_ptr<chipium::AudioService::Stub> audio_stub_;
};

} // anonymous namespace

TEST_CASE("VideoService GetConfig returns display geometry", "[grpc][video]") {
    VideoTestFixture fixture;

    grpc::ClientContext context;
    chipium::GetConfigRequest request;
    chipium::VideoConfig config;

    auto status = fixture.video().GetConfig(&context, request, &config);

    REQUIRE(status.ok());
    CHECK(config.width() == 64);
    CHECK(config.height() == 32);
    CHECK(config.bytes_per_pixel() == 3);
    CHECK(config.framerate_hz() == 60);
}

TEST_CASE("VideoService SubscribeFrames streams the published frame", "[grpc][video]") {
    VideoTestFixture fixture;

    // 0x200: LD I, 0x000 (glyph 0)
    // 0x202: DRW V0, V0, 5
    const std::array<uint8_t, 4> image = {0xA0, 0x00, 0xD0, 0x05};
    fixture.machine().load_image(image);
    fixture.machine().step();
    fixture.machine().step();

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
    chipium::SubscribeFramesRequest request;
    auto reader = fixture.video().SubscribeFrames(&context, request);

    chipium::Frame frame;
    REQUIRE(reader->Read(&frame));

    CHECK(frame.frame_number() == fixture.machine().frame_buffer().version());
    CHECK(frame.width() == 64);
    CHECK(frame.height() == 32);
    REQUIRE(frame.pixels().size() == 6144);
    CHECK(static_cast<uint8_t>(frame.pixels()[0]) == 0xFF);
    CHECK(static_cast<uint8_t>(frame.pixels()[3 * 4]) == 0x00);

    context.TryCancel();
}

TEST_CASE("AudioService reports the sound timer", "[grpc][audio]") {
    VideoTestFixture fixture;

    SECTION("Silent at power-on") {
        grpc::ClientContext context;
        chipium::GetAudioStateRequest request;
        chipium::AudioState state;
        REQUIRE(fixture.audio().GetState(&context, request, &state).ok());
        CHECK(state.sound_timer() == 0);
        CHECK_FALSE(state.tone_active());
    }

    SECTION("Tone active while the timer runs") {
        // 0x200: LD V0, 0x10
        // 0x202: LD ST, V0
        const std::array<uint8_t, 4> image = {0x60, 0x10, 0xF0, 0x18};
        fixture.machine().load_image(image);
        fixture.machine().step();
        fixture.machine().step();

        grpc::ClientContext context;
        chipium::GetAudioStateRequest request;
        chipium::AudioState state;
        REQUIRE(fixture.audio().GetState(&context, request, &state).ok());
        CHECK(state.sound_timer() == 0x0F);
        CHECK(state.tone_active());
    }
}
