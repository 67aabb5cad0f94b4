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

// Test gRPC KeypadService
//
// These tests verify the KeypadService implementation by acting as a gRPC client.
// They create a local server, connect to it, and verify keypad input works correctly.

#include <catch2/catch_test_macros.hpp>

#include "chipium/Machine.hpp"
#include "chipium/service/Server.hpp"

#include "keypad.grpc.pb.h"
#include <grpcpp/grpcpp.h>

#include <array>

namespace {

// Test fixture that sets up a machine and server
class KeypadTestFixture {
public:
    KeypadTestFixture() : machine_(1) {
        server_ = std::make_unique<chipium::service::Server>(machine_, "127.0.0.1", 50211);
        server_->start();

        channel_ = grpc::CreateChannel("127.0.0.1:50211",
                                       grpc::InsecureChannelCredentials());
        stub_ = chipium::KeypadService::NewStub(channel_);
    }

    ~KeypadTestFixture() {
        server_->stop();
    }

    chipium::Machine& machine() { return machine_; }
    chipium::KeypadService::Stub& stub() { return *stub_; }

    chipium::KeyResponse key(bool down, uint32_t host_key) {
        grpc::ClientContext context;
        chipium::KeyRequest request;
        request.set_key(host_key);
        chipium::KeyResponse response;
        auto status = down ? stub().KeyDown(&context, request, &response)
                           : stub().KeyUp(&context, request, &response);
        REQUIRE(status.ok());
        return response;
    }

    chipium::KeyResponse slot(bool down, uint32_t index) {
        grpc::ClientContext context;
        chipium::SlotRequest request;
        request.set_slot(index);
        chipium::KeyResponse response;
        auto status = down ? stub().PressSlot(&context, request, &response)
                           : stub().ReleaseSlot(&context, request, &response);
        REQUIRE(status.ok());
        return response;
    }

private:
    chipium::Machine machine_;
    std::unique_ptr<chipium::service::Server> server_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<chipium::KeypadService::Stub> stub_;
};

} // anonymous namespace

TEST_CASE("KeypadService KeyDown maps host keys to slots", "[grpc][keypad]") {
    KeypadTestFixture fixture;

    auto response = fixture.key(true, 'Z');

    CHECK(response.accepted());
    CHECK(response.slot() == 0xA);
    CHECK(fixture.machine().state().keypad.is_pressed(0xA));
}

TEST_CASE("KeypadService KeyUp clears the slot", "[grpc][keypad]") {
    KeypadTestFixture fixture;

    fixture.key(true, 'w');
    CHECK(fixture.machine().state().keypad.is_pressed(0x5));

    auto response = fixture.key(false, 'W');
    CHECK(response.accepted());
    CHECK_FALSE(fixture.machine().state().keypad.is_pressed(0x5));
}

TEST_CASE("KeypadService rejects unmapped host keys", "[grpc][keypad]") {
    KeypadTestFixture fixture;

    auto response = fixture.key(true, 'P');

    CHECK_FALSE(response.accepted());
    CHECK(fixture.machine().state().keypad.pressed_mask() == 0);
}

TEST_CASE("KeypadService slot events", "[grpc][keypad]") {
    KeypadTestFixture fixture;

    SECTION("Press and release a slot") {
        CHECK(fixture.slot(true, 0xF).accepted());
        CHECK(fixture.machine().state().keypad.is_pressed(0xF));

        CHECK(fixture.slot(false, 0xF).accepted());
        CHECK_FALSE(fixture.machine().state().keypad.is_pressed(0xF));
    }

    SECTION("Slots past 15 are rejected") {
        CHECK_FALSE(fixture.slot(true, 16).accepted());
        CHECK(fixture.machine().state().keypad.pressed_mask() == 0);
    }
}

TEST_CASE("KeypadService GetState reports pressed slots", "[grpc][keypad]") {
    KeypadTestFixture fixture;

    fixture.key(true, '1');
    fixture.slot(true, 0x0);

    grpc::ClientContext context;
    chipium::GetStateRequest request;
    chipium::KeypadState state;
    REQUIRE(fixture.stub().GetState(&context, request, &state).ok());

    CHECK(state.pressed_mask() == ((1u << 0x1) | (1u << 0x0)));
}

TEST_CASE("KeypadService input reaches a waiting program", "[grpc][keypad]") {
    KeypadTestFixture fixture;

    // 0x200: LD V3, K
    const std::array<uint8_t, 2> image = {0xF3, 0x0A};
    fixture.machine().load_image(image);

    fixture.machine().step();
    REQUIRE(fixture.machine().pc() == 0x200);

    fixture.key(true, 'C');
    fixture.machine().step();

    CHECK(fixture.machine().pc() == 0x202);
    CHECK(fixture.machine().v(3) == 0xB);
}
