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

#ifndef CHIPIUM_SERVICE_DEBUGGER_SERVICE_HPP
#define CHIPIUM_SERVICE_DEBUGGER_SERVICE_HPP

#include "debugger.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <mutex>
#include <vector>

namespace chipium {

class Machine;

namespace service {

/// Internal breakpoint representation
struct BreakpointEntry {
    uint32_t id;
    uint32_t address;
};

/// gRPC service implementation for DebuggerControl
class DebuggerControlServiceImpl final : public DebuggerControl::Service {
public:
    explicit DebuggerControlServiceImpl(Machine& machine);
    ~DebuggerControlServiceImpl() override;

    // Non-copyable
    DebuggerControlServiceImpl(const DebuggerControlServiceImpl&) = delete;
    DebuggerControlServiceImpl& operator=(const DebuggerControlServiceImpl&) = delete;

    // Execution control
    grpc::Status GetState(
        grpc::ServerContext* context,
        const Empty* request,
        ExecutionState* response) override;

    grpc::Status Run(
        grpc::ServerContext* context,
        const Empty* request,
        RunResponse* response) override;

    grpc::Status Stop(
        grpc::ServerContext* context,
        const Empty* request,
        StopResponse* response) override;

    grpc::Status Reset(
        grpc::ServerContext* context,
        const Empty* request,
        ResetResponse* response) override;

    grpc::Status StepInstruction(
        grpc::ServerContext* context,
        const StepRequest* request,
        StepResponse* response) override;

    // Memory access
    grpc::Status ReadMemory(
        grpc::ServerContext* context,
        const ReadMemoryRequest* request,
        ReadMemoryResponse* response) override;

    grpc::Status WriteMemory(
        grpc::ServerContext* context,
        const WriteMemoryRequest* request,
        WriteMemoryResponse* response) override;

    // Breakpoints
    grpc::Status AddBreakpoint(
        grpc::ServerContext* context,
        const AddBreakpointRequest* request,
        AddBreakpointResponse* response) override;

    grpc::Status RemoveBreakpoint(
        grpc::ServerContext* context,
        const RemoveBreakpointRequest* request,
        RemoveBreakpointResponse* response) override;

    grpc::Status ListBreakpoints(
        grpc::ServerContext* context,
        const Empty* request,
        ListBreakpointsResponse* response) override;

    grpc::Status ClearBreakpoints(
        grpc::ServerContext* context,
        const Empty* request,
        ClearBreakpointsResponse* response) override;

    // Disassembly
    grpc::Status Disassemble(
        grpc::ServerContext* context,
        const DisassembleRequest* request,
        DisassembleResponse* response) override;

private:
    void fill_execution_state(ExecutionState* state);
    bool check_breakpoints(uint16_t pc);

    Machine& machine_;
    std::mutex mutex_;

    // Guarded separately: the emulation thread checks breakpoints
    // before every instruction
    std::mutex breakpoint_mutex_;
    std::vector<BreakpointEntry> breakpoints_;
    std::atomic<uint32_t> next_breakpoint_id_{1};
};

/// gRPC service implementation for DebuggerChip8
class DebuggerChip8ServiceImpl final : public DebuggerChip8::Service {
public:
    explicit DebuggerChip8ServiceImpl(Machine& machine);
    ~DebuggerChip8ServiceImpl() override;

    // Non-copyable
    DebuggerChip8ServiceImpl(const DebuggerChip8ServiceImpl&) = delete;
    DebuggerChip8ServiceImpl& operator=(const DebuggerChip8ServiceImpl&) = delete;

    grpc::Status ReadRegisters(
        grpc::ServerContext* context,
        const Empty* request,
        RegistersChip8* response) override;

    grpc::Status WriteRegisters(
        grpc::ServerContext* context,
        const WriteRegistersChip8Request* request,
        WriteRegistersResponse* response) override;

private:
    Machine& machine_;
    std::mutex mutex_;
};

} // namespace service
} // namespace chipium

#endif // CHIPIUM_SERVICE_DEBUGGER_SERVICE_HPP
