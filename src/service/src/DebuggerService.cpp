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

#include "chipium/service/DebuggerService.hpp"
#include "chipium/Disassembler.hpp"
#include "chipium/Errors.hpp"
#include "chipium/Machine.hpp"

#include <algorithm>

namespace chipium::service {

//////////////////////////////////////////////////////////////////////////////
// DebuggerControlServiceImpl
//////////////////////////////////////////////////////////////////////////////

DebuggerControlServiceImpl::DebuggerControlServiceImpl(Machine& machine)
    : machine_(machine) {
    machine_.set_instruction_callback(
        [this](uint16_t pc, uint64_t /*instruction*/) -> bool {
            return !check_breakpoints(pc);
        }
    );
}

DebuggerControlServiceImpl::~DebuggerControlServiceImpl() {
    machine_.set_instruction_callback(nullptr);
}

bool DebuggerControlServiceImpl::check_breakpoints(uint16_t pc) {
    std::lock_guard<std::mutex> lock(breakpoint_mutex_);
    for (const auto& bp : breakpoints_) {
        if (bp.address == pc) {
            machine_.halt("breakpoint at " + hex_string(pc, 3));
            return true;
        }
    }
    return false;
}

void DebuggerControlServiceImpl::fill_execution_state(ExecutionState* state) {
    state->set_is_running(!machine_.is_paused());
    state->set_instruction_count(machine_.instruction_count());
    state->set_halt_reason(machine_.halt_reason());
    state->set_sequence(machine_.sequence());
    state->set_waiting_for_key(machine_.state().waiting_for_key);
}

grpc::Status DebuggerControlServiceImpl::GetState(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ExecutionState* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();
    fill_execution_state(response);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::Run(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    RunResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    if (!machine_.is_paused()) {
        response->set_success(false);
        response->set_error("already running");
        return grpc::Status::OK;
    }

    machine_.resume();
    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::Stop(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    StopResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    machine_.halt("stopped by debugger");

    // Wait for the emulation thread to finish its current batch
    auto execution = machine_.lock_execution();
    response->set_success(true);
    fill_execution_state(response->mutable_state());
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::Reset(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ResetResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();

    // Holding the execution lock, a halted machine cannot be mid-batch
    if (!machine_.is_paused()) {
        response->set_success(false);
        return grpc::Status::OK;
    }

    machine_.reset();
    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::StepInstruction(
    grpc::ServerContext* /*context*/,
    const StepRequest* request,
    StepResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();

    if (!machine_.is_paused()) {
        response->set_success(false);
        response->set_error("machine is running");
        return grpc::Status::OK;
    }

    uint32_t count = request->count();
    if (count == 0) count = 1;

    uint32_t instructions = 0;
    try {
        for (uint32_t i = 0; i < count; ++i) {
            machine_.step();
            ++instructions;
        }
        response->set_success(true);
    } catch (const MachineError& e) {
        machine_.halt(e.what());
        response->set_success(false);
        response->set_error(e.what());
    }

    response->set_instructions_executed(instructions);
    fill_execution_state(response->mutable_state());
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::ReadMemory(
    grpc::ServerContext* /*context*/,
    const ReadMemoryRequest* request,
    ReadMemoryResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();

    uint32_t address = request->address();
    uint32_t length = request->length();

    std::string data;
    data.reserve(std::min<uint32_t>(length, kMemorySize));

    for (uint32_t i = 0; i < length && (address + i) < kMemorySize; ++i) {
        data.push_back(static_cast<char>(
            machine_.peek(static_cast<uint16_t>(address + i))));
    }

    response->set_data(std::move(data));
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::WriteMemory(
    grpc::ServerContext* /*context*/,
    const WriteMemoryRequest* request,
    WriteMemoryResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();

    uint32_t address = request->address();
    const std::string& data = request->data();

    uint32_t written = 0;
    for (size_t i = 0; i < data.size() && (address + i) < kMemorySize; ++i) {
        machine_.poke(static_cast<uint16_t>(address + i), static_cast<uint8_t>(data[i]));
        ++written;
    }

    response->set_success(written == data.size());
    response->set_bytes_written(written);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::AddBreakpoint(
    grpc::ServerContext* /*context*/,
    const AddBreakpointRequest* request,
    AddBreakpointResponse* response) {

    std::lock_guard<std::mutex> lock(breakpoint_mutex_);

    uint32_t address = request->address();
    if (address >= kMemorySize) {
        response->set_success(false);
        return grpc::Status::OK;
    }

    uint32_t id = next_breakpoint_id_++;
    breakpoints_.push_back({id, address});

    response->set_success(true);
    response->set_id(id);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::RemoveBreakpoint(
    grpc::ServerContext* /*context*/,
    const RemoveBreakpointRequest* request,
    RemoveBreakpointResponse* response) {

    std::lock_guard<std::mutex> lock(breakpoint_mutex_);

    uint32_t id = request->id();
    auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(),
        [id](const BreakpointEntry& bp) { return bp.id == id; });

    if (it != breakpoints_.end()) {
        breakpoints_.erase(it);
        response->set_success(true);
    } else {
        response->set_success(false);
    }

    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::ListBreakpoints(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ListBreakpointsResponse* response) {

    std::lock_guard<std::mutex> lock(breakpoint_mutex_);

    for (const auto& bp : breakpoints_) {
        auto* pb_bp = response->add_breakpoints();
        pb_bp->set_id(bp.id);
        pb_bp->set_address(bp.address);
    }

    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::ClearBreakpoints(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ClearBreakpointsResponse* response) {

    std::lock_guard<std::mutex> lock(breakpoint_mutex_);

    uint32_t count = static_cast<uint32_t>(breakpoints_.size());
    breakpoints_.clear();

    response->set_count_removed(count);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::Disassemble(
    grpc::ServerContext* /*context*/,
    const DisassembleRequest* request,
    DisassembleResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();

    uint32_t address = request->address();
    uint32_t count = request->count();
    if (count == 0) count = 1;

    // Instructions are two bytes; stop at the last complete word
    for (uint32_t i = 0; i < count && address + 1 < kMemorySize; ++i, address += 2) {
        const uint16_t opcode = machine_.state().memory.read_word(address);
        auto* instruction = response->add_instructions();
        instruction->set_address(address);
        instruction->set_opcode(opcode);
        instruction->set_text(disassemble(opcode));
    }

    return grpc::Status::OK;
}

//////////////////////////////////////////////////////////////////////////////
// DebuggerChip8ServiceImpl
//////////////////////////////////////////////////////////////////////////////

DebuggerChip8ServiceImpl::DebuggerChip8ServiceImpl(Machine& machine)
    : machine_(machine) {
}

DebuggerChip8ServiceImpl::~DebuggerChip8ServiceImpl() = default;

grpc::Status DebuggerChip8ServiceImpl::ReadRegisters(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    RegistersChip8* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();

    for (uint8_t reg = 0; reg < kRegisterCount; ++reg) {
        response->add_v(machine_.v(reg));
    }
    response->set_i(machine_.i());
    response->set_pc(machine_.pc());
    response->set_sp(machine_.sp());
    for (uint8_t level = 0; level < machine_.sp(); ++level) {
        response->add_stack(machine_.state().stack[level]);
    }
    response->set_delay_timer(machine_.delay_timer());
    response->set_sound_timer(machine_.sound_timer());
    response->set_opcode(machine_.state().opcode);

    return grpc::Status::OK;
}

grpc::Status DebuggerChip8ServiceImpl::WriteRegisters(
    grpc::ServerContext* /*context*/,
    const WriteRegistersChip8Request* request,
    WriteRegistersResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto execution = machine_.lock_execution();

    // Validate everything before changing anything
    for (const auto& reg : request->v()) {
        if (reg.index() >= kRegisterCount) {
            response->set_success(false);
            return grpc::Status::OK;
        }
    }
    if ((request->has_i() && request->i() > 0xFFFF) ||
        (request->has_pc() && request->pc() >= kMemorySize)) {
        response->set_success(false);
        return grpc::Status::OK;
    }

    for (const auto& reg : request->v()) {
        machine_.set_v(static_cast<uint8_t>(reg.index()), static_cast<uint8_t>(reg.value()));
    }
    if (request->has_i()) {
        machine_.set_i(static_cast<uint16_t>(request->i()));
    }
    if (request->has_pc()) {
        machine_.set_pc(static_cast<uint16_t>(request->pc()));
    }
    if (request->has_delay_timer()) {
        machine_.set_delay_timer(static_cast<uint8_t>(request->delay_timer()));
    }
    if (request->has_sound_timer()) {
        machine_.set_sound_timer(static_cast<uint8_t>(request->sound_timer()));
    }

    response->set_success(true);
    return grpc::Status::OK;
}

} // namespace chipium::service
