#include "system/simulator.h"
#include "common/debug_types.h"
#include <iostream>
#include <iomanip>

namespace rvfpu {

namespace {

bool isLoadInstruction(Instruction instruction) {
    return static_cast<Opcode>(instruction & 0x7F) == Opcode::LOAD_FP;
}

} // namespace

Simulator::Simulator(const FpuConfig& config) : core_(config) {}

void Simulator::loadTrace(const TraceProgram& program) {
    entries_ = program.entries();
    next_entry_ = 0;
    pending_loads_.clear();
    commits_.clear();
    stores_.clear();
    illegal_count_ = 0;
    halted_by_cycle_limit_ = false;
    dprintf(SYSTEM, "载入指令序列 %s: %zu 项, %zu 条指令", program.name().c_str(),
            entries_.size(), program.instructionCount());
}

void Simulator::step() {
    // 先处理到下一条指令之前的所有指示符
    while (next_entry_ < entries_.size() &&
           entries_[next_entry_].kind != TraceEntry::Kind::INSTRUCTION) {
        const TraceEntry& entry = entries_[next_entry_];
        if (entry.kind == TraceEntry::Kind::SET_FRM) {
            csr::write(csr_, csr::kFrm, entry.frm);
        } else {
            core_.registers().write(entry.reg, entry.value);
        }
        ++next_entry_;
    }

    FpuInputs inputs;
    inputs.frm = static_cast<uint8_t>(csr::read(csr_, csr::kFrm));
    inputs.load_data = pending_loads_.empty() ? 0 : pending_loads_.front();

    const TraceEntry* issuing = nullptr;
    if (next_entry_ < entries_.size()) {
        issuing = &entries_[next_entry_];
        inputs.instruction_valid = true;
        inputs.instruction = issuing->instruction;
        inputs.int_operand = issuing->int_operand;
    }

    const FpuOutputs outputs = core_.step(inputs);

    if (outputs.load_consumed && !pending_loads_.empty()) {
        pending_loads_.pop_front();
    }

    if (issuing != nullptr && !outputs.stall_decode) {
        if (outputs.illegal_instruction) {
            ++illegal_count_;
            std::cerr << "警告: 第 " << issuing->line << " 行指令 0x" << std::hex
                      << issuing->instruction << std::dec << " 非法，已跳过\n";
        } else if (isLoadInstruction(issuing->instruction)) {
            pending_loads_.push_back(issuing->load_data);
        }
        ++next_entry_;
    }

    if (outputs.store_valid) {
        stores_.push_back(outputs.store_data);
    }

    if (outputs.retired && (outputs.fp_write.enable || outputs.int_write.enable)) {
        CommitRecord record;
        record.cycle = core_.getCycleCount();
        record.fp_write = outputs.fp_write.enable;
        record.int_write = outputs.int_write.enable;
        record.rd = outputs.fp_write.enable ? outputs.fp_write.rd : outputs.int_write.rd;
        record.value = outputs.fp_write.enable ? outputs.fp_write.data : outputs.int_write.data;
        record.fflags = outputs.fflags_valid ? outputs.fflags : 0;
        commits_.push_back(record);
    }
    if (outputs.fflags_valid) {
        csr::accumulateFflags(csr_, outputs.fflags);
    }
    if (outputs.unit_fflags_valid) {
        csr::accumulateFflags(csr_, outputs.unit_fflags);
    }
}

bool Simulator::isFinished() const {
    return next_entry_ >= entries_.size() && core_.pipelineEmpty();
}

void Simulator::run(uint64_t max_cycles) {
    while (!isFinished()) {
        if (core_.getCycleCount() >= max_cycles) {
            halted_by_cycle_limit_ = true;
            std::cerr << "警告: 达到最大周期数 " << max_cycles << "，停止执行\n";
            break;
        }
        step();
    }
}

void Simulator::dumpRegisters() const {
    std::cout << "浮点寄存器状态:\n";
    for (RegNum reg = 0; reg < FpRegisterFile::NUM_REGISTERS; ++reg) {
        std::cout << "f" << std::setw(2) << std::setfill(' ') << std::dec << static_cast<int>(reg)
                  << ": 0x" << std::hex << std::setw(16) << std::setfill('0')
                  << core_.registers().read(reg) << std::dec << std::setfill(' ');
        std::cout << ((reg % 2 == 1) ? "\n" : "    ");
    }
    std::cout << "fcsr: 0x" << std::hex << csr::read(csr_, csr::kFcsr)
              << " (fflags=0x" << csr::read(csr_, csr::kFflags)
              << " frm=" << csr::read(csr_, csr::kFrm) << ")" << std::dec << "\n";
}

void Simulator::printStatistics() const {
    std::cout << "\n=== 统计信息 ===\n";
    std::cout << "周期数: " << core_.getCycleCount() << "\n";
    std::cout << "提交指令数: " << core_.getRetiredCount() << "\n";
    std::cout << "译码停顿周期: " << core_.getStallCycles() << "\n";
    std::cout << "非法指令数: " << illegal_count_ << "\n";
    if (core_.getCycleCount() > 0) {
        std::cout << "IPC: " << std::fixed << std::setprecision(3)
                  << static_cast<double>(core_.getRetiredCount()) / core_.getCycleCount() << "\n";
    }
}

} // namespace rvfpu
