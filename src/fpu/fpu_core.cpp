#include "fpu/fpu_core.h"
#include "common/debug_types.h"
#include <iostream>

namespace rvfpu {

namespace {

const FpuConfig& validated(const FpuConfig& config) {
    config.validate();
    return config;
}

} // namespace

FpuCore::FpuCore(const FpuConfig& config)
    : state_(validated(config)),
      decode_stage_(std::make_unique<DecodeStage>()),
      execute_stage_(std::make_unique<ExecuteStage>()),
      memory_stage_(std::make_unique<MemoryStage>()),
      writeback_stage_(std::make_unique<WritebackStage>()) {
    dprintf(SYSTEM, "FPU 初始化完成: 扩展=0x%x 除法每周期 %u 位", config.enabled_extensions,
            config.divsqrt_bits_per_tick);
}

FpuCore::~FpuCore() = default;

FpuOutputs FpuCore::step(const FpuInputs& inputs) {
    ++state_.cycle;
    DebugManager::getInstance().setGlobalCycle(state_.cycle);

    state_.beginCycle();
    state_.inputs = inputs;

    applyFlushes();

    // 反向顺序执行，保证每一级先读走输入锁存器再被上游覆盖
    writeback_stage_->execute(state_);
    memory_stage_->execute(state_);
    execute_stage_->execute(state_);
    decode_stage_->execute(state_);

    state_.outputs.divsqrt_busy = !state_.divsqrt.idle();
    if (state_.outputs.stall_decode && inputs.instruction_valid) {
        ++state_.stall_cycles;
    }
    return state_.outputs;
}

void FpuCore::applyFlushes() {
    const FpuInputs& inputs = state_.inputs;
    if (inputs.flushed(PipelineStageId::WRITEBACK)) {
        writeback_stage_->flush(state_);
    }
    if (inputs.flushed(PipelineStageId::MEMORY)) {
        memory_stage_->flush(state_);
    }
    if (inputs.flushed(PipelineStageId::EXECUTE)) {
        execute_stage_->flush(state_);
    }
    if (inputs.flushed(PipelineStageId::DECODE)) {
        decode_stage_->flush(state_);
    }
}

void FpuCore::reset() {
    state_.registers.reset();
    state_.divsqrt.reset();
    state_.decode_execute.clear();
    state_.execute_memory.clear();
    state_.memory_writeback.clear();
    state_.beginCycle();
    state_.inputs = FpuInputs{};
    state_.cycle = 0;
    state_.next_sequence = 0;
    state_.retired_count = 0;
    state_.stall_cycles = 0;

    decode_stage_->reset();
    execute_stage_->reset();
    memory_stage_->reset();
    writeback_stage_->reset();
    DebugManager::getInstance().clearGlobalContext();
}

bool FpuCore::pipelineEmpty() const {
    return state_.decode_execute.empty() && state_.execute_memory.empty() &&
           state_.memory_writeback.empty() && state_.divsqrt.idle();
}

void FpuCore::dumpPipelineState() const {
    auto describe = [](bool valid, uint64_t sequence, FpuOp op) {
        return valid ? fmt::format("#{} {}", sequence, opName(op)) : std::string("-");
    };
    std::cout << "=== 流水线状态 (周期 " << state_.cycle << ") ===" << std::endl;
    const auto& de = state_.decode_execute;
    const auto& em = state_.execute_memory;
    const auto& mw = state_.memory_writeback;
    std::cout << "  EX : " << describe(de.valid(), de.get().sequence, de.get().inst.tags.op) << std::endl;
    std::cout << "  MEM: " << describe(em.valid(), em.get().sequence, em.get().tags.op) << std::endl;
    std::cout << "  WB : " << describe(mw.valid(), mw.get().sequence, mw.get().tags.op) << std::endl;
    std::cout << "  除法单元: " << (state_.divsqrt.busy() ? "BUSY" : state_.divsqrt.done() ? "DONE" : "IDLE")
              << std::endl;
}

} // namespace rvfpu
