#pragma once

#include "fpu/fpu_state.h"
#include "fpu/stages/decode_stage.h"
#include "fpu/stages/execute_stage.h"
#include "fpu/stages/memory_stage.h"
#include "fpu/stages/writeback_stage.h"
#include <memory>

namespace rvfpu {

/**
 * 四级流水线浮点单元
 * 每次 step() 是一个时钟周期：先处理冲刷，再按 写回 -> 访存 -> 执行 -> 译码 的顺序执行
 */
class FpuCore {
public:
    explicit FpuCore(const FpuConfig& config = FpuConfig{});
    ~FpuCore();

    FpuCore(const FpuCore&) = delete;
    FpuCore& operator=(const FpuCore&) = delete;

    FpuOutputs step(const FpuInputs& inputs);
    void reset();

    // 流水线中没有在飞指令且除法单元空闲
    bool pipelineEmpty() const;

    FpRegisterFile& registers() { return state_.registers; }
    const FpRegisterFile& registers() const { return state_.registers; }
    const FpuConfig& config() const { return state_.config; }
    const DivSqrtUnit& divSqrtUnit() const { return state_.divsqrt; }

    uint64_t getCycleCount() const { return state_.cycle; }
    uint64_t getRetiredCount() const { return state_.retired_count; }
    uint64_t getStallCycles() const { return state_.stall_cycles; }

    void dumpPipelineState() const;

private:
    void applyFlushes();

    FpuState state_;
    std::unique_ptr<DecodeStage> decode_stage_;         // 译码阶段
    std::unique_ptr<ExecuteStage> execute_stage_;       // 执行阶段
    std::unique_ptr<MemoryStage> memory_stage_;         // 访存阶段
    std::unique_ptr<WritebackStage> writeback_stage_;   // 写回阶段
};

} // namespace rvfpu
