#pragma once

#include "core/decoder.h"
#include "fpu/fpu_config.h"
#include "fpu/fpu_io.h"
#include "fpu/hazard_unit.h"
#include "fpu/pipeline_regs.h"
#include "fpu/register_file.h"
#include "fpu/units/divsqrt_unit.h"

namespace rvfpu {

/**
 * 本周期某一级可前递的结果
 */
struct ForwardRecord {
    HazardProducer producer;
    RegValue value = 0;
};

/**
 * 流水线共享状态，各阶段按 写回 -> 访存 -> 执行 -> 译码 顺序读写
 */
struct FpuState {
    explicit FpuState(const FpuConfig& cfg)
        : config(cfg),
          decoder(cfg.enabled_extensions),
          divsqrt(cfg.divsqrt_bits_per_tick) {}

    FpuConfig config;
    Decoder decoder;
    FpRegisterFile registers;
    DivSqrtUnit divsqrt;

    PipelineSlot<DecodeExecuteLatch> decode_execute;
    PipelineSlot<ExecuteMemoryLatch> execute_memory;
    PipelineSlot<MemoryWritebackLatch> memory_writeback;

    // 当前周期的输入输出
    FpuInputs inputs;
    FpuOutputs outputs;

    // 当前周期各级状态，由各阶段填写
    ForwardRecord memory_forward;
    ForwardRecord writeback_forward;
    bool writeback_stalled = false;
    bool memory_stalled = false;
    bool execute_stalled = false;
    bool decode_stalled = false;

    uint64_t cycle = 0;
    uint64_t next_sequence = 0;
    uint64_t retired_count = 0;
    uint64_t stall_cycles = 0;

    void beginCycle() {
        memory_forward = ForwardRecord{};
        writeback_forward = ForwardRecord{};
        writeback_stalled = false;
        memory_stalled = false;
        execute_stalled = false;
        decode_stalled = false;
        outputs = FpuOutputs{};
    }
};

} // namespace rvfpu
