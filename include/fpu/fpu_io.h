#pragma once

#include "common/types.h"
#include <array>

namespace rvfpu {

/**
 * 外部整数流水线每个周期提供的输入
 */
struct FpuInputs {
    bool instruction_valid = false;
    Instruction instruction = 0;
    uint8_t frm = 0;                // 全局舍入模式
    uint64_t int_operand = 0;       // 整数 rs1，随指令一起进入译码级
    uint64_t load_data = 0;         // 写回级浮点加载的数据
    std::array<bool, NUM_PIPELINE_STAGES> stall{};
    std::array<bool, NUM_PIPELINE_STAGES> flush{};

    void setStall(PipelineStageId stage, bool value = true) {
        stall[static_cast<std::size_t>(stage)] = value;
    }
    void setFlush(PipelineStageId stage, bool value = true) {
        flush[static_cast<std::size_t>(stage)] = value;
    }
    bool stalled(PipelineStageId stage) const { return stall[static_cast<std::size_t>(stage)]; }
    bool flushed(PipelineStageId stage) const { return flush[static_cast<std::size_t>(stage)]; }
};

struct RegisterWrite {
    bool enable = false;
    RegNum rd = 0;
    uint64_t data = 0;
};

/**
 * 每个周期输出给外部整数流水线的信号
 */
struct FpuOutputs {
    bool stall_decode = false;
    bool illegal_instruction = false;
    RegisterWrite int_write;
    RegisterWrite fp_write;

    bool store_valid = false;
    uint64_t store_data = 0;

    bool divsqrt_busy = false;

    bool fflags_valid = false;
    uint8_t fflags = 0;

    // 乘加单元与除法/开方单元出结果时直接上报，不经过写回级选择
    bool unit_fflags_valid = false;
    uint8_t unit_fflags = 0;

    bool retired = false;
    bool load_consumed = false;     // 写回级的加载指令用掉了 load_data

    void reportUnitFlags(uint8_t bits) {
        unit_fflags_valid = true;
        unit_fflags |= bits;
    }
};

} // namespace rvfpu
