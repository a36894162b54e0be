#pragma once

#include "fpu/fp_format.h"
#include "fpu/fpu_op.h"

namespace rvfpu {

// 写回级结果来源
enum class ResultSource : uint8_t {
    NONE,
    LOAD,
    FMA,
    ADD_CONVERT,
    DIV_SQRT,
    MEMORY_STAGE
};

// 访存级选择（在执行级/访存级就能完成的单元）
enum class MemStageSelect : uint8_t {
    NONE,
    CONVERT,
    SIGN_INJECT,
    COMPARE,
    CLASSIFY,
    INT_PASSTHROUGH,
    MOVE_TO_INT
};

/**
 * 控制标签：译码级产生，随指令流经各级，只会被冲刷清除
 */
struct ControlTags {
    FpuOp op = FpuOp::NONE;
    ResultSource result_source = ResultSource::NONE;
    MemStageSelect mem_select = MemStageSelect::NONE;
    FpFormat format = FpFormat::DOUBLE;
    FpFormat source_format = FpFormat::DOUBLE;  // FCVT.S.D / FCVT.D.S 的源格式
    IntConversion int_conversion = IntConversion::W;
    FPRoundingMode rm = FPRoundingMode::RNE;

    bool legal = true;
    bool fp_write = false;
    bool int_write = false;
    bool div_start = false;
    bool store = false;

    bool uses_rs1 = false;
    bool uses_rs2 = false;
    bool uses_rs3 = false;

    bool writesRegister() const { return fp_write || int_write; }
};

const char* resultSourceName(ResultSource source);
const char* memStageSelectName(MemStageSelect select);

} // namespace rvfpu
