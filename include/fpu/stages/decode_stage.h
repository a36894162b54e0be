#pragma once

#include "fpu/stages/pipeline_stage.h"

namespace rvfpu {

/**
 * 译码阶段
 * 接收外部指令，产生控制标签并读寄存器堆（在同周期写回之后读）
 */
class DecodeStage : public PipelineStage {
public:
    DecodeStage() = default;

    void execute(FpuState& state) override;
    void flush(FpuState& state) override;
    void reset() override { drop_incoming_ = false; }
    const char* get_stage_name() const override { return "DECODE"; }

private:
    void refreshHeldOperands(FpuState& state);

    bool drop_incoming_ = false;
};

} // namespace rvfpu
