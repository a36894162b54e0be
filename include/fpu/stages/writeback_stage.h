#pragma once

#include "fpu/stages/pipeline_stage.h"

namespace rvfpu {

/**
 * 写回阶段
 * 按 ResultSource 选出最终结果，写浮点寄存器堆或整数写端口，报告 fflags
 */
class WritebackStage : public PipelineStage {
public:
    WritebackStage() = default;

    void execute(FpuState& state) override;
    void flush(FpuState& state) override;
    void reset() override {}
    const char* get_stage_name() const override { return "WRITEBACK"; }
};

} // namespace rvfpu
