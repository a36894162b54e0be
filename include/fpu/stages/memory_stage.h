#pragma once

#include "fpu/stages/pipeline_stage.h"

namespace rvfpu {

/**
 * 访存阶段
 * 完成融合乘加和加法/转换的第二级，选出单周期单元的结果，输出存储数据
 */
class MemoryStage : public PipelineStage {
public:
    MemoryStage() = default;

    void execute(FpuState& state) override;
    void flush(FpuState& state) override;
    void reset() override {}
    const char* get_stage_name() const override { return "MEMORY"; }
};

} // namespace rvfpu
