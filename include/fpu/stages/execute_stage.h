#pragma once

#include "fpu/stages/pipeline_stage.h"
#include "fpu/hazard_unit.h"
#include "fpu/pipeline_regs.h"
#include "fpu/unpack.h"

namespace rvfpu {

/**
 * 执行阶段
 * 解析前递、拆包操作数，启动各运算单元；除法/开方在此停顿直到结果就绪
 */
class ExecuteStage : public PipelineStage {
public:
    ExecuteStage() = default;

    void execute(FpuState& state) override;
    void flush(FpuState& state) override;
    void reset() override;
    const char* get_stage_name() const override { return "EXECUTE"; }

    bool divisionPending() const { return div_owner_valid_; }
    bool discardingDivision() const { return discard_division_; }

private:
    std::array<RegValue, 3> resolveOperands(const FpuState& state, const DecodeExecuteLatch& latch,
                                            const HazardDecision& decision) const;
    void retireDiscardedDivision(FpuState& state);
    // 除法/开方握手；返回 true 表示结果已取走可以前进
    bool handleDivSqrt(FpuState& state, const DecodeExecuteLatch& latch,
                       const std::array<RegValue, 3>& operands, ExecuteMemoryLatch& out);
    void computeUnits(const DecodeExecuteLatch& latch, const std::array<RegValue, 3>& operands,
                      ExecuteMemoryLatch& out) const;

    bool div_owner_valid_ = false;
    uint64_t div_owner_ = 0;
    bool discard_division_ = false;
};

} // namespace rvfpu
