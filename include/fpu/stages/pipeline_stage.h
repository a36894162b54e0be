#pragma once

#include "common/types.h"

namespace rvfpu {

// 前向声明
struct FpuState;

/**
 * 流水线阶段基础接口
 * 所有流水线阶段都必须实现这个接口
 */
class PipelineStage {
public:
    virtual ~PipelineStage() = default;

    /**
     * 执行该阶段一个周期的逻辑
     * @param state FPU共享状态
     */
    virtual void execute(FpuState& state) = 0;

    /**
     * 冲刷该阶段正在处理的指令（清除其输入锁存器）
     */
    virtual void flush(FpuState& state) = 0;

    /**
     * 重置该阶段到初始状态
     */
    virtual void reset() = 0;

    /**
     * 获取该阶段的名称（用于调试）
     */
    virtual const char* get_stage_name() const = 0;
};

} // namespace rvfpu
