#pragma once

#include "core/decoder.h"
#include "fpu/units/add_convert_unit.h"
#include "fpu/units/fma_unit.h"
#include <array>

namespace rvfpu {

/**
 * 级间锁存器：advance 写入新内容，hold 保持，clear 清为空泡
 * 只由前一级写、后一级读
 */
template <typename T>
class PipelineSlot {
public:
    bool valid() const { return valid_; }
    bool empty() const { return !valid_; }

    const T& get() const { return data_; }
    T& get() { return data_; }

    void advance(const T& data) {
        data_ = data;
        valid_ = true;
    }

    void hold() {}

    void clear() {
        data_ = T{};
        valid_ = false;
    }

private:
    T data_{};
    bool valid_ = false;
};

// 译码 -> 执行
struct DecodeExecuteLatch {
    DecodedInstruction inst;
    std::array<RegValue, 3> operands{};
    uint64_t int_operand = 0;
    uint64_t sequence = 0;
};

// 执行 -> 访存
struct ExecuteMemoryLatch {
    ControlTags tags;
    RegNum rd = 0;
    uint64_t sequence = 0;

    FmaStage1 fma;
    AddConvertStage1 add_convert;
    UnitResult divsqrt;

    // 单周期单元在执行级算出，访存级选择
    UnitResult convert;
    UnitResult sign_inject;
    UnitResult compare;
    UnitResult classify;
    UnitResult int_passthrough;
    UnitResult move_to_int;

    uint64_t store_data = 0;
};

// 访存 -> 写回
struct MemoryWritebackLatch {
    ControlTags tags;
    RegNum rd = 0;
    uint64_t sequence = 0;

    UnitResult fma;
    UnitResult add_convert;
    UnitResult divsqrt;
    UnitResult memory_stage;
};

/**
 * 写回级结果选择；load_data 仅对加载指令有意义
 */
UnitResult selectWritebackResult(const MemoryWritebackLatch& latch, uint64_t load_data);

/**
 * 访存级结果选择
 */
UnitResult selectMemoryStageResult(const ExecuteMemoryLatch& latch);

} // namespace rvfpu
