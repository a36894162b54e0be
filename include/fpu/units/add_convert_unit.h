#pragma once

#include "fpu/fpu_op.h"
#include "fpu/rounding.h"
#include "fpu/unpack.h"

namespace rvfpu {

/**
 * 加法/格式转换第一级输出
 * format 为目标格式；格式转换时 second 恒为零
 */
struct AddConvertStage1 {
    FpFormat format = FpFormat::DOUBLE;
    FPRoundingMode rm = FPRoundingMode::RNE;
    bool special = false;
    UnitResult special_result;
    bool first_sign = false;
    bool second_sign = false;
    fparith::AlignedOperands aligned;
};

/**
 * 两级加法单元，同时承担 FCVT.S.D / FCVT.D.S
 */
class AddConvertUnit {
public:
    // FADD / FSUB
    static AddConvertStage1 stage1Add(FpuOp op, FpFormat fmt, FPRoundingMode rm,
                                      const UnpackedOperand& a, const UnpackedOperand& b);

    // 浮点格式转换，source 按源格式拆包
    static AddConvertStage1 stage1Convert(FpFormat target, FPRoundingMode rm,
                                          const UnpackedOperand& source);

    static UnitResult stage2(const AddConvertStage1& partial);

    static UnitResult add(FpuOp op, FpFormat fmt, FPRoundingMode rm,
                          const UnpackedOperand& a, const UnpackedOperand& b) {
        return stage2(stage1Add(op, fmt, rm, a, b));
    }

    static UnitResult convert(FpFormat target, FPRoundingMode rm, const UnpackedOperand& source) {
        return stage2(stage1Convert(target, rm, source));
    }
};

} // namespace rvfpu
