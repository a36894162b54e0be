#pragma once

#include "fpu/fpu_op.h"
#include "fpu/rounding.h"
#include "fpu/unpack.h"

namespace rvfpu {

/**
 * 融合乘加第一级输出（执行级 -> 访存级锁存）
 * 特殊值在第一级直接得出结果，否则携带对齐后的乘积与加数
 */
struct FmaStage1 {
    FpFormat format = FpFormat::DOUBLE;
    FPRoundingMode rm = FPRoundingMode::RNE;
    bool special = false;
    UnitResult special_result;
    bool product_sign = false;
    bool addend_sign = false;
    fparith::AlignedOperands aligned;
};

/**
 * 融合乘加单元（两级）
 * 覆盖 FMADD/FMSUB/FNMSUB/FNMADD/FMUL，结果只舍入一次
 */
class FmaUnit {
public:
    static FmaStage1 stage1(FpuOp op, FpFormat fmt, FPRoundingMode rm,
                            const UnpackedOperand& a, const UnpackedOperand& b,
                            const UnpackedOperand& c);

    static UnitResult stage2(const FmaStage1& partial);

    static UnitResult compute(FpuOp op, FpFormat fmt, FPRoundingMode rm,
                              const UnpackedOperand& a, const UnpackedOperand& b,
                              const UnpackedOperand& c) {
        return stage2(stage1(op, fmt, rm, a, b, c));
    }

    static bool isFmaOp(FpuOp op);
};

} // namespace rvfpu
