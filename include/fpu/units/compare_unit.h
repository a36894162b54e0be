#pragma once

#include "fpu/fpu_op.h"
#include "fpu/fp_flags.h"
#include "fpu/unpack.h"

namespace rvfpu {

/**
 * 比较单元：FEQ/FLT/FLE（整数结果）与 FMIN/FMAX（浮点结果）
 */
class CompareUnit {
public:
    static UnitResult compare(FpuOp op, const UnpackedOperand& a, const UnpackedOperand& b);
    static UnitResult minMax(FpuOp op, FpFormat fmt,
                             const UnpackedOperand& a, const UnpackedOperand& b);

    // 以下不处理 NaN
    static bool equal(const UnpackedOperand& a, const UnpackedOperand& b);
    static bool lessThan(const UnpackedOperand& a, const UnpackedOperand& b);
};

} // namespace rvfpu
