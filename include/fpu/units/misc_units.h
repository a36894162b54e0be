#pragma once

#include "fpu/fpu_op.h"
#include "fpu/fp_flags.h"
#include "fpu/unpack.h"

namespace rvfpu {

/**
 * 符号注入：结果取 a 的幅值，符号来自 b（取反或异或）
 */
class SignInjectUnit {
public:
    static UnitResult inject(FpuOp op, FpFormat fmt,
                             const UnpackedOperand& a, const UnpackedOperand& b);
};

/**
 * FCLASS 十位分类掩码
 */
class ClassifyUnit {
public:
    static constexpr uint64_t NEG_INF       = 1u << 0;
    static constexpr uint64_t NEG_NORMAL    = 1u << 1;
    static constexpr uint64_t NEG_SUBNORMAL = 1u << 2;
    static constexpr uint64_t NEG_ZERO      = 1u << 3;
    static constexpr uint64_t POS_ZERO      = 1u << 4;
    static constexpr uint64_t POS_SUBNORMAL = 1u << 5;
    static constexpr uint64_t POS_NORMAL    = 1u << 6;
    static constexpr uint64_t POS_INF       = 1u << 7;
    static constexpr uint64_t SIGNALING_NAN = 1u << 8;
    static constexpr uint64_t QUIET_NAN     = 1u << 9;

    static UnitResult classify(const UnpackedOperand& a);
};

/**
 * 浮点与整数之间的转换和位模式搬运
 */
class ConvertUnit {
public:
    // FCVT.{W,WU,L,LU}.{S,D}；32位结果符号扩展到64位
    static UnitResult toInteger(IntConversion kind, FPRoundingMode rm, const UnpackedOperand& a);

    // FCVT.{S,D}.{W,WU,L,LU}
    static UnitResult fromInteger(IntConversion kind, FpFormat fmt, FPRoundingMode rm,
                                  uint64_t int_value);

    // FMV.X.W / FMV.X.D：原样搬运位模式，单精度取低32位再符号扩展
    static UnitResult moveToInteger(FpFormat fmt, RegValue stored);

    // FMV.W.X / FMV.D.X
    static UnitResult moveFromInteger(FpFormat fmt, uint64_t int_value);
};

} // namespace rvfpu
