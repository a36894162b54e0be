#pragma once

#include "common/types.h"
#include "fpu/fp_format.h"
#include "fpu/fp_flags.h"

namespace rvfpu::fparith {

/**
 * 按位置切分：kept 为保留部分，guard 为紧随其后的一位，sticky 为其余低位的或
 */
struct RoundDigits {
    uint128_t kept = 0;
    bool guard = false;
    bool sticky = false;

    bool inexact() const { return guard || sticky; }
};

RoundDigits splitAt(uint128_t value, int shift);

// 根据舍入模式决定是否向上进一位（作用于幅值）
bool roundIncrement(const RoundDigits& digits, FPRoundingMode rm, bool sign);

int countLeadingZeros(uint128_t value);

// 右移并把移出的位折叠到最低位（sticky）
uint128_t shiftRightJam(uint128_t value, int32_t distance);

// 精确零结果的符号：只有向下舍入得到 -0
inline bool exactZeroSign(FPRoundingMode rm) {
    return rm == FPRoundingMode::RDN;
}

/**
 * 规格化、舍入并打包
 * 输入数值 = sig * 2^(exp - 127)，sig 可为任意非规格化位置
 * 下溢按舍入后判断（tininess after rounding），只有不精确时才置 UF
 * @return 目标格式的原始位模式（未装箱）
 */
uint64_t roundPack(FpFormat fmt, bool sign, int32_t exp, uint128_t sig,
                   FPRoundingMode rm, FpFlags& flags);

/**
 * 两个加数在同一个128位窗口内对齐后的结果
 * 数值 = first/second * 2^lsb_exponent
 */
struct AlignedOperands {
    uint128_t first = 0;
    uint128_t second = 0;
    int32_t lsb_exponent = 0;
};

// 窗口最高有效位位置，留两位给进位
constexpr int kAlignWindowTop = 125;

AlignedOperands alignOperands(uint128_t first, int32_t first_lsb,
                              uint128_t second, int32_t second_lsb);

/**
 * 对齐后的有符号相加 + 一次舍入（融合乘加与加法单元第二级共用）
 */
uint64_t addAlignedAndRound(FpFormat fmt, const AlignedOperands& operands,
                            bool first_sign, bool second_sign,
                            FPRoundingMode rm, FpFlags& flags);

} // namespace rvfpu::fparith
