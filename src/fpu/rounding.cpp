#include "fpu/rounding.h"

namespace rvfpu::fparith {

RoundDigits splitAt(uint128_t value, int shift) {
    RoundDigits digits;
    if (shift <= 0) {
        digits.kept = value;
        return digits;
    }
    if (shift > 128) {
        digits.sticky = value != 0;
        return digits;
    }
    if (shift == 128) {
        digits.guard = ((value >> 127) & 1) != 0;
        digits.sticky = (value & ((uint128_t{1} << 127) - 1)) != 0;
        return digits;
    }
    digits.kept = value >> shift;
    digits.guard = ((value >> (shift - 1)) & 1) != 0;
    const uint128_t below_guard = (uint128_t{1} << (shift - 1)) - 1;
    digits.sticky = (value & below_guard) != 0;
    return digits;
}

bool roundIncrement(const RoundDigits& digits, FPRoundingMode rm, bool sign) {
    switch (rm) {
        case FPRoundingMode::RNE:
            return digits.guard && (digits.sticky || (digits.kept & 1) != 0);
        case FPRoundingMode::RTZ:
            return false;
        case FPRoundingMode::RDN:
            return sign && digits.inexact();
        case FPRoundingMode::RUP:
            return !sign && digits.inexact();
        case FPRoundingMode::RMM:
            return digits.guard;
        default:
            // DYN 在译码阶段已经解析，这里不会出现
            throw FpuException("未解析的舍入模式");
    }
}

int countLeadingZeros(uint128_t value) {
    const uint64_t high = static_cast<uint64_t>(value >> 64);
    const uint64_t low = static_cast<uint64_t>(value);
    if (high != 0) {
        return __builtin_clzll(high);
    }
    if (low != 0) {
        return 64 + __builtin_clzll(low);
    }
    return 128;
}

uint128_t shiftRightJam(uint128_t value, int32_t distance) {
    if (distance <= 0) {
        return value;
    }
    if (distance >= 128) {
        return value != 0 ? 1 : 0;
    }
    const uint128_t lost = value & ((uint128_t{1} << distance) - 1);
    return (value >> distance) | (lost != 0 ? 1 : 0);
}

uint64_t roundPack(FpFormat fmt, bool sign, int32_t exp, uint128_t sig,
                   FPRoundingMode rm, FpFlags& flags) {
    const auto& info = formatInfo(fmt);
    if (sig == 0) {
        return packZero(fmt, sign);
    }

    // 规格化到 bit127，此后数值落在 [2^exp, 2^(exp+1))
    const int leading = countLeadingZeros(sig);
    sig <<= leading;
    exp -= leading;

    const int precision = info.precision();
    int32_t biased = exp + info.bias;
    int shift = 128 - precision;
    bool tiny = false;

    if (biased < 1) {
        if (biased < 0) {
            tiny = true;
        } else {
            // 恰好低一个量级：看无界指数舍入后是否进位到最小规格化数
            const RoundDigits unbounded = splitAt(sig, shift);
            const uint128_t rounded = unbounded.kept + (roundIncrement(unbounded, rm, sign) ? 1 : 0);
            tiny = rounded < (uint128_t{1} << precision);
        }
        const int32_t extra = 1 - biased;
        shift = extra > 128 ? 129 : shift + static_cast<int>(extra);
    }

    const RoundDigits digits = splitAt(sig, shift);
    const bool inexact = digits.inexact();
    uint64_t kept = static_cast<uint64_t>(digits.kept) + (roundIncrement(digits, rm, sign) ? 1 : 0);

    if (inexact) {
        flags.inexact = true;
    }

    if (biased < 1) {
        if (tiny && inexact) {
            flags.underflow = true;
        }
        // 非规格化编码；舍入进位到隐藏位时自然成为最小规格化数
        return (static_cast<uint64_t>(sign) << info.signPosition()) | kept;
    }

    if ((kept >> precision) != 0) {
        kept >>= 1;
        ++biased;
    }

    if (biased >= static_cast<int32_t>(info.max_exponent)) {
        flags.overflow = true;
        flags.inexact = true;
        const bool to_infinity = rm == FPRoundingMode::RNE || rm == FPRoundingMode::RMM ||
                                 (rm == FPRoundingMode::RUP && !sign) ||
                                 (rm == FPRoundingMode::RDN && sign);
        return to_infinity ? packInfinity(fmt, sign) : packMaxFinite(fmt, sign);
    }

    return packFields(fmt, sign, static_cast<uint32_t>(biased), kept);
}

AlignedOperands alignOperands(uint128_t first, int32_t first_lsb,
                              uint128_t second, int32_t second_lsb) {
    AlignedOperands aligned;
    if (first != 0) {
        const int shift = countLeadingZeros(first) - (127 - kAlignWindowTop);
        first <<= shift;
        first_lsb -= shift;
    }
    if (second != 0) {
        const int shift = countLeadingZeros(second) - (127 - kAlignWindowTop);
        second <<= shift;
        second_lsb -= shift;
    }

    if (first == 0) {
        aligned.second = second;
        aligned.lsb_exponent = second_lsb;
        return aligned;
    }
    if (second == 0) {
        aligned.first = first;
        aligned.lsb_exponent = first_lsb;
        return aligned;
    }

    // 两者最高位都在窗口顶端，lsb 指数大的量级大；小者右移对齐
    if (first_lsb >= second_lsb) {
        aligned.first = first;
        aligned.second = shiftRightJam(second, first_lsb - second_lsb);
        aligned.lsb_exponent = first_lsb;
    } else {
        aligned.first = shiftRightJam(first, second_lsb - first_lsb);
        aligned.second = second;
        aligned.lsb_exponent = second_lsb;
    }
    return aligned;
}

uint64_t addAlignedAndRound(FpFormat fmt, const AlignedOperands& operands,
                            bool first_sign, bool second_sign,
                            FPRoundingMode rm, FpFlags& flags) {
    uint128_t magnitude;
    bool sign;
    if (first_sign == second_sign) {
        magnitude = operands.first + operands.second;
        sign = first_sign;
    } else if (operands.first >= operands.second) {
        magnitude = operands.first - operands.second;
        sign = first_sign;
    } else {
        magnitude = operands.second - operands.first;
        sign = second_sign;
    }

    if (magnitude == 0) {
        // x + (-x) 精确抵消
        return packZero(fmt, exactZeroSign(rm));
    }
    return roundPack(fmt, sign, operands.lsb_exponent + 127, magnitude, rm, flags);
}

} // namespace rvfpu::fparith
