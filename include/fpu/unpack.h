#pragma once

#include "fpu/fp_format.h"
#include <array>

namespace rvfpu {

/**
 * 操作数六类分类
 */
enum class FpClass : uint8_t {
    ZERO,
    INF,
    QNAN,
    SNAN,
    DENORMAL,
    NORMAL
};

/**
 * 拆包后的操作数
 * exponent 为偏置指数字段（非规格化数按最小指数1处理），
 * mantissa 显式包含隐藏位（规格化数），单精度24位、双精度53位
 */
struct UnpackedOperand {
    FpFormat format = FpFormat::DOUBLE;
    bool sign = false;
    uint32_t exponent = 0;
    uint64_t mantissa = 0;
    FpClass cls = FpClass::ZERO;
    uint64_t raw = 0;           // 拆箱后的格式位模式

    bool isZero() const { return cls == FpClass::ZERO; }
    bool isInfinity() const { return cls == FpClass::INF; }
    bool isNaN() const { return cls == FpClass::QNAN || cls == FpClass::SNAN; }
    bool isSignalingNaN() const { return cls == FpClass::SNAN; }
    bool isFinite() const { return !isInfinity() && !isNaN(); }

    // 无偏指数：value = mantissa * 2^(unbiasedExponent() - fraction_bits)
    int32_t unbiasedExponent() const {
        return static_cast<int32_t>(exponent) - formatInfo(format).bias;
    }

    // 最低有效位的权重指数
    int32_t lsbExponent() const {
        return unbiasedExponent() - formatInfo(format).fraction_bits;
    }
};

/**
 * 拆包单元
 */
class Unpacker {
public:
    // 从格式位模式拆包（不做拆箱检查）
    static UnpackedOperand unpackBits(FpFormat fmt, uint64_t bits);

    // 从64位寄存器值拆包（单精度先拆箱）
    static UnpackedOperand unpack(FpFormat fmt, RegValue stored);

    // 架构零（乘法指令的第三操作数）
    static UnpackedOperand architecturalZero(FpFormat fmt);

    /**
     * 一次拆包三个操作数
     * @param force_zero_addend 纯乘法指令时为true，第三操作数强制为零
     */
    static std::array<UnpackedOperand, 3> unpackAll(FpFormat fmt,
                                                    const std::array<RegValue, 3>& stored,
                                                    bool force_zero_addend);

    static bool isSignalingNaN(FpFormat fmt, uint64_t bits);
    static const char* className(FpClass cls);
};

} // namespace rvfpu
