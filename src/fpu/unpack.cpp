#include "fpu/unpack.h"

namespace rvfpu {

UnpackedOperand Unpacker::unpackBits(FpFormat fmt, uint64_t bits) {
    const auto& info = formatInfo(fmt);
    UnpackedOperand op;
    op.format = fmt;
    op.raw = bits;
    op.sign = fieldSign(fmt, bits);

    const uint32_t exponent = fieldExponent(fmt, bits);
    const uint64_t fraction = fieldFraction(fmt, bits);

    if (exponent == info.max_exponent) {
        op.exponent = exponent;
        op.mantissa = fraction;
        if (fraction == 0) {
            op.cls = FpClass::INF;
        } else if ((fraction & info.quietBit()) != 0) {
            op.cls = FpClass::QNAN;
        } else {
            op.cls = FpClass::SNAN;
        }
    } else if (exponent == 0) {
        if (fraction == 0) {
            // 零保留符号
            op.cls = FpClass::ZERO;
            op.exponent = 0;
            op.mantissa = 0;
        } else {
            // 非规格化数：隐藏位为0，指数按最小指数处理
            op.cls = FpClass::DENORMAL;
            op.exponent = 1;
            op.mantissa = fraction;
        }
    } else {
        op.cls = FpClass::NORMAL;
        op.exponent = exponent;
        op.mantissa = fraction | info.hiddenBit();
    }
    return op;
}

UnpackedOperand Unpacker::unpack(FpFormat fmt, RegValue stored) {
    return unpackBits(fmt, unboxValue(fmt, stored));
}

UnpackedOperand Unpacker::architecturalZero(FpFormat fmt) {
    return unpackBits(fmt, packZero(fmt, false));
}

std::array<UnpackedOperand, 3> Unpacker::unpackAll(FpFormat fmt,
                                                   const std::array<RegValue, 3>& stored,
                                                   bool force_zero_addend) {
    std::array<UnpackedOperand, 3> ops;
    ops[0] = unpack(fmt, stored[0]);
    ops[1] = unpack(fmt, stored[1]);
    ops[2] = force_zero_addend ? architecturalZero(fmt) : unpack(fmt, stored[2]);
    return ops;
}

bool Unpacker::isSignalingNaN(FpFormat fmt, uint64_t bits) {
    return unpackBits(fmt, bits).isSignalingNaN();
}

const char* Unpacker::className(FpClass cls) {
    switch (cls) {
        case FpClass::ZERO:     return "zero";
        case FpClass::INF:      return "inf";
        case FpClass::QNAN:     return "qnan";
        case FpClass::SNAN:     return "snan";
        case FpClass::DENORMAL: return "denormal";
        case FpClass::NORMAL:   return "normal";
    }
    return "unknown";
}

} // namespace rvfpu
