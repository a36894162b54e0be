#pragma once

#include "common/types.h"
#include <string>

namespace rvfpu {

/**
 * IEEE-754 异常标志（每个运算单元一份）
 * 位布局与 fflags 一致：NV=4 DZ=3 OF=2 UF=1 NX=0
 */
struct FpFlags {
    bool invalid = false;
    bool divide_by_zero = false;
    bool overflow = false;
    bool underflow = false;
    bool inexact = false;

    static constexpr uint8_t NV = 0x10;
    static constexpr uint8_t DZ = 0x08;
    static constexpr uint8_t OF = 0x04;
    static constexpr uint8_t UF = 0x02;
    static constexpr uint8_t NX = 0x01;

    uint8_t toBits() const {
        return static_cast<uint8_t>((invalid ? NV : 0) | (divide_by_zero ? DZ : 0) |
                                    (overflow ? OF : 0) | (underflow ? UF : 0) |
                                    (inexact ? NX : 0));
    }

    static FpFlags fromBits(uint8_t bits) {
        FpFlags flags;
        flags.invalid = (bits & NV) != 0;
        flags.divide_by_zero = (bits & DZ) != 0;
        flags.overflow = (bits & OF) != 0;
        flags.underflow = (bits & UF) != 0;
        flags.inexact = (bits & NX) != 0;
        return flags;
    }

    bool any() const { return toBits() != 0; }

    FpFlags& operator|=(const FpFlags& other) {
        invalid = invalid || other.invalid;
        divide_by_zero = divide_by_zero || other.divide_by_zero;
        overflow = overflow || other.overflow;
        underflow = underflow || other.underflow;
        inexact = inexact || other.inexact;
        return *this;
    }

    bool operator==(const FpFlags& other) const { return toBits() == other.toBits(); }
    bool operator!=(const FpFlags& other) const { return !(*this == other); }

    std::string toString() const;
};

/**
 * 运算单元输出：结果值 + 该单元的异常标志
 */
struct UnitResult {
    uint64_t value = 0;
    FpFlags flags;
};

} // namespace rvfpu
