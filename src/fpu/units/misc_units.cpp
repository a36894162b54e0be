#include "fpu/units/misc_units.h"
#include "fpu/rounding.h"

namespace rvfpu {

UnitResult SignInjectUnit::inject(FpuOp op, FpFormat fmt,
                                  const UnpackedOperand& a, const UnpackedOperand& b) {
    bool sign;
    switch (op) {
        case FpuOp::FSGNJ:  sign = b.sign; break;
        case FpuOp::FSGNJN: sign = !b.sign; break;
        case FpuOp::FSGNJX: sign = a.sign != b.sign; break;
        default:
            throw FpuException("符号注入单元收到非法操作");
    }
    const int pos = formatInfo(fmt).signPosition();
    const uint64_t bits = (a.raw & ~(uint64_t{1} << pos)) | (static_cast<uint64_t>(sign) << pos);

    UnitResult result;
    result.value = boxValue(fmt, bits);
    return result;
}

UnitResult ClassifyUnit::classify(const UnpackedOperand& a) {
    UnitResult result;
    switch (a.cls) {
        case FpClass::INF:      result.value = a.sign ? NEG_INF : POS_INF; break;
        case FpClass::NORMAL:   result.value = a.sign ? NEG_NORMAL : POS_NORMAL; break;
        case FpClass::DENORMAL: result.value = a.sign ? NEG_SUBNORMAL : POS_SUBNORMAL; break;
        case FpClass::ZERO:     result.value = a.sign ? NEG_ZERO : POS_ZERO; break;
        case FpClass::SNAN:     result.value = SIGNALING_NAN; break;
        case FpClass::QNAN:     result.value = QUIET_NAN; break;
    }
    return result;
}

namespace {

uint64_t signExtend32(uint64_t value) {
    return static_cast<uint64_t>(static_cast<int64_t>(static_cast<int32_t>(static_cast<uint32_t>(value))));
}

bool isWordConversion(IntConversion kind) {
    return kind == IntConversion::W || kind == IntConversion::WU;
}

bool isSignedConversion(IntConversion kind) {
    return kind == IntConversion::W || kind == IntConversion::L;
}

} // namespace

UnitResult ConvertUnit::toInteger(IntConversion kind, FPRoundingMode rm, const UnpackedOperand& a) {
    const bool is_signed = isSignedConversion(kind);
    const int width = isWordConversion(kind) ? 32 : 64;

    const uint128_t positive_limit = is_signed ? (uint128_t{1} << (width - 1)) - 1
                                               : (uint128_t{1} << width) - 1;
    const uint64_t max_value = static_cast<uint64_t>(positive_limit);
    const uint64_t min_value = is_signed ? 0 - (uint64_t{1} << (width - 1)) : 0;

    UnitResult result;
    auto finish = [&](uint64_t value) {
        result.value = width == 32 ? signExtend32(value) : value;
        return result;
    };

    if (a.isNaN()) {
        result.flags.invalid = true;
        return finish(max_value);
    }
    if (a.isInfinity()) {
        result.flags.invalid = true;
        return finish(a.sign ? min_value : max_value);
    }
    if (a.isZero()) {
        return finish(0);
    }

    const int32_t lsb = a.lsbExponent();
    uint128_t magnitude;
    bool inexact = false;
    bool out_of_range = false;

    if (lsb >= 0) {
        if (lsb >= width) {
            out_of_range = true;
            magnitude = 0;
        } else {
            magnitude = static_cast<uint128_t>(a.mantissa) << lsb;
        }
    } else {
        const fparith::RoundDigits digits = fparith::splitAt(a.mantissa, -lsb);
        magnitude = digits.kept + (fparith::roundIncrement(digits, rm, a.sign) ? 1 : 0);
        inexact = digits.inexact();
    }

    if (!out_of_range) {
        if (a.sign) {
            out_of_range = is_signed ? magnitude > (uint128_t{1} << (width - 1)) : magnitude != 0;
        } else {
            out_of_range = magnitude > positive_limit;
        }
    }

    if (out_of_range) {
        result.flags.invalid = true;
        return finish(a.sign ? min_value : max_value);
    }

    result.flags.inexact = inexact;
    const uint64_t low = static_cast<uint64_t>(magnitude);
    return finish(a.sign ? (~low + 1) : low);
}

UnitResult ConvertUnit::fromInteger(IntConversion kind, FpFormat fmt, FPRoundingMode rm,
                                    uint64_t int_value) {
    bool negative = false;
    uint64_t magnitude;
    switch (kind) {
        case IntConversion::W: {
            const int64_t value = static_cast<int32_t>(static_cast<uint32_t>(int_value));
            negative = value < 0;
            magnitude = negative ? 0 - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
            break;
        }
        case IntConversion::WU:
            magnitude = int_value & 0xFFFFFFFFULL;
            break;
        case IntConversion::L:
            negative = static_cast<int64_t>(int_value) < 0;
            magnitude = negative ? 0 - int_value : int_value;
            break;
        case IntConversion::LU:
            magnitude = int_value;
            break;
        default:
            throw FpuException("未知的整数转换类型");
    }

    UnitResult result;
    const uint64_t bits = magnitude == 0
                              ? packZero(fmt, false)
                              : fparith::roundPack(fmt, negative, 127, magnitude, rm, result.flags);
    result.value = boxValue(fmt, bits);
    return result;
}

UnitResult ConvertUnit::moveToInteger(FpFormat fmt, RegValue stored) {
    UnitResult result;
    result.value = fmt == FpFormat::SINGLE ? signExtend32(stored) : stored;
    return result;
}

UnitResult ConvertUnit::moveFromInteger(FpFormat fmt, uint64_t int_value) {
    UnitResult result;
    result.value = boxValue(fmt, int_value);
    return result;
}

} // namespace rvfpu
