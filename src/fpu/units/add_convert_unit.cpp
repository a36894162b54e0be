#include "fpu/units/add_convert_unit.h"

namespace rvfpu {

namespace {

AddConvertStage1 specialResult(AddConvertStage1 partial, uint64_t bits, bool invalid) {
    partial.special = true;
    partial.special_result.value = boxValue(partial.format, bits);
    partial.special_result.flags.invalid = invalid;
    return partial;
}

uint64_t withSign(FpFormat fmt, uint64_t bits, bool sign) {
    const int pos = formatInfo(fmt).signPosition();
    return (bits & ~(uint64_t{1} << pos)) | (static_cast<uint64_t>(sign) << pos);
}

} // namespace

AddConvertStage1 AddConvertUnit::stage1Add(FpuOp op, FpFormat fmt, FPRoundingMode rm,
                                           const UnpackedOperand& a, const UnpackedOperand& b) {
    if (op != FpuOp::FADD && op != FpuOp::FSUB) {
        throw FpuException("加法单元收到非法操作");
    }

    AddConvertStage1 partial;
    partial.format = fmt;
    partial.rm = rm;
    partial.first_sign = a.sign;
    partial.second_sign = op == FpuOp::FSUB ? !b.sign : b.sign;

    if (a.isNaN() || b.isNaN()) {
        return specialResult(partial, canonicalNaN(fmt), a.isSignalingNaN() || b.isSignalingNaN());
    }
    if (a.isInfinity() && b.isInfinity()) {
        if (partial.first_sign != partial.second_sign) {
            return specialResult(partial, canonicalNaN(fmt), true);
        }
        return specialResult(partial, packInfinity(fmt, partial.first_sign), false);
    }
    if (a.isInfinity()) {
        return specialResult(partial, packInfinity(fmt, partial.first_sign), false);
    }
    if (b.isInfinity()) {
        return specialResult(partial, packInfinity(fmt, partial.second_sign), false);
    }

    if (a.isZero() && b.isZero()) {
        const bool sign = partial.first_sign == partial.second_sign ? partial.first_sign
                                                                    : fparith::exactZeroSign(rm);
        return specialResult(partial, packZero(fmt, sign), false);
    }
    if (a.isZero()) {
        return specialResult(partial, withSign(fmt, b.raw, partial.second_sign), false);
    }
    if (b.isZero()) {
        return specialResult(partial, a.raw, false);
    }

    partial.aligned = fparith::alignOperands(a.mantissa, a.lsbExponent(), b.mantissa, b.lsbExponent());
    return partial;
}

AddConvertStage1 AddConvertUnit::stage1Convert(FpFormat target, FPRoundingMode rm,
                                               const UnpackedOperand& source) {
    AddConvertStage1 partial;
    partial.format = target;
    partial.rm = rm;
    partial.first_sign = source.sign;
    partial.second_sign = source.sign;

    if (source.isNaN()) {
        return specialResult(partial, canonicalNaN(target), source.isSignalingNaN());
    }
    if (source.isInfinity()) {
        return specialResult(partial, packInfinity(target, source.sign), false);
    }
    if (source.isZero()) {
        return specialResult(partial, packZero(target, source.sign), false);
    }

    partial.aligned = fparith::alignOperands(source.mantissa, source.lsbExponent(), 0, 0);
    return partial;
}

UnitResult AddConvertUnit::stage2(const AddConvertStage1& partial) {
    if (partial.special) {
        return partial.special_result;
    }
    UnitResult result;
    const uint64_t bits = fparith::addAlignedAndRound(partial.format, partial.aligned,
                                                      partial.first_sign, partial.second_sign,
                                                      partial.rm, result.flags);
    result.value = boxValue(partial.format, bits);
    return result;
}

} // namespace rvfpu
