#include "fpu/units/fma_unit.h"

namespace rvfpu {

namespace {

FmaStage1 specialResult(FmaStage1 partial, uint64_t bits, bool invalid) {
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

bool FmaUnit::isFmaOp(FpuOp op) {
    return op == FpuOp::FMADD || op == FpuOp::FMSUB || op == FpuOp::FNMSUB ||
           op == FpuOp::FNMADD || op == FpuOp::FMUL;
}

FmaStage1 FmaUnit::stage1(FpuOp op, FpFormat fmt, FPRoundingMode rm,
                          const UnpackedOperand& a, const UnpackedOperand& b,
                          const UnpackedOperand& c) {
    if (!isFmaOp(op)) {
        throw FpuException("融合乘加单元收到非法操作");
    }

    FmaStage1 partial;
    partial.format = fmt;
    partial.rm = rm;

    const bool multiply_only = op == FpuOp::FMUL;
    const bool negate_product = op == FpuOp::FNMSUB || op == FpuOp::FNMADD;
    const bool negate_addend = op == FpuOp::FMSUB || op == FpuOp::FNMADD;

    partial.product_sign = (a.sign != b.sign) != negate_product;
    partial.addend_sign = multiply_only ? partial.product_sign : (c.sign != negate_addend);

    // ∞×0 即使加数是 quiet NaN 也要置 NV
    const bool invalid_product = (a.isInfinity() && b.isZero()) || (a.isZero() && b.isInfinity());

    if (a.isNaN() || b.isNaN() || (!multiply_only && c.isNaN())) {
        const bool signaling = a.isSignalingNaN() || b.isSignalingNaN() ||
                               (!multiply_only && c.isSignalingNaN());
        return specialResult(partial, canonicalNaN(fmt), signaling || invalid_product);
    }
    if (invalid_product) {
        return specialResult(partial, canonicalNaN(fmt), true);
    }

    if (a.isInfinity() || b.isInfinity()) {
        if (!multiply_only && c.isInfinity() && partial.addend_sign != partial.product_sign) {
            return specialResult(partial, canonicalNaN(fmt), true);
        }
        return specialResult(partial, packInfinity(fmt, partial.product_sign), false);
    }
    if (!multiply_only && c.isInfinity()) {
        return specialResult(partial, packInfinity(fmt, partial.addend_sign), false);
    }

    const bool product_zero = a.isZero() || b.isZero();
    const bool addend_zero = multiply_only || c.isZero();
    if (product_zero) {
        if (addend_zero) {
            const bool sign = partial.product_sign == partial.addend_sign
                                  ? partial.product_sign
                                  : fparith::exactZeroSign(rm);
            return specialResult(partial, packZero(fmt, sign), false);
        }
        // 乘积为零，结果就是加数本身（已经是该格式可表示的值）
        return specialResult(partial, withSign(fmt, c.raw, partial.addend_sign), false);
    }

    const uint128_t product = static_cast<uint128_t>(a.mantissa) * b.mantissa;
    const int32_t product_lsb = a.lsbExponent() + b.lsbExponent();
    const uint128_t addend = addend_zero ? 0 : c.mantissa;
    const int32_t addend_lsb = addend_zero ? product_lsb : c.lsbExponent();

    partial.aligned = fparith::alignOperands(product, product_lsb, addend, addend_lsb);
    return partial;
}

UnitResult FmaUnit::stage2(const FmaStage1& partial) {
    if (partial.special) {
        return partial.special_result;
    }
    UnitResult result;
    const uint64_t bits = fparith::addAlignedAndRound(partial.format, partial.aligned,
                                                      partial.product_sign, partial.addend_sign,
                                                      partial.rm, result.flags);
    result.value = boxValue(partial.format, bits);
    return result;
}

} // namespace rvfpu
