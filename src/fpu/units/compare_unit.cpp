#include "fpu/units/compare_unit.h"

namespace rvfpu {

namespace {

bool magnitudeLess(const UnpackedOperand& a, const UnpackedOperand& b) {
    if (a.exponent != b.exponent) {
        return a.exponent < b.exponent;
    }
    return a.mantissa < b.mantissa;
}

// 全序比较，-0 < +0
bool orderedBefore(const UnpackedOperand& a, const UnpackedOperand& b) {
    if (a.isZero() && b.isZero()) {
        return a.sign && !b.sign;
    }
    return CompareUnit::lessThan(a, b);
}

} // namespace

bool CompareUnit::equal(const UnpackedOperand& a, const UnpackedOperand& b) {
    if (a.isZero() && b.isZero()) {
        return true;
    }
    return a.sign == b.sign && a.exponent == b.exponent && a.mantissa == b.mantissa;
}

bool CompareUnit::lessThan(const UnpackedOperand& a, const UnpackedOperand& b) {
    if (a.isZero() && b.isZero()) {
        return false;
    }
    if (a.sign != b.sign) {
        return a.sign;
    }
    return a.sign ? magnitudeLess(b, a) : magnitudeLess(a, b);
}

UnitResult CompareUnit::compare(FpuOp op, const UnpackedOperand& a, const UnpackedOperand& b) {
    UnitResult result;
    if (a.isNaN() || b.isNaN()) {
        // FEQ 是静默比较，FLT/FLE 是信号比较
        if (op == FpuOp::FEQ) {
            result.flags.invalid = a.isSignalingNaN() || b.isSignalingNaN();
        } else {
            result.flags.invalid = true;
        }
        result.value = 0;
        return result;
    }

    bool outcome;
    switch (op) {
        case FpuOp::FEQ: outcome = equal(a, b); break;
        case FpuOp::FLT: outcome = lessThan(a, b); break;
        case FpuOp::FLE: outcome = lessThan(a, b) || equal(a, b); break;
        default:
            throw FpuException("比较单元收到非法操作");
    }
    result.value = outcome ? 1 : 0;
    return result;
}

UnitResult CompareUnit::minMax(FpuOp op, FpFormat fmt,
                               const UnpackedOperand& a, const UnpackedOperand& b) {
    if (op != FpuOp::FMIN && op != FpuOp::FMAX) {
        throw FpuException("最小/最大值单元收到非法操作");
    }

    UnitResult result;
    result.flags.invalid = a.isSignalingNaN() || b.isSignalingNaN();

    if (a.isNaN() && b.isNaN()) {
        result.value = boxValue(fmt, canonicalNaN(fmt));
        return result;
    }
    if (a.isNaN()) {
        result.value = boxValue(fmt, b.raw);
        return result;
    }
    if (b.isNaN()) {
        result.value = boxValue(fmt, a.raw);
        return result;
    }

    const bool a_first = orderedBefore(a, b);
    const bool pick_a = op == FpuOp::FMIN ? a_first || !orderedBefore(b, a) : !a_first;
    result.value = boxValue(fmt, pick_a ? a.raw : b.raw);
    return result;
}

} // namespace rvfpu
