#include "fpu/units/divsqrt_unit.h"
#include "fpu/rounding.h"
#include <fmt/format.h>

namespace rvfpu {

namespace {

// 规格化尾数：最高位移到 bit(p-1)，数值 = mantissa * 2^(exponent - (p-1))
struct NormalizedOperand {
    uint64_t mantissa;
    int32_t exponent;
};

NormalizedOperand normalize(const UnpackedOperand& op) {
    const auto& info = formatInfo(op.format);
    NormalizedOperand n{op.mantissa, op.unbiasedExponent()};
    while ((n.mantissa & info.hiddenBit()) == 0) {
        n.mantissa <<= 1;
        --n.exponent;
    }
    return n;
}

} // namespace

DivSqrtUnit::DivSqrtUnit(unsigned bits_per_tick) : bits_per_tick_(bits_per_tick) {
    if (bits_per_tick_ == 0) {
        throw ConfigException("除法/开方单元每周期位数不能为0");
    }
}

void DivSqrtUnit::reset() {
    state_ = DivSqrtState::IDLE;
    special_ = false;
    partial_remainder_ = 0;
    divisor_ = 0;
    radicand_ = 0;
    quotient_ = 0;
    remaining_ = 0;
    result_ = UnitResult{};
}

void DivSqrtUnit::start(const DivSqrtRequest& request) {
    if (state_ != DivSqrtState::IDLE) {
        throw FpuException("除法/开方单元忙，不能启动新的运算");
    }

    sqrt_ = request.sqrt;
    format_ = request.format;
    rm_ = request.rm;
    special_ = false;
    quotient_ = 0;
    partial_remainder_ = 0;
    result_ = UnitResult{};

    if (!resolveSpecial(request)) {
        if (sqrt_) {
            prepareSqrt(request);
        } else {
            prepareDivide(request);
        }
    }
    state_ = DivSqrtState::BUSY;
}

bool DivSqrtUnit::resolveSpecial(const DivSqrtRequest& request) {
    const auto& a = request.dividend;
    const auto& b = request.divisor;
    const FpFormat fmt = request.format;

    auto set = [&](uint64_t bits) {
        special_ = true;
        remaining_ = 0;
        result_.value = boxValue(fmt, bits);
    };

    if (request.sqrt) {
        if (a.isNaN()) {
            result_.flags.invalid = a.isSignalingNaN();
            set(canonicalNaN(fmt));
        } else if (a.isZero()) {
            set(packZero(fmt, a.sign));
        } else if (a.sign) {
            result_.flags.invalid = true;
            set(canonicalNaN(fmt));
        } else if (a.isInfinity()) {
            set(packInfinity(fmt, false));
        }
        return special_;
    }

    const bool sign = a.sign != b.sign;
    if (a.isNaN() || b.isNaN()) {
        result_.flags.invalid = a.isSignalingNaN() || b.isSignalingNaN();
        set(canonicalNaN(fmt));
    } else if ((a.isInfinity() && b.isInfinity()) || (a.isZero() && b.isZero())) {
        result_.flags.invalid = true;
        set(canonicalNaN(fmt));
    } else if (a.isInfinity()) {
        set(packInfinity(fmt, sign));
    } else if (b.isInfinity() || a.isZero()) {
        set(packZero(fmt, sign));
    } else if (b.isZero()) {
        result_.flags.divide_by_zero = true;
        set(packInfinity(fmt, sign));
    }
    return special_;
}

void DivSqrtUnit::prepareDivide(const DivSqrtRequest& request) {
    const int precision = formatInfo(request.format).precision();
    NormalizedOperand a = normalize(request.dividend);
    const NormalizedOperand b = normalize(request.divisor);

    sign_ = request.dividend.sign != request.divisor.sign;
    int32_t exponent = a.exponent - b.exponent;
    // 保证商落在 [1, 2)
    if (a.mantissa < b.mantissa) {
        a.mantissa <<= 1;
        --exponent;
    }

    partial_remainder_ = a.mantissa;
    divisor_ = b.mantissa;
    remaining_ = static_cast<unsigned>(precision + 2);
    // 商 Q 共 p+2 位，再左移一位拼上 sticky
    result_exponent_ = exponent - (precision + 2) + 127;
}

void DivSqrtUnit::prepareSqrt(const DivSqrtRequest& request) {
    const int precision = formatInfo(request.format).precision();
    const NormalizedOperand a = normalize(request.dividend);

    uint64_t mantissa = a.mantissa;
    int32_t exponent = a.exponent - (precision - 1);
    if ((exponent & 1) != 0) {
        mantissa <<= 1;
        --exponent;
    }

    const int scale = (precision + 5) / 2;
    radicand_ = static_cast<uint128_t>(mantissa) << (2 * scale);
    sign_ = false;

    const int bit_length = 128 - fparith::countLeadingZeros(radicand_);
    remaining_ = static_cast<unsigned>((bit_length + 1) / 2);
    result_exponent_ = exponent / 2 - scale - 1 + 127;
}

void DivSqrtUnit::iterate() {
    if (sqrt_) {
        const unsigned pair = remaining_ - 1;
        const uint128_t digits = (radicand_ >> (2 * pair)) & 3;
        partial_remainder_ = (partial_remainder_ << 2) | digits;
        const uint128_t trial = (quotient_ << 2) | 1;
        if (partial_remainder_ >= trial) {
            partial_remainder_ -= trial;
            quotient_ = (quotient_ << 1) | 1;
        } else {
            quotient_ <<= 1;
        }
    } else {
        const bool bit = partial_remainder_ >= divisor_;
        if (bit) {
            partial_remainder_ -= divisor_;
        }
        quotient_ = (quotient_ << 1) | (bit ? 1 : 0);
        partial_remainder_ <<= 1;
    }
    --remaining_;
}

void DivSqrtUnit::step() {
    if (state_ != DivSqrtState::BUSY) {
        return;
    }
    for (unsigned i = 0; i < bits_per_tick_ && remaining_ > 0; ++i) {
        iterate();
    }
    if (remaining_ == 0) {
        finish();
        state_ = DivSqrtState::DONE;
    }
}

void DivSqrtUnit::finish() {
    if (special_) {
        return;
    }
    const bool sticky = partial_remainder_ != 0;
    const uint128_t significand = (quotient_ << 1) | (sticky ? 1 : 0);
    const uint64_t bits = fparith::roundPack(format_, sign_, result_exponent_, significand,
                                             rm_, result_.flags);
    result_.value = boxValue(format_, bits);
}

UnitResult DivSqrtUnit::acknowledge() {
    if (state_ != DivSqrtState::DONE) {
        throw FpuException(fmt::format("除法/开方结果尚未就绪 (剩余迭代 {})", remaining_));
    }
    state_ = DivSqrtState::IDLE;
    return result_;
}

UnitResult DivSqrtUnit::compute(const DivSqrtRequest& request) {
    DivSqrtUnit unit(64);
    unit.start(request);
    while (!unit.done()) {
        unit.step();
    }
    return unit.acknowledge();
}

} // namespace rvfpu
