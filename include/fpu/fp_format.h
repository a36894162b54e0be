#pragma once

#include "common/types.h"

namespace rvfpu {

/**
 * 浮点格式标签
 * 两种格式共用64位寄存器存储，单精度值高32位全1（NaN-boxing）
 */
enum class FpFormat : uint8_t {
    SINGLE = 0,
    DOUBLE = 1
};

/**
 * 格式参数：位宽、偏置以及由此派生的掩码
 */
struct FormatInfo {
    int width;              // 总位宽
    int exponent_bits;
    int fraction_bits;      // 不含隐藏位
    int32_t bias;
    uint32_t max_exponent;  // 全1指数字段（Inf/NaN）
    uint64_t canonical_nan;

    constexpr int precision() const { return fraction_bits + 1; }
    constexpr uint64_t fractionMask() const { return (uint64_t{1} << fraction_bits) - 1; }
    constexpr uint64_t hiddenBit() const { return uint64_t{1} << fraction_bits; }
    constexpr uint64_t quietBit() const { return uint64_t{1} << (fraction_bits - 1); }
    constexpr int signPosition() const { return width - 1; }
};

constexpr FormatInfo kSingleFormat{32, 8, 23, 127, 0xFF, 0x7FC00000ULL};
constexpr FormatInfo kDoubleFormat{64, 11, 52, 1023, 0x7FF, 0x7FF8000000000000ULL};

constexpr const FormatInfo& formatInfo(FpFormat fmt) {
    return fmt == FpFormat::SINGLE ? kSingleFormat : kDoubleFormat;
}

constexpr uint64_t kBoxMask = 0xFFFFFFFF00000000ULL;

// 字段访问（bits 为该格式下未装箱的原始位模式）
inline bool fieldSign(FpFormat fmt, uint64_t bits) {
    return ((bits >> formatInfo(fmt).signPosition()) & 1) != 0;
}

inline uint32_t fieldExponent(FpFormat fmt, uint64_t bits) {
    const auto& info = formatInfo(fmt);
    return static_cast<uint32_t>((bits >> info.fraction_bits) & info.max_exponent);
}

inline uint64_t fieldFraction(FpFormat fmt, uint64_t bits) {
    return bits & formatInfo(fmt).fractionMask();
}

inline uint64_t packFields(FpFormat fmt, bool sign, uint32_t exponent, uint64_t fraction) {
    const auto& info = formatInfo(fmt);
    return (static_cast<uint64_t>(sign) << info.signPosition()) |
           (static_cast<uint64_t>(exponent) << info.fraction_bits) |
           (fraction & info.fractionMask());
}

inline uint64_t packZero(FpFormat fmt, bool sign) {
    return packFields(fmt, sign, 0, 0);
}

inline uint64_t packInfinity(FpFormat fmt, bool sign) {
    return packFields(fmt, sign, formatInfo(fmt).max_exponent, 0);
}

inline uint64_t packMaxFinite(FpFormat fmt, bool sign) {
    const auto& info = formatInfo(fmt);
    return packFields(fmt, sign, info.max_exponent - 1, info.fractionMask());
}

inline uint64_t canonicalNaN(FpFormat fmt) {
    return formatInfo(fmt).canonical_nan;
}

/**
 * 装箱：把格式位模式放入64位存储
 */
inline RegValue boxValue(FpFormat fmt, uint64_t bits) {
    if (fmt == FpFormat::SINGLE) {
        return kBoxMask | (bits & 0xFFFFFFFFULL);
    }
    return bits;
}

inline bool isProperlyBoxed(RegValue stored) {
    return (stored & kBoxMask) == kBoxMask;
}

/**
 * 拆箱：未正确装箱的单精度值按规范NaN处理
 */
inline uint64_t unboxValue(FpFormat fmt, RegValue stored) {
    if (fmt == FpFormat::SINGLE) {
        return isProperlyBoxed(stored) ? (stored & 0xFFFFFFFFULL) : kSingleFormat.canonical_nan;
    }
    return stored;
}

const char* formatName(FpFormat fmt);

} // namespace rvfpu
