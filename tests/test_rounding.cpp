#include <gtest/gtest.h>
#include "fpu/rounding.h"

namespace rvfpu {

using namespace fparith;

TEST(RoundingTest, SplitAtSeparatesGuardAndSticky) {
    const RoundDigits digits = splitAt(0b101101, 3);
    EXPECT_EQ(static_cast<uint64_t>(digits.kept), 0b101u);
    EXPECT_TRUE(digits.guard);
    EXPECT_TRUE(digits.sticky);

    const RoundDigits exact = splitAt(0b1000, 3);
    EXPECT_FALSE(exact.inexact());

    const RoundDigits far = splitAt(1, 200);
    EXPECT_EQ(static_cast<uint64_t>(far.kept), 0u);
    EXPECT_FALSE(far.guard);
    EXPECT_TRUE(far.sticky);
}

TEST(RoundingTest, RoundIncrementPerMode) {
    RoundDigits tie;
    tie.kept = 2;
    tie.guard = true;
    EXPECT_FALSE(roundIncrement(tie, FPRoundingMode::RNE, false)) << "平局且偶数时不进位";
    EXPECT_TRUE(roundIncrement(tie, FPRoundingMode::RMM, false));
    EXPECT_FALSE(roundIncrement(tie, FPRoundingMode::RTZ, false));
    EXPECT_TRUE(roundIncrement(tie, FPRoundingMode::RUP, false));
    EXPECT_FALSE(roundIncrement(tie, FPRoundingMode::RUP, true));
    EXPECT_TRUE(roundIncrement(tie, FPRoundingMode::RDN, true));

    tie.kept = 3;
    EXPECT_TRUE(roundIncrement(tie, FPRoundingMode::RNE, false));

    EXPECT_THROW(roundIncrement(tie, FPRoundingMode::DYN, false), FpuException);
}

TEST(RoundingTest, CountLeadingZerosAndJam) {
    EXPECT_EQ(countLeadingZeros(uint128_t{1} << 127), 0);
    EXPECT_EQ(countLeadingZeros(1), 127);
    EXPECT_EQ(countLeadingZeros(0), 128);

    EXPECT_EQ(static_cast<uint64_t>(shiftRightJam(0b100010, 2)), 0b1001u);
    EXPECT_EQ(static_cast<uint64_t>(shiftRightJam(0b10000, 4)), 0b1u);
    EXPECT_EQ(static_cast<uint64_t>(shiftRightJam(5, 300)), 1u);
    EXPECT_EQ(static_cast<uint64_t>(shiftRightJam(0, 300)), 0u);
}

TEST(RoundingTest, ExactValuesPackWithoutFlags) {
    FpFlags flags;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127, 1, FPRoundingMode::RNE, flags), 0x3F800000u);
    EXPECT_EQ(roundPack(FpFormat::DOUBLE, true, 127, 3, FPRoundingMode::RNE, flags),
              0xC008000000000000ULL);
    EXPECT_FALSE(flags.any());
}

TEST(RoundingTest, OverflowDependsOnRoundingMode) {
    FpFlags flags;
    // 2^128 超出单精度范围
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 + 128, 1, FPRoundingMode::RNE, flags), 0x7F800000u);
    EXPECT_TRUE(flags.overflow);
    EXPECT_TRUE(flags.inexact);

    FpFlags rtz;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 + 128, 1, FPRoundingMode::RTZ, rtz), 0x7F7FFFFFu);
    EXPECT_TRUE(rtz.overflow);

    FpFlags rdn;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 + 128, 1, FPRoundingMode::RDN, rdn), 0x7F7FFFFFu);
    FpFlags rdn_negative;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, true, 127 + 128, 1, FPRoundingMode::RDN, rdn_negative),
              0xFF800000u);
}

TEST(RoundingTest, SmallestSubnormalIsExact) {
    FpFlags flags;
    // 2^-149
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 - 149, 1, FPRoundingMode::RNE, flags), 0x1u);
    EXPECT_FALSE(flags.any()) << "精确的非规格化结果不置 UF";
}

TEST(RoundingTest, HalfOfSmallestSubnormalUnderflows) {
    FpFlags flags;
    // 2^-150 平局舍入到偶数 0
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 - 150, 1, FPRoundingMode::RNE, flags), 0x0u);
    EXPECT_TRUE(flags.underflow);
    EXPECT_TRUE(flags.inexact);

    FpFlags up;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 - 150, 1, FPRoundingMode::RUP, up), 0x1u);
    EXPECT_TRUE(up.underflow);

    FpFlags above_half;
    // 1.5 * 2^-150 向上舍入到 2^-149
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 - 151, 3, FPRoundingMode::RNE, above_half), 0x1u);
    EXPECT_TRUE(above_half.underflow);
}

TEST(RoundingTest, TininessIsDetectedAfterRounding) {
    FpFlags flags;
    // (1 - 2^-25) * 2^-126 舍入后恰为最小规格化数，不算下溢
    const uint128_t sig = (uint128_t{1} << 25) - 1;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 - 126 - 25, sig, FPRoundingMode::RNE, flags),
              0x00800000u);
    EXPECT_TRUE(flags.inexact);
    EXPECT_FALSE(flags.underflow) << "舍入后不再是极小数，不应置 UF";

    FpFlags truncated;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 - 126 - 25, sig, FPRoundingMode::RTZ, truncated),
              0x007FFFFFu);
    EXPECT_TRUE(truncated.underflow);
}

TEST(RoundingTest, MantissaCarryBumpsExponent) {
    FpFlags flags;
    // 2^24 - 1 + 0.5 → 平局到偶数 2^24
    const uint128_t sig = (uint128_t{1} << 25) - 1;
    EXPECT_EQ(roundPack(FpFormat::SINGLE, false, 127 - 1, sig, FPRoundingMode::RNE, flags), 0x4B800000u);
    EXPECT_TRUE(flags.inexact);
}

TEST(RoundingTest, AlignedCancellationGivesSignedZero) {
    const AlignedOperands aligned = alignOperands(3, 0, 3, 0);
    EXPECT_EQ(aligned.first, aligned.second);

    FpFlags flags;
    EXPECT_EQ(addAlignedAndRound(FpFormat::DOUBLE, aligned, false, true, FPRoundingMode::RNE, flags), 0u);
    EXPECT_EQ(addAlignedAndRound(FpFormat::DOUBLE, aligned, false, true, FPRoundingMode::RDN, flags),
              0x8000000000000000ULL);
    EXPECT_FALSE(flags.any());
}

TEST(RoundingTest, AlignmentKeepsStickyOfSmallOperand) {
    // 1 + 2^-200：小数只贡献 sticky
    const AlignedOperands aligned = alignOperands(1, 0, 1, -200);
    FpFlags flags;
    EXPECT_EQ(addAlignedAndRound(FpFormat::DOUBLE, aligned, false, false, FPRoundingMode::RNE, flags),
              0x3FF0000000000000ULL);
    EXPECT_TRUE(flags.inexact);

    FpFlags up;
    EXPECT_EQ(addAlignedAndRound(FpFormat::DOUBLE, aligned, false, false, FPRoundingMode::RUP, up),
              0x3FF0000000000001ULL);
}

} // namespace rvfpu
