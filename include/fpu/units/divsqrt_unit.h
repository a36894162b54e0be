#pragma once

#include "fpu/fp_flags.h"
#include "fpu/unpack.h"

namespace rvfpu {

enum class DivSqrtState : uint8_t {
    IDLE,
    BUSY,
    DONE
};

struct DivSqrtRequest {
    bool sqrt = false;
    FpFormat format = FpFormat::DOUBLE;
    FPRoundingMode rm = FPRoundingMode::RNE;
    UnpackedOperand dividend;   // 开方时为被开方数
    UnpackedOperand divisor;    // 开方时忽略
};

/**
 * 迭代除法/开方单元
 *
 * 逐位恢复余数算法，每个周期产生 bits_per_tick 位商（或根）。
 * start() 之后每次 step() 推进一个周期，完成后 done() 保持为真，
 * 直到 acknowledge() 取走结果回到 IDLE。特殊操作数一个周期完成。
 */
class DivSqrtUnit {
public:
    explicit DivSqrtUnit(unsigned bits_per_tick = 4);

    void start(const DivSqrtRequest& request);
    void step();
    UnitResult acknowledge();
    void reset();

    bool idle() const { return state_ == DivSqrtState::IDLE; }
    bool busy() const { return state_ == DivSqrtState::BUSY; }
    bool done() const { return state_ == DivSqrtState::DONE; }
    DivSqrtState state() const { return state_; }

    const UnitResult& result() const { return result_; }
    unsigned bitsPerTick() const { return bits_per_tick_; }
    unsigned remainingIterations() const { return remaining_; }

    // 一次性算出结果（不经过状态机）
    static UnitResult compute(const DivSqrtRequest& request);

private:
    bool resolveSpecial(const DivSqrtRequest& request);
    void prepareDivide(const DivSqrtRequest& request);
    void prepareSqrt(const DivSqrtRequest& request);
    void iterate();
    void finish();

    unsigned bits_per_tick_;
    DivSqrtState state_ = DivSqrtState::IDLE;

    bool sqrt_ = false;
    FpFormat format_ = FpFormat::DOUBLE;
    FPRoundingMode rm_ = FPRoundingMode::RNE;
    bool sign_ = false;
    bool special_ = false;

    // 除法：partial_remainder_ / divisor_；开方：radicand_ 按位对消耗
    uint128_t partial_remainder_ = 0;
    uint64_t divisor_ = 0;
    uint128_t radicand_ = 0;
    uint128_t quotient_ = 0;
    unsigned remaining_ = 0;
    int32_t result_exponent_ = 0;

    UnitResult result_;
};

} // namespace rvfpu
