#include <gtest/gtest.h>
#include "fpu/stages/execute_stage.h"
#include "fpu/fpu_state.h"
#include "fpu_test_utils.h"
#include <memory>

namespace rvfpu {

using namespace test;

/**
 * ExecuteStage 单元测试：直接构造 FpuState 并手工填写译码/执行锁存器
 */
class ExecuteStageTest : public ::testing::Test {
protected:
    FpuConfig config;
    std::unique_ptr<FpuState> state_;
    std::unique_ptr<ExecuteStage> execute_stage_;
    uint64_t sequence_ = 0;

    void SetUp() override {
        state_ = std::make_unique<FpuState>(config);
        execute_stage_ = std::make_unique<ExecuteStage>();
    }

    void TearDown() override {
        execute_stage_.reset();
        state_.reset();
    }

    void place(Instruction inst, const std::array<RegValue, 3>& operands) {
        DecodeExecuteLatch latch;
        latch.inst = state_->decoder.decode(inst, 0);
        ASSERT_TRUE(latch.inst.tags.legal);
        latch.operands = operands;
        latch.sequence = sequence_++;
        state_->decode_execute.advance(latch);
    }

    void tick() {
        state_->beginCycle();
        execute_stage_->execute(*state_);
    }
};

// ========== 基本接口 ==========

TEST_F(ExecuteStageTest, BasicInterface) {
    PipelineStage* stage = execute_stage_.get();
    EXPECT_STREQ(stage->get_stage_name(), "EXECUTE") << "阶段名称应该是EXECUTE";
    EXPECT_NO_THROW(execute_stage_->reset());
    EXPECT_FALSE(execute_stage_->divisionPending());
}

TEST_F(ExecuteStageTest, EmptySlotDoesNothing) {
    tick();
    EXPECT_TRUE(state_->execute_memory.empty());
    EXPECT_FALSE(state_->execute_stalled);
}

// ========== 单周期推进 ==========

TEST_F(ExecuteStageTest, AddAdvancesToMemoryLatch) {
    place(fadd(kFmtD, 5, 1, 2, 0), {boxedD(1.5), boxedD(2.25), 0});
    tick();
    ASSERT_TRUE(state_->execute_memory.valid());
    EXPECT_TRUE(state_->decode_execute.empty());

    const ExecuteMemoryLatch& out = state_->execute_memory.get();
    EXPECT_EQ(out.tags.op, FpuOp::FADD);
    EXPECT_EQ(out.rd, 5);
    EXPECT_EQ(AddConvertUnit::stage2(out.add_convert).value, boxedD(3.75));
}

TEST_F(ExecuteStageTest, OccupiedOutputLatchStalls) {
    place(fadd(kFmtD, 5, 1, 2, 0), {boxedD(1.0), boxedD(1.0), 0});
    state_->execute_memory.advance(ExecuteMemoryLatch{});
    tick();
    EXPECT_TRUE(state_->execute_stalled);
    EXPECT_TRUE(state_->decode_execute.valid()) << "停顿时保持输入";
}

TEST_F(ExecuteStageTest, ExternalStallHoldsInstruction) {
    place(fsgnj(kFmtD, 3, 1, 2, 0), {boxedD(1.0), boxedD(-1.0), 0});
    state_->beginCycle();
    state_->inputs.setStall(PipelineStageId::EXECUTE);
    execute_stage_->execute(*state_);
    EXPECT_TRUE(state_->execute_stalled);
    EXPECT_TRUE(state_->execute_memory.empty());
}

// ========== 前递 ==========

TEST_F(ExecuteStageTest, ForwardsFromMemoryStage) {
    place(fsgnj(kFmtD, 3, 7, 2, 0), {boxedD(1.0), boxedD(-1.0), 0});
    state_->beginCycle();
    state_->memory_forward.producer = HazardProducer{true, 7, true, ResultSource::FMA};
    state_->memory_forward.value = boxedD(8.0);
    execute_stage_->execute(*state_);

    ASSERT_TRUE(state_->execute_memory.valid());
    EXPECT_EQ(state_->execute_memory.get().sign_inject.value, boxedD(-8.0)) << "rs1 使用访存级前递值";
}

TEST_F(ExecuteStageTest, LoadInMemoryStageStalls) {
    place(fsgnj(kFmtD, 3, 7, 2, 0), {boxedD(1.0), boxedD(-1.0), 0});
    state_->beginCycle();
    state_->memory_forward.producer = HazardProducer{true, 7, true, ResultSource::LOAD};
    execute_stage_->execute(*state_);
    EXPECT_TRUE(state_->execute_stalled);
    EXPECT_TRUE(state_->execute_memory.empty());
}

TEST_F(ExecuteStageTest, StoreCarriesForwardedData) {
    place(fstore(kFmtD, 4, 1, 8), {0, boxedD(0.0), 0});
    state_->beginCycle();
    state_->writeback_forward.producer = HazardProducer{true, 4, true, ResultSource::ADD_CONVERT};
    state_->writeback_forward.value = boxedD(6.5);
    execute_stage_->execute(*state_);
    ASSERT_TRUE(state_->execute_memory.valid());
    EXPECT_EQ(state_->execute_memory.get().store_data, boxedD(6.5));
}

// ========== 除法/开方握手 ==========

TEST_F(ExecuteStageTest, DivisionStallsUntilDone) {
    place(fdiv(kFmtD, 4, 1, 2, 0), {boxedD(10.0), boxedD(4.0), 0});
    tick();
    EXPECT_TRUE(execute_stage_->divisionPending());
    EXPECT_TRUE(state_->divsqrt.busy());
    EXPECT_TRUE(state_->execute_stalled);

    int ticks = 1;
    while (state_->execute_memory.empty()) {
        tick();
        ASSERT_LT(++ticks, 100);
    }
    EXPECT_EQ(ticks, 15) << "启动一个周期 + 14 个迭代周期";
    EXPECT_TRUE(state_->divsqrt.idle());
    EXPECT_FALSE(execute_stage_->divisionPending());
    EXPECT_EQ(state_->execute_memory.get().divsqrt.value, boxedD(2.5));
}

TEST_F(ExecuteStageTest, FlushDuringDivisionDiscardsResult) {
    place(fdiv(kFmtD, 4, 1, 2, 0), {boxedD(1.0), boxedD(3.0), 0});
    tick();
    ASSERT_TRUE(execute_stage_->divisionPending());

    execute_stage_->flush(*state_);
    EXPECT_TRUE(state_->decode_execute.empty());
    EXPECT_TRUE(execute_stage_->discardingDivision());
    EXPECT_TRUE(state_->divsqrt.busy()) << "迭代中的除法不中止";

    // 新的非除法指令要等除法单元空闲
    place(fadd(kFmtD, 5, 1, 2, 0), {boxedD(1.0), boxedD(1.0), 0});
    int ticks = 0;
    while (state_->execute_memory.empty()) {
        tick();
        ASSERT_LT(++ticks, 100);
    }
    EXPECT_FALSE(execute_stage_->discardingDivision());
    EXPECT_TRUE(state_->divsqrt.idle());
    EXPECT_EQ(state_->execute_memory.get().tags.op, FpuOp::FADD);
}

TEST_F(ExecuteStageTest, FlushWithoutInstructionIsHarmless) {
    EXPECT_NO_THROW(execute_stage_->flush(*state_));
    EXPECT_FALSE(execute_stage_->discardingDivision());
}

TEST_F(ExecuteStageTest, ResetClearsDivisionOwnership) {
    place(fsqrt(kFmtD, 4, 1, 0), {boxedD(2.0), 0, 0});
    tick();
    ASSERT_TRUE(execute_stage_->divisionPending());
    execute_stage_->reset();
    EXPECT_FALSE(execute_stage_->divisionPending());
}

} // namespace rvfpu
