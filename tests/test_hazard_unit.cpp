#include <gtest/gtest.h>
#include "fpu/hazard_unit.h"

namespace rvfpu {

namespace {

HazardProducer producer(RegNum rd, ResultSource source, bool fp_write = true) {
    HazardProducer p;
    p.valid = true;
    p.rd = rd;
    p.fp_write = fp_write;
    p.source = source;
    return p;
}

const std::array<bool, 3> kAllUsed{true, true, true};

} // namespace

TEST(HazardUnitTest, NoProducersReadsRegisterFile) {
    const HazardDecision decision = HazardUnit::resolve({1, 2, 3}, kAllUsed, HazardProducer{}, HazardProducer{});
    EXPECT_FALSE(decision.stall);
    for (ForwardSelect select : decision.select) {
        EXPECT_EQ(select, ForwardSelect::REGISTER_FILE);
    }
}

TEST(HazardUnitTest, ForwardFromMemoryAndWriteback) {
    const HazardDecision decision = HazardUnit::resolve({5, 6, 7}, kAllUsed,
                                                        producer(5, ResultSource::FMA),
                                                        producer(7, ResultSource::ADD_CONVERT));
    EXPECT_FALSE(decision.stall);
    EXPECT_EQ(decision.select[0], ForwardSelect::MEMORY);
    EXPECT_EQ(decision.select[1], ForwardSelect::REGISTER_FILE);
    EXPECT_EQ(decision.select[2], ForwardSelect::WRITEBACK);
}

TEST(HazardUnitTest, MemoryHasPriorityOverWriteback) {
    const HazardDecision decision = HazardUnit::resolve({4, 4, 0}, {true, true, false},
                                                        producer(4, ResultSource::MEMORY_STAGE),
                                                        producer(4, ResultSource::FMA));
    EXPECT_EQ(decision.select[0], ForwardSelect::MEMORY) << "访存级的值更新";
    EXPECT_EQ(decision.select[1], ForwardSelect::MEMORY);
}

TEST(HazardUnitTest, LoadInMemoryStalls) {
    const HazardDecision decision = HazardUnit::resolve({3, 1, 2}, kAllUsed,
                                                        producer(3, ResultSource::LOAD), HazardProducer{});
    EXPECT_TRUE(decision.stall);

    const HazardDecision from_wb = HazardUnit::resolve({3, 1, 2}, kAllUsed, HazardProducer{},
                                                       producer(3, ResultSource::LOAD));
    EXPECT_FALSE(from_wb.stall) << "加载到达写回级后可以前递";
    EXPECT_EQ(from_wb.select[0], ForwardSelect::WRITEBACK);
}

TEST(HazardUnitTest, StalledWritebackLoadStalls) {
    HazardProducer load = producer(3, ResultSource::LOAD);
    load.stalled = true;
    const HazardDecision decision = HazardUnit::resolve({3, 1, 2}, kAllUsed, HazardProducer{}, load);
    EXPECT_TRUE(decision.stall) << "加载数据在写回级提交前不可用";

    HazardProducer add = producer(3, ResultSource::ADD_CONVERT);
    add.stalled = true;
    const HazardDecision forwarded = HazardUnit::resolve({3, 1, 2}, kAllUsed, HazardProducer{}, add);
    EXPECT_FALSE(forwarded.stall);
    EXPECT_EQ(forwarded.select[0], ForwardSelect::WRITEBACK);
}

TEST(HazardUnitTest, UnusedOperandsIgnored) {
    const HazardDecision decision = HazardUnit::resolve({3, 3, 3}, {false, false, false},
                                                        producer(3, ResultSource::LOAD),
                                                        producer(3, ResultSource::FMA));
    EXPECT_FALSE(decision.stall);
    EXPECT_EQ(decision.select[0], ForwardSelect::REGISTER_FILE);
}

TEST(HazardUnitTest, IntegerWritesDoNotForward) {
    const HazardDecision decision = HazardUnit::resolve({9, 0, 0}, {true, false, false},
                                                        producer(9, ResultSource::MEMORY_STAGE, false),
                                                        producer(9, ResultSource::MEMORY_STAGE, false));
    EXPECT_EQ(decision.select[0], ForwardSelect::REGISTER_FILE) << "整数结果写的是整数寄存器";
}

TEST(HazardUnitTest, SelectNames) {
    EXPECT_STREQ(HazardUnit::selectName(ForwardSelect::REGISTER_FILE), "RF");
    EXPECT_STREQ(HazardUnit::selectName(ForwardSelect::MEMORY), "MEM");
    EXPECT_STREQ(HazardUnit::selectName(ForwardSelect::WRITEBACK), "WB");
}

} // namespace rvfpu
