#include <gtest/gtest.h>
#include "common/debug_types.h"

namespace rvfpu {

/**
 * DebugManager 是全局单例，每个用例结束后恢复默认过滤条件
 */
class DebugManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        manager_.setCategories("");
        manager_.setCycleRange(0);
        manager_.setOutputToConsole(true);
        manager_.setOutputToFile(false);
        manager_.clearGlobalContext();
    }

    DebugManager& manager_ = DebugManager::getInstance();
};

TEST_F(DebugManagerTest, OnlySystemWithoutCategories) {
    manager_.setCategories("");
    EXPECT_TRUE(manager_.isEnabled("SYSTEM", std::nullopt));
    EXPECT_FALSE(manager_.isEnabled("HAZARD", std::nullopt));
}

TEST_F(DebugManagerTest, CategoryListIsTrimmedAndCaseInsensitive) {
    manager_.setCategories(" hazard ,Stall,,divsqrt");
    EXPECT_TRUE(manager_.isEnabled("HAZARD", std::nullopt));
    EXPECT_TRUE(manager_.isEnabled("STALL", std::nullopt));
    EXPECT_TRUE(manager_.isEnabled("DIVSQRT", std::nullopt));
    EXPECT_FALSE(manager_.isEnabled("DECODE", std::nullopt));
}

TEST_F(DebugManagerTest, PresetSelectsCategories) {
    EXPECT_TRUE(manager_.setPreset("divsqrt"));
    EXPECT_TRUE(manager_.isEnabled("DIVSQRT", std::nullopt));
    EXPECT_FALSE(manager_.isEnabled("WRITEBACK", std::nullopt));

    EXPECT_FALSE(manager_.setPreset("nonexistent"));
    EXPECT_TRUE(manager_.isEnabled("DIVSQRT", std::nullopt)) << "未知预设不改变分类";
}

TEST_F(DebugManagerTest, CycleRangeFilter) {
    manager_.setCategories("execute");
    manager_.setCycleRange(10, 20);
    EXPECT_FALSE(manager_.isEnabled("EXECUTE", uint64_t{9}));
    EXPECT_TRUE(manager_.isEnabled("EXECUTE", uint64_t{10}));
    EXPECT_TRUE(manager_.isEnabled("EXECUTE", uint64_t{20}));
    EXPECT_FALSE(manager_.isEnabled("EXECUTE", uint64_t{21}));
    EXPECT_TRUE(manager_.isEnabled("EXECUTE", std::nullopt)) << "无周期上下文时不按周期过滤";
}

TEST_F(DebugManagerTest, NoSinkDisablesOutput) {
    manager_.setOutputToConsole(false);
    manager_.setOutputToFile(false);
    EXPECT_FALSE(manager_.isEnabled("SYSTEM", std::nullopt));
}

TEST_F(DebugManagerTest, RecordFormat) {
    EXPECT_EQ((LogRecord{"HAZARD", "f5 前递", uint64_t{7}}.format()), "[HAZARD] [c=7] f5 前递");
    EXPECT_EQ((LogRecord{"SYSTEM", "启动", std::nullopt}.format()), "[SYSTEM] 启动");
}

TEST_F(DebugManagerTest, ConfigInfoListsSortedCategories) {
    manager_.setCategories("stall,hazard");
    manager_.setCycleRange(5);
    EXPECT_EQ(manager_.getConfigInfo(),
              "Debug Configuration:\n  Categories: HAZARD, STALL\n  Cycle Range: 5-END");
}

} // namespace rvfpu
