#pragma once

#include "core/csr_utils.h"
#include "fpu/fpu_core.h"
#include "system/trace_program.h"
#include <deque>
#include <vector>

namespace rvfpu {

/**
 * 一条提交记录（用于打印和测试）
 */
struct CommitRecord {
    uint64_t cycle = 0;
    bool fp_write = false;
    bool int_write = false;
    RegNum rd = 0;
    uint64_t value = 0;
    uint8_t fflags = 0;
};

/**
 * 指令序列驱动器
 * 扮演外部整数流水线：按顺序发射指令、在译码停顿时保持、提供加载数据，
 * 并把提交的异常标志累加到 fcsr
 */
class Simulator {
public:
    explicit Simulator(const FpuConfig& config = FpuConfig{});
    ~Simulator() = default;

    // 禁用拷贝构造和赋值
    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    void loadTrace(const TraceProgram& program);

    // 执行控制
    void step();
    void run(uint64_t max_cycles);
    bool isFinished() const;
    bool isHaltedByCycleLimit() const { return halted_by_cycle_limit_; }

    // 状态查询
    const FpuCore& getCore() const { return core_; }
    FpuCore& getCore() { return core_; }
    const csr::CsrFile& getCsr() const { return csr_; }
    const std::vector<CommitRecord>& getCommits() const { return commits_; }
    uint64_t getIllegalCount() const { return illegal_count_; }
    const std::vector<uint64_t>& getStores() const { return stores_; }

    // 调试功能
    void dumpRegisters() const;
    void printStatistics() const;

private:
    FpuCore core_;
    csr::CsrFile csr_{};
    std::vector<TraceEntry> entries_;
    std::size_t next_entry_ = 0;
    std::deque<uint64_t> pending_loads_;
    std::vector<CommitRecord> commits_;
    std::vector<uint64_t> stores_;
    uint64_t illegal_count_ = 0;
    bool halted_by_cycle_limit_ = false;
};

} // namespace rvfpu
