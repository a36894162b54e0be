#pragma once

#include <string>
#include <cstdint>
#include <unordered_set>
#include <fstream>
#include <fmt/format.h>
#include <fmt/printf.h>
#include <optional>

namespace rvfpu {

/**
 * 一条调试日志: [STAGE] [c=周期] message
 */
struct LogRecord {
    std::string stage;
    std::string message;
    std::optional<uint64_t> cycle;

    std::string format() const;
};

/**
 * 调试管理器
 * 按分类和周期范围过滤流水线日志，输出到控制台和/或文件
 */
class DebugManager {
public:
    static DebugManager& getInstance() {
        static DebugManager instance;
        return instance;
    }

    void setLogFile(const std::string& filename);
    void closeLogFile();
    void setOutputToFile(bool enable) { output_to_file_ = enable; }
    void setOutputToConsole(bool enable) { output_to_console_ = enable; }

    // 逗号分隔，大小写不敏感；空串表示只保留 SYSTEM
    void setCategories(const std::string& categories);
    // 未知预设返回 false，分类保持不变
    bool setPreset(const std::string& preset);
    void setCycleRange(uint64_t start, uint64_t end = UINT64_MAX);

    // 由流水线每个周期更新一次
    void setGlobalCycle(uint64_t cycle) {
        global_cycle_ = cycle;
        has_global_cycle_ = true;
    }
    void clearGlobalContext() { has_global_cycle_ = false; }

    bool isEnabled(const std::string& stage, const std::optional<uint64_t>& cycle) const;
    void log(const std::string& stage, const std::string& message);

    std::string getConfigInfo() const;

private:
    DebugManager() = default;
    DebugManager(const DebugManager&) = delete;
    DebugManager& operator=(const DebugManager&) = delete;

    std::unordered_set<std::string> enabled_categories_;
    uint64_t debug_start_cycle_ = 0;
    uint64_t debug_end_cycle_ = UINT64_MAX;
    std::ofstream log_file_;
    bool output_to_file_ = false;
    bool output_to_console_ = true;
    uint64_t global_cycle_ = 0;
    bool has_global_cycle_ = false;
};

} // namespace rvfpu

#define LOG_DEBUG(stage, ...) do { \
    const auto message = fmt::sprintf(__VA_ARGS__); \
    ::rvfpu::DebugManager::getInstance().log(#stage, message); \
} while (0)

// 兼容旧接口
#define dprintf(stage, ...) LOG_DEBUG(stage, __VA_ARGS__)
