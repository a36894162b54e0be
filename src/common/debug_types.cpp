#include "common/debug_types.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_map>
#include <vector>

namespace rvfpu {

namespace {

// 调试预设：常用的分类组合
const std::unordered_map<std::string, std::vector<std::string>> kPresets = {
    // 基础预设：只看指令进出流水线
    {"basic", {"DECODE", "WRITEBACK"}},
    // 流水线预设：完整的流水线阶段
    {"pipeline", {"DECODE", "EXECUTE", "MEMORY", "WRITEBACK"}},
    // 冒险预设：前递与停顿
    {"hazard", {"DECODE", "EXECUTE", "HAZARD", "STALL", "FLUSH"}},
    // 除法/开方预设：迭代单元握手
    {"divsqrt", {"EXECUTE", "DIVSQRT", "STALL"}},
    {"detailed", {"DECODE", "EXECUTE", "MEMORY", "WRITEBACK", "HAZARD", "DIVSQRT", "STALL", "FLUSH"}},
    {"minimal", {"WRITEBACK"}},
};

std::string trimUpper(const std::string& input) {
    const auto begin = input.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = input.find_last_not_of(" \t");
    std::string result = input.substr(begin, end - begin + 1);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return result;
}

} // namespace

std::string LogRecord::format() const {
    const std::string cycle_part = cycle ? fmt::format(" [c={}]", *cycle) : "";
    return fmt::format("[{}]{} {}", stage, cycle_part, message);
}

void DebugManager::setLogFile(const std::string& filename) {
    closeLogFile();
    log_file_.open(filename, std::ios::out | std::ios::trunc);
    if (!log_file_.is_open()) {
        std::cerr << "Warning: Cannot open log file: " << filename << std::endl;
    }
}

void DebugManager::closeLogFile() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void DebugManager::setCategories(const std::string& categories) {
    enabled_categories_.clear();
    std::size_t start = 0;
    while (start <= categories.size()) {
        const std::size_t comma = std::min(categories.find(',', start), categories.size());
        const std::string category = trimUpper(categories.substr(start, comma - start));
        if (!category.empty()) {
            enabled_categories_.insert(category);
        }
        start = comma + 1;
    }
}

bool DebugManager::setPreset(const std::string& preset) {
    const auto it = kPresets.find(preset);
    if (it == kPresets.end()) {
        return false;
    }
    enabled_categories_.clear();
    enabled_categories_.insert(it->second.begin(), it->second.end());
    return true;
}

void DebugManager::setCycleRange(uint64_t start, uint64_t end) {
    debug_start_cycle_ = start;
    debug_end_cycle_ = end;
}

// 未启用任何分类时只输出 SYSTEM，避免流水线日志淹没测试输出
bool DebugManager::isEnabled(const std::string& stage, const std::optional<uint64_t>& cycle) const {
    if (stage != "SYSTEM" && enabled_categories_.count(stage) == 0) {
        return false;
    }
    if (cycle && (*cycle < debug_start_cycle_ || *cycle > debug_end_cycle_)) {
        return false;
    }
    return output_to_console_ || output_to_file_;
}

void DebugManager::log(const std::string& stage, const std::string& message) {
    LogRecord record{stage, message, std::nullopt};
    if (has_global_cycle_) {
        record.cycle = global_cycle_;
    }
    if (!isEnabled(stage, record.cycle)) {
        return;
    }

    const std::string line = record.format();
    if (output_to_console_) {
        std::cout << line << std::endl;
    }
    if (output_to_file_ && log_file_.is_open()) {
        log_file_ << line << std::endl;
    }
}

std::string DebugManager::getConfigInfo() const {
    std::vector<std::string> sorted(enabled_categories_.begin(), enabled_categories_.end());
    std::sort(sorted.begin(), sorted.end());

    std::string info = "Debug Configuration:\n  Categories: ";
    if (sorted.empty()) {
        info += "NONE";
    }
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        info += (i == 0 ? "" : ", ") + sorted[i];
    }
    info += fmt::format("\n  Cycle Range: {}-", debug_start_cycle_);
    info += debug_end_cycle_ == UINT64_MAX ? std::string("END") : std::to_string(debug_end_cycle_);
    return info;
}

} // namespace rvfpu
