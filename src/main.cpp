#include "system/simulator.h"
#include "common/debug_types.h"
#include <iostream>
#include <string>

using namespace rvfpu;

void printUsage(const char* programName) {
    std::cout << "用法: " << programName << " [选项] <指令序列文件>\n";
    std::cout << "选项:\n";
    std::cout << "  -h, --help                   显示此帮助信息\n";
    std::cout << "  --bits-per-tick=N            除法/开方每周期产生的位数 (1-16，默认4)\n";
    std::cout << "  --no-double                  禁用D扩展\n";
    std::cout << "  --max-cycles=N               最大执行周期数（默认100000）\n";
    std::cout << "\n";
    std::cout << "调试选项:\n";
    std::cout << "  --debug-flags=<flags>        指定调试分类（用逗号分隔）\n";
    std::cout << "  --debug-cycles=<start>-<end> 指定调试周期范围\n";
    std::cout << "  --debug-preset=<preset>      使用预设调试配置\n";
    std::cout << "  --debug-file=<file>          调试日志输出到文件\n";
    std::cout << "  --debug-no-console           禁用控制台输出（仅文件输出）\n";
    std::cout << "\n";
    std::cout << "可用的调试预设:\n";
    std::cout << "  basic      基础流水线 (decode, writeback)\n";
    std::cout << "  pipeline   完整流水线 (decode, execute, memory, writeback)\n";
    std::cout << "  hazard     冒险与停顿 (hazard, stall, flush)\n";
    std::cout << "  divsqrt    除法/开方 (execute, divsqrt, stall)\n";
    std::cout << "  detailed   所有调试信息\n";
    std::cout << "  minimal    最小调试 (writeback)\n";
    std::cout << "\n";
    std::cout << "指令序列格式（每行一项，# 之后为注释）:\n";
    std::cout << "  .frm <0-7>                   设置全局舍入模式\n";
    std::cout << "  .freg f<N> <hex>             预置浮点寄存器\n";
    std::cout << "  <hex> [int=<hex>] [load=<hex>]  发射一条指令（int 可带负号）\n";
    std::cout << "\n";
    std::cout << "示例:\n";
    std::cout << "  " << programName << " fma.trace\n";
    std::cout << "  " << programName << " --debug-preset=hazard fma.trace\n";
    std::cout << "  " << programName << " --bits-per-tick=1 --debug-flags=divsqrt div.trace\n";
}

int main(int argc, char* argv[]) {
    std::cout << "RISC-V 流水线浮点单元模拟器 v1.0\n";
    std::cout << "=================================\n\n";

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string filename;
    FpuConfig config;
    uint64_t maxCycles = 100000;

    bool debugMode = false;
    bool debugNoConsole = false;
    std::string debugCategories;
    std::string debugCycles;
    std::string debugPreset;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg.find("--bits-per-tick=") == 0) {
                config.divsqrt_bits_per_tick = static_cast<unsigned>(std::stoul(arg.substr(16)));
            } else if (arg == "--no-double") {
                config.enabled_extensions &= ~static_cast<uint32_t>(Extension::D);
            } else if (arg.find("--max-cycles=") == 0) {
                maxCycles = std::stoull(arg.substr(13));
            } else if (arg.find("--debug-flags=") == 0) {
                debugCategories = arg.substr(14);
                debugMode = true;
            } else if (arg.find("--debug-cycles=") == 0) {
                debugCycles = arg.substr(15);
                debugMode = true;
            } else if (arg.find("--debug-preset=") == 0) {
                debugPreset = arg.substr(15);
                debugMode = true;
            } else if (arg.find("--debug-file=") == 0) {
                std::string logFile = arg.substr(13);
                DebugManager::getInstance().setLogFile(logFile);
                DebugManager::getInstance().setOutputToFile(true);
                debugMode = true;
                debugNoConsole = true;
                std::cout << "调试日志将输出到文件: " << logFile << "\n";
            } else if (arg == "--debug-no-console") {
                debugMode = true;
                debugNoConsole = true;
            } else if (arg[0] == '-') {
                std::cerr << "错误: 未知选项 " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            } else if (filename.empty()) {
                filename = arg;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "错误: 参数解析失败: " << e.what() << "\n";
        return 1;
    }

    if (filename.empty()) {
        std::cerr << "错误: 未指定指令序列文件\n";
        return 1;
    }

    try {
        auto& debugManager = DebugManager::getInstance();
        if (debugMode) {
            debugManager.setOutputToConsole(!debugNoConsole);
            if (!debugPreset.empty()) {
                if (debugManager.setPreset(debugPreset)) {
                    std::cout << "使用调试预设: " << debugPreset << "\n";
                } else {
                    std::cerr << "警告: 未知的调试预设 " << debugPreset << "\n";
                }
            } else if (!debugCategories.empty()) {
                debugManager.setCategories(debugCategories);
                std::cout << "使用调试分类: " << debugCategories << "\n";
            }

            if (!debugCycles.empty()) {
                size_t dashPos = debugCycles.find('-');
                if (dashPos != std::string::npos) {
                    uint64_t startCycle = std::stoull(debugCycles.substr(0, dashPos));
                    uint64_t endCycle = UINT64_MAX;

                    std::string endStr = debugCycles.substr(dashPos + 1);
                    if (!endStr.empty() && endStr != "end" && endStr != "END") {
                        endCycle = std::stoull(endStr);
                    }

                    debugManager.setCycleRange(startCycle, endCycle);
                    std::cout << "调试周期范围: " << startCycle << "-" <<
                        (endCycle == UINT64_MAX ? "END" : std::to_string(endCycle)) << "\n";
                } else {
                    std::cerr << "警告: 无效的周期范围格式，应为 start-end\n";
                }
            }

            std::cout << "\n" << debugManager.getConfigInfo() << "\n";
        } else {
            debugManager.setOutputToConsole(false);
            debugManager.setOutputToFile(false);
        }

        const TraceProgram program = TraceProgram::loadFromFile(filename);
        std::cout << "加载指令序列: " << filename << " (" << program.instructionCount() << " 条指令)\n";
        std::cout << "D扩展: " << (config.isExtensionEnabled(Extension::D) ? "启用" : "禁用")
                  << "，除法每周期 " << config.divsqrt_bits_per_tick << " 位\n\n";

        Simulator simulator(config);
        simulator.loadTrace(program);
        simulator.run(maxCycles);

        std::cout << "提交记录:\n";
        for (const auto& record : simulator.getCommits()) {
            std::cout << fmt::format("  [c={:>4}] {}{:<2} = 0x{:016x}  fflags={}\n", record.cycle,
                                     record.fp_write ? "f" : "x", static_cast<int>(record.rd),
                                     record.value, FpFlags::fromBits(record.fflags).toString());
        }
        for (const auto& data : simulator.getStores()) {
            std::cout << fmt::format("  存储数据 0x{:016x}\n", data);
        }
        std::cout << "\n";

        simulator.dumpRegisters();
        simulator.printStatistics();
        debugManager.closeLogFile();

        return simulator.isHaltedByCycleLimit() ? 2 : 0;
    } catch (const FpuException& e) {
        std::cerr << "错误: " << e.what() << "\n";
        return 1;
    }
}
