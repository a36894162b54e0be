#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <stdexcept>

namespace rvfpu {

// 基本数据类型定义
using uint64_t = std::uint64_t;
using int64_t = std::int64_t;
using uint32_t = std::uint32_t;
using int32_t = std::int32_t;
using uint16_t = std::uint16_t;
using int16_t = std::int16_t;
using uint8_t = std::uint8_t;
using int8_t = std::int8_t;

// 寄存器编号类型
using RegNum = uint8_t;

// 寄存器值类型（浮点寄存器统一为64位，单精度值以NaN-boxing形式存放）
using RegValue = uint64_t;

// 指令类型
using Instruction = uint32_t;

// 128位中间结果（融合乘加的乘积、对齐窗口等）
using uint128_t = unsigned __int128;

// RISC-V 浮点相关操作码
enum class Opcode : uint8_t {
    LOAD_FP     = 0b0000111,    // FLW, FLD
    STORE_FP    = 0b0100111,    // FSW, FSD

    // R4型融合乘加指令
    FMADD       = 0b1000011,    // 融合乘加 (FMADD.S/D)
    FMSUB       = 0b1000111,    // 融合乘减 (FMSUB.S/D)
    FNMSUB      = 0b1001011,    // 融合负乘减 (FNMSUB.S/D)
    FNMADD      = 0b1001111,    // 融合负乘加 (FNMADD.S/D)

    // 浮点运算指令 (F/D扩展)
    OP_FP       = 0b1010011
};

// 功能码 funct3
enum class Funct3 : uint8_t {
    // 浮点加载/存储宽度
    FLW     = 0b010,    // 加载单精度浮点数
    FLD     = 0b011,    // 加载双精度浮点数
    FSW     = 0b010,    // 存储单精度浮点数
    FSD     = 0b011,    // 存储双精度浮点数

    // 浮点比较指令
    FEQ     = 0b010,
    FLT     = 0b001,
    FLE     = 0b000,

    // 浮点符号注入指令
    FSGNJ   = 0b000,    // 符号注入
    FSGNJN  = 0b001,    // 符号注入取反
    FSGNJX  = 0b010,    // 符号注入异或

    // 浮点最小值/最大值指令
    FMIN    = 0b000,    // 最小值
    FMAX    = 0b001,    // 最大值

    // 浮点移动和分类指令
    FMV_CLASS = 0b000,  // FMV.X.W, FMV.X.D (rs2=00000)
    FCLASS    = 0b001   // FCLASS.S, FCLASS.D (rs2=00000)
};

// OP_FP 的 funct5 字段（funct7[6:2]），funct7[1:0] 为格式
enum class Funct5 : uint8_t {
    FADD      = 0b00000,
    FSUB      = 0b00001,
    FMUL      = 0b00010,
    FDIV      = 0b00011,
    FSGNJ     = 0b00100,
    FMIN_FMAX = 0b00101,
    FCVT_FP   = 0b01000,    // FCVT.S.D / FCVT.D.S
    FSQRT     = 0b01011,
    FCMP      = 0b10100,
    FCVT_INT  = 0b11000,    // 浮点转整数 (rs2字段区分W/WU/L/LU)
    FCVT_FROM_INT = 0b11010, // 整数转浮点 (rs2字段区分W/WU/L/LU)
    FMV_X_CLASS = 0b11100,  // FMV.X.W / FMV.X.D (funct3=000), FCLASS (funct3=001)
    FMV_FROM_X  = 0b11110   // FMV.W.X / FMV.D.X
};

// 扩展支持标志
enum class Extension : uint32_t {
    F    = 0x8,     // 单精度浮点扩展
    D    = 0x10     // 双精度浮点扩展
};

// 浮点舍入模式（RISC-V frm 编码）
enum class FPRoundingMode : uint8_t {
    RNE = 0b000,    // Round to Nearest, ties to Even
    RTZ = 0b001,    // Round towards Zero
    RDN = 0b010,    // Round Down (towards -∞)
    RUP = 0b011,    // Round Up (towards +∞)
    RMM = 0b100,    // Round to Nearest, ties to Max Magnitude
    DYN = 0b111     // Dynamic rounding mode
};

// 流水线阶段编号（用于外部 stall/flush 信号）
enum class PipelineStageId : uint8_t {
    DECODE = 0,
    EXECUTE = 1,
    MEMORY = 2,
    WRITEBACK = 3
};

constexpr std::size_t NUM_PIPELINE_STAGES = 4;

// 异常类型
class FpuException : public std::runtime_error {
public:
    explicit FpuException(const std::string& message) : std::runtime_error(message) {}
};

class RegisterIndexException : public FpuException {
public:
    explicit RegisterIndexException(const std::string& message)
        : FpuException("寄存器编号错误: " + message) {}
};

class IllegalInstructionException : public FpuException {
public:
    explicit IllegalInstructionException(const std::string& message)
        : FpuException("非法指令: " + message) {}
};

class ConfigException : public FpuException {
public:
    explicit ConfigException(const std::string& message)
        : FpuException("配置错误: " + message) {}
};

class TraceFormatException : public FpuException {
public:
    explicit TraceFormatException(const std::string& message)
        : FpuException("指令序列格式错误: " + message) {}
};

} // namespace rvfpu
