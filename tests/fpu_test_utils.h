#pragma once

#include "common/types.h"
#include "fpu/fp_format.h"
#include "fpu/unpack.h"
#include <cstring>

namespace rvfpu::test {

// ========== 数值与位模式互转 ==========

inline uint32_t bitsOf(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

inline uint64_t bitsOf(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

// 装箱后的单精度寄存器值
inline RegValue boxedF(float value) {
    return boxValue(FpFormat::SINGLE, bitsOf(value));
}

inline RegValue boxedD(double value) {
    return bitsOf(value);
}

inline float toFloat(RegValue stored) {
    const uint32_t bits = static_cast<uint32_t>(stored);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline double toDouble(RegValue stored) {
    double value;
    std::memcpy(&value, &stored, sizeof(value));
    return value;
}

inline UnpackedOperand opF(float value) {
    return Unpacker::unpack(FpFormat::SINGLE, boxedF(value));
}

inline UnpackedOperand opD(double value) {
    return Unpacker::unpack(FpFormat::DOUBLE, boxedD(value));
}

inline UnpackedOperand opBits(FpFormat fmt, uint64_t bits) {
    return Unpacker::unpackBits(fmt, bits);
}

// ========== 指令编码 ==========

constexpr uint8_t kFmtS = 0;
constexpr uint8_t kFmtD = 1;
constexpr uint8_t kRmDyn = 7;

inline Instruction encodeOpFp(uint8_t funct5, uint8_t fmt, RegNum rs2, RegNum rs1,
                              uint8_t funct3, RegNum rd) {
    return (static_cast<uint32_t>((funct5 << 2) | fmt) << 25) | (static_cast<uint32_t>(rs2) << 20) |
           (static_cast<uint32_t>(rs1) << 15) | (static_cast<uint32_t>(funct3) << 12) |
           (static_cast<uint32_t>(rd) << 7) | static_cast<uint32_t>(Opcode::OP_FP);
}

inline Instruction encodeR4(Opcode opcode, uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2,
                            RegNum rs3, uint8_t rm = kRmDyn) {
    return (static_cast<uint32_t>(rs3) << 27) | (static_cast<uint32_t>(fmt) << 25) |
           (static_cast<uint32_t>(rs2) << 20) | (static_cast<uint32_t>(rs1) << 15) |
           (static_cast<uint32_t>(rm) << 12) | (static_cast<uint32_t>(rd) << 7) |
           static_cast<uint32_t>(opcode);
}

inline Instruction fadd(uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2, uint8_t rm = kRmDyn) {
    return encodeOpFp(0b00000, fmt, rs2, rs1, rm, rd);
}

inline Instruction fsub(uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2, uint8_t rm = kRmDyn) {
    return encodeOpFp(0b00001, fmt, rs2, rs1, rm, rd);
}

inline Instruction fmul(uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2, uint8_t rm = kRmDyn) {
    return encodeOpFp(0b00010, fmt, rs2, rs1, rm, rd);
}

inline Instruction fdiv(uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2, uint8_t rm = kRmDyn) {
    return encodeOpFp(0b00011, fmt, rs2, rs1, rm, rd);
}

inline Instruction fsqrt(uint8_t fmt, RegNum rd, RegNum rs1, uint8_t rm = kRmDyn) {
    return encodeOpFp(0b01011, fmt, 0, rs1, rm, rd);
}

inline Instruction fsgnj(uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2, uint8_t variant) {
    return encodeOpFp(0b00100, fmt, rs2, rs1, variant, rd);
}

inline Instruction fminmax(uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2, bool is_max) {
    return encodeOpFp(0b00101, fmt, rs2, rs1, is_max ? 1 : 0, rd);
}

inline Instruction fcvtFp(uint8_t target_fmt, RegNum rd, RegNum rs1, uint8_t rm = kRmDyn) {
    return encodeOpFp(0b01000, target_fmt, target_fmt == kFmtS ? kFmtD : kFmtS, rs1, rm, rd);
}

// funct3: 2=FEQ 1=FLT 0=FLE
inline Instruction fcmp(uint8_t fmt, RegNum rd, RegNum rs1, RegNum rs2, uint8_t funct3) {
    return encodeOpFp(0b10100, fmt, rs2, rs1, funct3, rd);
}

// conversion: 0=W 1=WU 2=L 3=LU
inline Instruction fcvtToInt(uint8_t fmt, RegNum rd, RegNum rs1, uint8_t conversion,
                             uint8_t rm = kRmDyn) {
    return encodeOpFp(0b11000, fmt, conversion, rs1, rm, rd);
}

inline Instruction fcvtFromInt(uint8_t fmt, RegNum rd, RegNum rs1, uint8_t conversion,
                               uint8_t rm = kRmDyn) {
    return encodeOpFp(0b11010, fmt, conversion, rs1, rm, rd);
}

inline Instruction fmvToInt(uint8_t fmt, RegNum rd, RegNum rs1) {
    return encodeOpFp(0b11100, fmt, 0, rs1, 0, rd);
}

inline Instruction fclass(uint8_t fmt, RegNum rd, RegNum rs1) {
    return encodeOpFp(0b11100, fmt, 0, rs1, 1, rd);
}

inline Instruction fmvFromInt(uint8_t fmt, RegNum rd, RegNum rs1) {
    return encodeOpFp(0b11110, fmt, 0, rs1, 0, rd);
}

inline Instruction fload(uint8_t fmt, RegNum rd, RegNum rs1, int32_t imm = 0) {
    const uint8_t width = fmt == kFmtS ? 0b010 : 0b011;
    return (static_cast<uint32_t>(imm & 0xFFF) << 20) | (static_cast<uint32_t>(rs1) << 15) |
           (static_cast<uint32_t>(width) << 12) | (static_cast<uint32_t>(rd) << 7) |
           static_cast<uint32_t>(Opcode::LOAD_FP);
}

inline Instruction fstore(uint8_t fmt, RegNum rs2, RegNum rs1, int32_t imm = 0) {
    const uint8_t width = fmt == kFmtS ? 0b010 : 0b011;
    const uint32_t offset = static_cast<uint32_t>(imm & 0xFFF);
    return ((offset >> 5) << 25) | (static_cast<uint32_t>(rs2) << 20) |
           (static_cast<uint32_t>(rs1) << 15) | (static_cast<uint32_t>(width) << 12) |
           ((offset & 0x1F) << 7) | static_cast<uint32_t>(Opcode::STORE_FP);
}

} // namespace rvfpu::test
