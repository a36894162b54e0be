#pragma once

#include "common/types.h"

namespace rvfpu {

// 译码后的浮点操作
enum class FpuOp : uint8_t {
    NONE,
    LOAD,
    STORE,
    FMADD,
    FMSUB,
    FNMSUB,
    FNMADD,
    FMUL,
    FADD,
    FSUB,
    FDIV,
    FSQRT,
    FSGNJ,
    FSGNJN,
    FSGNJX,
    FMIN,
    FMAX,
    FEQ,
    FLT,
    FLE,
    FCLASS,
    FMV_TO_INT,     // FMV.X.W / FMV.X.D
    FMV_FROM_INT,   // FMV.W.X / FMV.D.X
    FCVT_FP,        // FCVT.S.D / FCVT.D.S
    FCVT_TO_INT,    // FCVT.{W,WU,L,LU}.{S,D}
    FCVT_FROM_INT   // FCVT.{S,D}.{W,WU,L,LU}
};

// 浮点与整数之间转换的整数类型（即 rs2 字段编码）
enum class IntConversion : uint8_t {
    W  = 0,
    WU = 1,
    L  = 2,
    LU = 3
};

const char* opName(FpuOp op);

} // namespace rvfpu
