#pragma once

#include "common/types.h"
#include <array>

namespace rvfpu {

/**
 * 浮点寄存器堆：32个64位寄存器，三读一写
 * 单精度值以装箱形式存放，寄存器堆本身不解释内容
 */
class FpRegisterFile {
public:
    static constexpr std::size_t NUM_REGISTERS = 32;

    FpRegisterFile() { reset(); }

    RegValue read(RegNum reg) const;
    std::array<RegValue, 3> readOperands(RegNum rs1, RegNum rs2, RegNum rs3) const;
    void write(RegNum reg, RegValue value);
    void reset();

    uint64_t writeCount() const { return write_count_; }

private:
    static void checkIndex(RegNum reg);

    std::array<RegValue, NUM_REGISTERS> registers_;
    uint64_t write_count_ = 0;
};

} // namespace rvfpu
