#include "fpu/register_file.h"
#include <fmt/format.h>

namespace rvfpu {

void FpRegisterFile::checkIndex(RegNum reg) {
    if (reg >= NUM_REGISTERS) {
        throw RegisterIndexException(fmt::format("f{} 超出范围", static_cast<int>(reg)));
    }
}

RegValue FpRegisterFile::read(RegNum reg) const {
    checkIndex(reg);
    return registers_[reg];
}

std::array<RegValue, 3> FpRegisterFile::readOperands(RegNum rs1, RegNum rs2, RegNum rs3) const {
    return {read(rs1), read(rs2), read(rs3)};
}

void FpRegisterFile::write(RegNum reg, RegValue value) {
    checkIndex(reg);
    registers_[reg] = value;
    ++write_count_;
}

void FpRegisterFile::reset() {
    registers_.fill(0);
    write_count_ = 0;
}

} // namespace rvfpu
