#include "fpu/fp_format.h"
#include "fpu/fp_flags.h"

namespace rvfpu {

const char* formatName(FpFormat fmt) {
    return fmt == FpFormat::SINGLE ? "S" : "D";
}

std::string FpFlags::toString() const {
    std::string text;
    text += invalid ? "NV" : "--";
    text += divide_by_zero ? " DZ" : " --";
    text += overflow ? " OF" : " --";
    text += underflow ? " UF" : " --";
    text += inexact ? " NX" : " --";
    return text;
}

} // namespace rvfpu
