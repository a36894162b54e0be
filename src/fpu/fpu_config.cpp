#include "fpu/fpu_config.h"
#include <fmt/format.h>

namespace rvfpu {

void FpuConfig::validate() const {
    if (divsqrt_bits_per_tick < kMinBitsPerTick || divsqrt_bits_per_tick > kMaxBitsPerTick) {
        throw ConfigException(fmt::format("除法/开方每周期位数 {} 不在 [{}, {}] 范围内",
                                          divsqrt_bits_per_tick, kMinBitsPerTick, kMaxBitsPerTick));
    }
    if (isExtensionEnabled(Extension::D) && !isExtensionEnabled(Extension::F)) {
        throw ConfigException("D扩展依赖F扩展");
    }
}

} // namespace rvfpu
