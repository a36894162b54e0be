#pragma once

#include "common/types.h"

namespace rvfpu {

/**
 * FPU 配置
 */
struct FpuConfig {
    static constexpr unsigned kMinBitsPerTick = 1;
    static constexpr unsigned kMaxBitsPerTick = 16;

    uint32_t enabled_extensions = static_cast<uint32_t>(Extension::F) |
                                  static_cast<uint32_t>(Extension::D);
    unsigned divsqrt_bits_per_tick = 4;

    bool isExtensionEnabled(Extension ext) const {
        return (enabled_extensions & static_cast<uint32_t>(ext)) != 0;
    }

    // 配置非法时抛出 ConfigException
    void validate() const;
};

} // namespace rvfpu
