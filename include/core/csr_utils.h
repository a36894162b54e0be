#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace rvfpu::csr {

// 浮点相关CSR只有三个地址，其余地址不属于FPU
constexpr std::size_t kCsrRegisterCount = 4;
using CsrFile = std::array<std::uint64_t, kCsrRegisterCount>;

constexpr std::uint32_t kFflags = 0x001;
constexpr std::uint32_t kFrm = 0x002;
constexpr std::uint32_t kFcsr = 0x003;

inline bool isFloatingPointCsr(std::uint32_t addr) {
    return addr == kFflags || addr == kFrm || addr == kFcsr;
}

inline std::uint64_t read(const CsrFile& csr, std::uint32_t addr) {
    if (addr == kFflags) {
        return csr[kFcsr] & 0x1FU;
    }
    if (addr == kFrm) {
        return (csr[kFcsr] >> 5) & 0x7U;
    }
    if (addr == kFcsr) {
        return csr[kFcsr] & 0xFFU;
    }
    return 0;
}

inline void write(CsrFile& csr, std::uint32_t addr, std::uint64_t value) {
    if (addr == kFflags) {
        const std::uint64_t fflags = value & 0x1FU;
        csr[kFflags] = fflags;
        csr[kFcsr] = (csr[kFcsr] & ~0x1FU) | fflags;
        return;
    }

    if (addr == kFrm) {
        const std::uint64_t frm = value & 0x7U;
        csr[kFrm] = frm;
        csr[kFcsr] = (csr[kFcsr] & ~0xE0U) | (frm << 5);
        return;
    }

    if (addr == kFcsr) {
        const std::uint64_t fcsr = value & 0xFFU;
        csr[kFcsr] = fcsr;
        csr[kFflags] = fcsr & 0x1FU;
        csr[kFrm] = (fcsr >> 5) & 0x7U;
    }
}

// 提交指令的异常标志是粘滞的：只置位，不清除
inline void accumulateFflags(CsrFile& csr, std::uint8_t flags) {
    write(csr, kFflags, read(csr, kFflags) | (flags & 0x1FU));
}

}  // namespace rvfpu::csr
