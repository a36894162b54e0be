#pragma once

#include "fpu/control_tags.h"
#include <optional>

namespace rvfpu {

/**
 * 译码后的浮点指令
 */
struct DecodedInstruction {
    Instruction raw = 0;
    ControlTags tags;
    RegNum rd = 0;
    RegNum rs1 = 0;
    RegNum rs2 = 0;
    RegNum rs3 = 0;
};

/**
 * 浮点控制译码器
 * 把32位指令和全局 frm 映射成控制标签；非法编码返回 legal=false 且不写任何寄存器
 */
class Decoder {
public:
    explicit Decoder(uint32_t enabled_extensions = static_cast<uint32_t>(Extension::F) |
                                                   static_cast<uint32_t>(Extension::D))
        : enabled_extensions_(enabled_extensions) {}

    /**
     * 解码指令
     * @param instruction 32位机器码
     * @param frm 全局舍入模式寄存器
     */
    DecodedInstruction decode(Instruction instruction, uint8_t frm) const;

    /**
     * 解析舍入模式：字段为 DYN 时取 frm，保留编码（5、6以及 frm>=5）非法
     */
    static std::optional<FPRoundingMode> resolveRoundingMode(uint8_t field, uint8_t frm);

    uint32_t enabledExtensions() const { return enabled_extensions_; }

private:
    // 提取指令各个字段
    static Opcode extractOpcode(Instruction inst);
    static RegNum extractRd(Instruction inst);
    static RegNum extractRs1(Instruction inst);
    static RegNum extractRs2(Instruction inst);
    static RegNum extractRs3(Instruction inst);
    static uint8_t extractFunct3(Instruction inst);
    static uint8_t extractFunct7(Instruction inst);
    static uint8_t extractRM(Instruction inst);

    // 以下函数遇到非法编码抛出 IllegalInstructionException
    void decodeLoadStore(DecodedInstruction& decoded, Opcode opcode, uint8_t funct3) const;
    void decodeFusedMultiplyAdd(DecodedInstruction& decoded, Opcode opcode,
                                uint8_t funct7, uint8_t frm) const;
    void decodeOpFp(DecodedInstruction& decoded, uint8_t funct7, uint8_t funct3, uint8_t frm) const;

    FpFormat decodeFormat(uint8_t fmt_field) const;
    static FPRoundingMode requireRoundingMode(uint8_t field, uint8_t frm);

    bool isExtensionEnabled(Extension ext) const {
        return (enabled_extensions_ & static_cast<uint32_t>(ext)) != 0;
    }

    uint32_t enabled_extensions_;
};

} // namespace rvfpu
