#include "core/decoder.h"
#include "common/debug_types.h"

namespace rvfpu {

namespace {

void setArithmetic(ControlTags& tags, FpuOp op, ResultSource source) {
    tags.op = op;
    tags.result_source = source;
    tags.fp_write = true;
    tags.uses_rs1 = true;
    tags.uses_rs2 = true;
}

void setMemoryStage(ControlTags& tags, FpuOp op, MemStageSelect select, bool int_result) {
    tags.op = op;
    tags.result_source = ResultSource::MEMORY_STAGE;
    tags.mem_select = select;
    tags.fp_write = !int_result;
    tags.int_write = int_result;
}

} // namespace

DecodedInstruction Decoder::decode(Instruction instruction, uint8_t frm) const {
    DecodedInstruction decoded;
    decoded.raw = instruction;
    decoded.rd = extractRd(instruction);
    decoded.rs1 = extractRs1(instruction);
    decoded.rs2 = extractRs2(instruction);
    decoded.rs3 = extractRs3(instruction);

    const Opcode opcode = extractOpcode(instruction);
    const uint8_t funct3 = extractFunct3(instruction);
    const uint8_t funct7 = extractFunct7(instruction);

    try {
        if (!isExtensionEnabled(Extension::F)) {
            throw IllegalInstructionException("F扩展指令未启用");
        }
        switch (opcode) {
            case Opcode::LOAD_FP:
            case Opcode::STORE_FP:
                decodeLoadStore(decoded, opcode, funct3);
                break;
            case Opcode::FMADD:
            case Opcode::FMSUB:
            case Opcode::FNMSUB:
            case Opcode::FNMADD:
                decodeFusedMultiplyAdd(decoded, opcode, funct7, frm);
                break;
            case Opcode::OP_FP:
                decodeOpFp(decoded, funct7, funct3, frm);
                break;
            default:
                throw IllegalInstructionException(
                    fmt::format("不是浮点操作码 0x{:02x}", static_cast<int>(opcode)));
        }
    } catch (const IllegalInstructionException& e) {
        dprintf(DECODE, "指令 0x%08x 非法: %s", instruction, e.what());
        decoded.tags = ControlTags{};
        decoded.tags.legal = false;
        return decoded;
    }

    dprintf(DECODE, "指令 0x%08x -> %s.%s rd=f%d rs1=f%d rs2=f%d rs3=f%d rm=%d",
            instruction, opName(decoded.tags.op), formatName(decoded.tags.format),
            static_cast<int>(decoded.rd), static_cast<int>(decoded.rs1),
            static_cast<int>(decoded.rs2), static_cast<int>(decoded.rs3),
            static_cast<int>(decoded.tags.rm));
    return decoded;
}

std::optional<FPRoundingMode> Decoder::resolveRoundingMode(uint8_t field, uint8_t frm) {
    const uint8_t mode = field == static_cast<uint8_t>(FPRoundingMode::DYN) ? frm : field;
    if (mode > static_cast<uint8_t>(FPRoundingMode::RMM)) {
        return std::nullopt;
    }
    return static_cast<FPRoundingMode>(mode);
}

FPRoundingMode Decoder::requireRoundingMode(uint8_t field, uint8_t frm) {
    const auto rm = resolveRoundingMode(field, frm);
    if (!rm) {
        throw IllegalInstructionException(fmt::format("保留的舍入模式 rm={} frm={}", field, frm));
    }
    return *rm;
}

FpFormat Decoder::decodeFormat(uint8_t fmt_field) const {
    switch (fmt_field) {
        case 0b00:
            return FpFormat::SINGLE;
        case 0b01:
            if (!isExtensionEnabled(Extension::D)) {
                throw IllegalInstructionException("D扩展指令未启用");
            }
            return FpFormat::DOUBLE;
        default:
            // 半精度、四精度不支持
            throw IllegalInstructionException(fmt::format("不支持的浮点格式 fmt={}", fmt_field));
    }
}

void Decoder::decodeLoadStore(DecodedInstruction& decoded, Opcode opcode, uint8_t funct3) const {
    ControlTags& tags = decoded.tags;
    if (funct3 == static_cast<uint8_t>(Funct3::FLW)) {
        tags.format = FpFormat::SINGLE;
    } else if (funct3 == static_cast<uint8_t>(Funct3::FLD)) {
        tags.format = decodeFormat(0b01);
    } else {
        throw IllegalInstructionException(fmt::format("不支持的访存宽度 funct3={}", funct3));
    }

    if (opcode == Opcode::LOAD_FP) {
        tags.op = FpuOp::LOAD;
        tags.result_source = ResultSource::LOAD;
        tags.fp_write = true;
    } else {
        // 存储指令 rd 字段是立即数
        tags.op = FpuOp::STORE;
        tags.store = true;
        tags.uses_rs2 = true;
        decoded.rd = 0;
    }
}

void Decoder::decodeFusedMultiplyAdd(DecodedInstruction& decoded, Opcode opcode,
                                     uint8_t funct7, uint8_t frm) const {
    ControlTags& tags = decoded.tags;
    tags.format = decodeFormat(funct7 & 0x3);
    tags.rm = requireRoundingMode(extractRM(decoded.raw), frm);

    FpuOp op;
    switch (opcode) {
        case Opcode::FMADD:  op = FpuOp::FMADD; break;
        case Opcode::FMSUB:  op = FpuOp::FMSUB; break;
        case Opcode::FNMSUB: op = FpuOp::FNMSUB; break;
        default:             op = FpuOp::FNMADD; break;
    }
    setArithmetic(tags, op, ResultSource::FMA);
    tags.uses_rs3 = true;
}

void Decoder::decodeOpFp(DecodedInstruction& decoded, uint8_t funct7, uint8_t funct3,
                         uint8_t frm) const {
    ControlTags& tags = decoded.tags;
    const auto funct5 = static_cast<Funct5>(funct7 >> 2);
    tags.format = decodeFormat(funct7 & 0x3);
    const RegNum rs2 = decoded.rs2;

    switch (funct5) {
        case Funct5::FADD:
        case Funct5::FSUB:
            tags.rm = requireRoundingMode(funct3, frm);
            setArithmetic(tags, funct5 == Funct5::FADD ? FpuOp::FADD : FpuOp::FSUB,
                          ResultSource::ADD_CONVERT);
            break;

        case Funct5::FMUL:
            tags.rm = requireRoundingMode(funct3, frm);
            setArithmetic(tags, FpuOp::FMUL, ResultSource::FMA);
            break;

        case Funct5::FDIV:
            tags.rm = requireRoundingMode(funct3, frm);
            setArithmetic(tags, FpuOp::FDIV, ResultSource::DIV_SQRT);
            tags.div_start = true;
            break;

        case Funct5::FSQRT:
            if (rs2 != 0) {
                throw IllegalInstructionException("FSQRT 的 rs2 字段必须为0");
            }
            tags.rm = requireRoundingMode(funct3, frm);
            setArithmetic(tags, FpuOp::FSQRT, ResultSource::DIV_SQRT);
            tags.uses_rs2 = false;
            tags.div_start = true;
            break;

        case Funct5::FSGNJ: {
            FpuOp op;
            switch (funct3) {
                case static_cast<uint8_t>(Funct3::FSGNJ):  op = FpuOp::FSGNJ; break;
                case static_cast<uint8_t>(Funct3::FSGNJN): op = FpuOp::FSGNJN; break;
                case static_cast<uint8_t>(Funct3::FSGNJX): op = FpuOp::FSGNJX; break;
                default:
                    throw IllegalInstructionException("未知的符号注入指令");
            }
            setMemoryStage(tags, op, MemStageSelect::SIGN_INJECT, false);
            tags.uses_rs1 = true;
            tags.uses_rs2 = true;
            break;
        }

        case Funct5::FMIN_FMAX:
            if (funct3 == static_cast<uint8_t>(Funct3::FMIN)) {
                setMemoryStage(tags, FpuOp::FMIN, MemStageSelect::COMPARE, false);
            } else if (funct3 == static_cast<uint8_t>(Funct3::FMAX)) {
                setMemoryStage(tags, FpuOp::FMAX, MemStageSelect::COMPARE, false);
            } else {
                throw IllegalInstructionException("未知的最小/最大值指令");
            }
            tags.uses_rs1 = true;
            tags.uses_rs2 = true;
            break;

        case Funct5::FCVT_FP: {
            // fmt 为目标格式，rs2 编码源格式，且两者必须不同
            const FpFormat source = decodeFormat(static_cast<uint8_t>(rs2));
            if (rs2 > 1 || source == tags.format) {
                throw IllegalInstructionException("非法的浮点格式转换");
            }
            tags.rm = requireRoundingMode(funct3, frm);
            tags.op = FpuOp::FCVT_FP;
            tags.result_source = ResultSource::ADD_CONVERT;
            tags.source_format = source;
            tags.fp_write = true;
            tags.uses_rs1 = true;
            break;
        }

        case Funct5::FCMP: {
            FpuOp op;
            switch (funct3) {
                case static_cast<uint8_t>(Funct3::FEQ): op = FpuOp::FEQ; break;
                case static_cast<uint8_t>(Funct3::FLT): op = FpuOp::FLT; break;
                case static_cast<uint8_t>(Funct3::FLE): op = FpuOp::FLE; break;
                default:
                    throw IllegalInstructionException("未知的比较指令");
            }
            setMemoryStage(tags, op, MemStageSelect::COMPARE, true);
            tags.uses_rs1 = true;
            tags.uses_rs2 = true;
            break;
        }

        case Funct5::FCVT_INT:
            if (rs2 > 3) {
                throw IllegalInstructionException("未知的浮点转整数类型");
            }
            tags.rm = requireRoundingMode(funct3, frm);
            setMemoryStage(tags, FpuOp::FCVT_TO_INT, MemStageSelect::CONVERT, true);
            tags.int_conversion = static_cast<IntConversion>(rs2);
            tags.uses_rs1 = true;
            break;

        case Funct5::FCVT_FROM_INT:
            if (rs2 > 3) {
                throw IllegalInstructionException("未知的整数转浮点类型");
            }
            tags.rm = requireRoundingMode(funct3, frm);
            setMemoryStage(tags, FpuOp::FCVT_FROM_INT, MemStageSelect::CONVERT, false);
            tags.int_conversion = static_cast<IntConversion>(rs2);
            break;

        case Funct5::FMV_X_CLASS:
            if (rs2 != 0) {
                throw IllegalInstructionException("FMV.X/FCLASS 的 rs2 字段必须为0");
            }
            if (funct3 == static_cast<uint8_t>(Funct3::FMV_CLASS)) {
                setMemoryStage(tags, FpuOp::FMV_TO_INT, MemStageSelect::MOVE_TO_INT, true);
            } else if (funct3 == static_cast<uint8_t>(Funct3::FCLASS)) {
                setMemoryStage(tags, FpuOp::FCLASS, MemStageSelect::CLASSIFY, true);
            } else {
                throw IllegalInstructionException("未知的 FMV.X/FCLASS 指令");
            }
            tags.uses_rs1 = true;
            break;

        case Funct5::FMV_FROM_X:
            if (rs2 != 0 || funct3 != 0) {
                throw IllegalInstructionException("非法的 FMV.W.X/FMV.D.X 编码");
            }
            setMemoryStage(tags, FpuOp::FMV_FROM_INT, MemStageSelect::INT_PASSTHROUGH, false);
            break;

        default:
            throw IllegalInstructionException(
                fmt::format("未知的 OP-FP funct5=0x{:02x}", static_cast<int>(funct5)));
    }
}

Opcode Decoder::extractOpcode(Instruction inst) {
    return static_cast<Opcode>(inst & 0x7F);
}

RegNum Decoder::extractRd(Instruction inst) {
    return static_cast<RegNum>((inst >> 7) & 0x1F);
}

RegNum Decoder::extractRs1(Instruction inst) {
    return static_cast<RegNum>((inst >> 15) & 0x1F);
}

RegNum Decoder::extractRs2(Instruction inst) {
    return static_cast<RegNum>((inst >> 20) & 0x1F);
}

RegNum Decoder::extractRs3(Instruction inst) {
    return static_cast<RegNum>((inst >> 27) & 0x1F);
}

uint8_t Decoder::extractFunct3(Instruction inst) {
    return static_cast<uint8_t>((inst >> 12) & 0x07);
}

uint8_t Decoder::extractFunct7(Instruction inst) {
    return static_cast<uint8_t>((inst >> 25) & 0x7F);
}

uint8_t Decoder::extractRM(Instruction inst) {
    return static_cast<uint8_t>((inst >> 12) & 0x07);
}

const char* opName(FpuOp op) {
    switch (op) {
        case FpuOp::NONE:          return "nop";
        case FpuOp::LOAD:          return "fl";
        case FpuOp::STORE:         return "fs";
        case FpuOp::FMADD:         return "fmadd";
        case FpuOp::FMSUB:         return "fmsub";
        case FpuOp::FNMSUB:        return "fnmsub";
        case FpuOp::FNMADD:        return "fnmadd";
        case FpuOp::FMUL:          return "fmul";
        case FpuOp::FADD:          return "fadd";
        case FpuOp::FSUB:          return "fsub";
        case FpuOp::FDIV:          return "fdiv";
        case FpuOp::FSQRT:         return "fsqrt";
        case FpuOp::FSGNJ:         return "fsgnj";
        case FpuOp::FSGNJN:        return "fsgnjn";
        case FpuOp::FSGNJX:        return "fsgnjx";
        case FpuOp::FMIN:          return "fmin";
        case FpuOp::FMAX:          return "fmax";
        case FpuOp::FEQ:           return "feq";
        case FpuOp::FLT:           return "flt";
        case FpuOp::FLE:           return "fle";
        case FpuOp::FCLASS:        return "fclass";
        case FpuOp::FMV_TO_INT:    return "fmv.x";
        case FpuOp::FMV_FROM_INT:  return "fmv.f";
        case FpuOp::FCVT_FP:       return "fcvt.fp";
        case FpuOp::FCVT_TO_INT:   return "fcvt.int";
        case FpuOp::FCVT_FROM_INT: return "fcvt.from_int";
    }
    return "unknown";
}

const char* resultSourceName(ResultSource source) {
    switch (source) {
        case ResultSource::NONE:         return "NONE";
        case ResultSource::LOAD:         return "LOAD";
        case ResultSource::FMA:          return "FMA";
        case ResultSource::ADD_CONVERT:  return "ADD_CONVERT";
        case ResultSource::DIV_SQRT:     return "DIV_SQRT";
        case ResultSource::MEMORY_STAGE: return "MEMORY_STAGE";
    }
    return "UNKNOWN";
}

const char* memStageSelectName(MemStageSelect select) {
    switch (select) {
        case MemStageSelect::NONE:            return "NONE";
        case MemStageSelect::CONVERT:         return "CONVERT";
        case MemStageSelect::SIGN_INJECT:     return "SIGN_INJECT";
        case MemStageSelect::COMPARE:         return "COMPARE";
        case MemStageSelect::CLASSIFY:        return "CLASSIFY";
        case MemStageSelect::INT_PASSTHROUGH: return "INT_PASSTHROUGH";
        case MemStageSelect::MOVE_TO_INT:     return "MOVE_TO_INT";
    }
    return "UNKNOWN";
}

} // namespace rvfpu
