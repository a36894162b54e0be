#include "fpu/stages/execute_stage.h"
#include "fpu/fpu_state.h"
#include "fpu/units/compare_unit.h"
#include "fpu/units/misc_units.h"
#include "common/debug_types.h"

namespace rvfpu {

void ExecuteStage::reset() {
    div_owner_valid_ = false;
    div_owner_ = 0;
    discard_division_ = false;
}

void ExecuteStage::execute(FpuState& state) {
    // 除法/开方单元在启动后的周期里推进
    if (state.divsqrt.busy()) {
        state.divsqrt.step();
        if (state.divsqrt.done()) {
            dprintf(DIVSQRT, "除法/开方完成 result=0x%016lx", state.divsqrt.result().value);
        }
    }
    retireDiscardedDivision(state);

    auto& slot = state.decode_execute;
    if (slot.empty()) {
        return;
    }
    const DecodeExecuteLatch& latch = slot.get();
    const ControlTags& tags = latch.inst.tags;

    const std::array<RegNum, 3> sources{latch.inst.rs1, latch.inst.rs2, latch.inst.rs3};
    const std::array<bool, 3> uses{tags.uses_rs1, tags.uses_rs2, tags.uses_rs3};
    const HazardDecision decision = HazardUnit::resolve(sources, uses, state.memory_forward.producer,
                                                        state.writeback_forward.producer);

    bool blocked = state.inputs.stalled(PipelineStageId::EXECUTE) || state.execute_memory.valid();
    if (decision.stall) {
        dprintf(HAZARD, "#%lu %s 等待访存级加载结果", latch.sequence, opName(tags.op));
        blocked = true;
    }
    // 非除法指令也要等除法单元空闲
    if (!tags.div_start && !state.divsqrt.idle()) {
        blocked = true;
    }

    if (blocked) {
        state.execute_stalled = true;
        dprintf(STALL, "执行级停顿 #%lu %s", latch.sequence, opName(tags.op));
        return;
    }

    const std::array<RegValue, 3> operands = resolveOperands(state, latch, decision);

    ExecuteMemoryLatch out;
    out.tags = tags;
    out.rd = latch.inst.rd;
    out.sequence = latch.sequence;

    if (tags.div_start) {
        if (!handleDivSqrt(state, latch, operands, out)) {
            state.execute_stalled = true;
            return;
        }
    } else {
        computeUnits(latch, operands, out);
    }

    dprintf(EXECUTE, "#%lu %s.%s 进入访存级", latch.sequence, opName(tags.op),
            formatName(tags.format));
    state.execute_memory.advance(out);
    slot.clear();
}

std::array<RegValue, 3> ExecuteStage::resolveOperands(const FpuState& state,
                                                      const DecodeExecuteLatch& latch,
                                                      const HazardDecision& decision) const {
    std::array<RegValue, 3> operands = latch.operands;
    for (std::size_t i = 0; i < operands.size(); ++i) {
        switch (decision.select[i]) {
            case ForwardSelect::MEMORY:
                operands[i] = state.memory_forward.value;
                break;
            case ForwardSelect::WRITEBACK:
                operands[i] = state.writeback_forward.value;
                break;
            case ForwardSelect::REGISTER_FILE:
                break;
        }
        if (decision.select[i] != ForwardSelect::REGISTER_FILE) {
            dprintf(HAZARD, "#%lu 操作数%zu 前递自 %s = 0x%016lx", latch.sequence, i + 1,
                    HazardUnit::selectName(decision.select[i]), operands[i]);
        }
    }
    return operands;
}

void ExecuteStage::retireDiscardedDivision(FpuState& state) {
    if (discard_division_ && state.divsqrt.done()) {
        const UnitResult dropped = state.divsqrt.acknowledge();
        discard_division_ = false;
        dprintf(DIVSQRT, "丢弃被冲刷指令的除法/开方结果 0x%016lx", dropped.value);
    }
}

bool ExecuteStage::handleDivSqrt(FpuState& state, const DecodeExecuteLatch& latch,
                                 const std::array<RegValue, 3>& operands,
                                 ExecuteMemoryLatch& out) {
    DivSqrtUnit& unit = state.divsqrt;

    if (div_owner_valid_ && div_owner_ == latch.sequence) {
        if (!unit.done()) {
            dprintf(DIVSQRT, "#%lu 等待除法/开方 (剩余 %u 次迭代)", latch.sequence,
                    unit.remainingIterations());
            return false;
        }
        out.divsqrt = unit.acknowledge();
        div_owner_valid_ = false;
        state.outputs.reportUnitFlags(out.divsqrt.flags.toBits());
        return true;
    }

    if (!unit.idle()) {
        dprintf(DIVSQRT, "#%lu 除法/开方单元忙", latch.sequence);
        return false;
    }

    // 启动时锁存操作数，之后不再读取前递值
    const ControlTags& tags = latch.inst.tags;
    DivSqrtRequest request;
    request.sqrt = tags.op == FpuOp::FSQRT;
    request.format = tags.format;
    request.rm = tags.rm;
    request.dividend = Unpacker::unpack(tags.format, operands[0]);
    request.divisor = request.sqrt ? Unpacker::architecturalZero(tags.format)
                                   : Unpacker::unpack(tags.format, operands[1]);
    unit.start(request);
    div_owner_valid_ = true;
    div_owner_ = latch.sequence;
    dprintf(DIVSQRT, "#%lu 启动 %s.%s", latch.sequence, opName(tags.op), formatName(tags.format));
    return false;
}

void ExecuteStage::computeUnits(const DecodeExecuteLatch& latch,
                                const std::array<RegValue, 3>& operands,
                                ExecuteMemoryLatch& out) const {
    const ControlTags& tags = latch.inst.tags;
    const FpFormat fmt = tags.format;

    switch (tags.op) {
        case FpuOp::FMADD:
        case FpuOp::FMSUB:
        case FpuOp::FNMSUB:
        case FpuOp::FNMADD:
        case FpuOp::FMUL: {
            const auto ops = Unpacker::unpackAll(fmt, operands, tags.op == FpuOp::FMUL);
            out.fma = FmaUnit::stage1(tags.op, fmt, tags.rm, ops[0], ops[1], ops[2]);
            break;
        }
        case FpuOp::FADD:
        case FpuOp::FSUB:
            out.add_convert = AddConvertUnit::stage1Add(tags.op, fmt, tags.rm,
                                                        Unpacker::unpack(fmt, operands[0]),
                                                        Unpacker::unpack(fmt, operands[1]));
            break;
        case FpuOp::FCVT_FP:
            out.add_convert = AddConvertUnit::stage1Convert(
                fmt, tags.rm, Unpacker::unpack(tags.source_format, operands[0]));
            break;
        case FpuOp::FSGNJ:
        case FpuOp::FSGNJN:
        case FpuOp::FSGNJX:
            out.sign_inject = SignInjectUnit::inject(tags.op, fmt, Unpacker::unpack(fmt, operands[0]),
                                                     Unpacker::unpack(fmt, operands[1]));
            break;
        case FpuOp::FMIN:
        case FpuOp::FMAX:
            out.compare = CompareUnit::minMax(tags.op, fmt, Unpacker::unpack(fmt, operands[0]),
                                              Unpacker::unpack(fmt, operands[1]));
            break;
        case FpuOp::FEQ:
        case FpuOp::FLT:
        case FpuOp::FLE:
            out.compare = CompareUnit::compare(tags.op, Unpacker::unpack(fmt, operands[0]),
                                               Unpacker::unpack(fmt, operands[1]));
            break;
        case FpuOp::FCLASS:
            out.classify = ClassifyUnit::classify(Unpacker::unpack(fmt, operands[0]));
            break;
        case FpuOp::FCVT_TO_INT:
            out.convert = ConvertUnit::toInteger(tags.int_conversion, tags.rm,
                                                 Unpacker::unpack(fmt, operands[0]));
            break;
        case FpuOp::FCVT_FROM_INT:
            out.convert = ConvertUnit::fromInteger(tags.int_conversion, fmt, tags.rm,
                                                   latch.int_operand);
            break;
        case FpuOp::FMV_TO_INT:
            out.move_to_int = ConvertUnit::moveToInteger(fmt, operands[0]);
            break;
        case FpuOp::FMV_FROM_INT:
            out.int_passthrough = ConvertUnit::moveFromInteger(fmt, latch.int_operand);
            break;
        case FpuOp::STORE:
            out.store_data = operands[1];
            break;
        case FpuOp::LOAD:
        case FpuOp::NONE:
            break;
        case FpuOp::FDIV:
        case FpuOp::FSQRT:
            throw FpuException("除法/开方不应走单周期单元路径");
    }
}

void ExecuteStage::flush(FpuState& state) {
    auto& slot = state.decode_execute;
    if (slot.valid()) {
        dprintf(FLUSH, "冲刷执行级指令 #%lu", slot.get().sequence);
        // 正在迭代的除法不中止，完成后丢弃
        if (div_owner_valid_ && div_owner_ == slot.get().sequence) {
            discard_division_ = true;
            div_owner_valid_ = false;
        }
    }
    slot.clear();
}

} // namespace rvfpu
