#include "fpu/stages/decode_stage.h"
#include "fpu/fpu_state.h"
#include "common/debug_types.h"

namespace rvfpu {

void DecodeStage::execute(FpuState& state) {
    refreshHeldOperands(state);

    const bool blocked = state.inputs.stalled(PipelineStageId::DECODE) ||
                         state.decode_execute.valid();
    state.decode_stalled = blocked;
    state.outputs.stall_decode = blocked;

    const bool dropped = drop_incoming_;
    drop_incoming_ = false;

    if (!state.inputs.instruction_valid) {
        return;
    }
    if (dropped) {
        dprintf(FLUSH, "冲刷译码级指令 0x%08x", state.inputs.instruction);
        return;
    }
    if (blocked) {
        dprintf(STALL, "译码级停顿，指令 0x%08x 保持", state.inputs.instruction);
        return;
    }

    DecodedInstruction decoded = state.decoder.decode(state.inputs.instruction, state.inputs.frm);
    if (!decoded.tags.legal) {
        state.outputs.illegal_instruction = true;
        return;
    }

    DecodeExecuteLatch latch;
    latch.inst = decoded;
    latch.operands = state.registers.readOperands(decoded.rs1, decoded.rs2, decoded.rs3);
    latch.int_operand = state.inputs.int_operand;
    latch.sequence = state.next_sequence++;
    state.decode_execute.advance(latch);
}

void DecodeStage::refreshHeldOperands(FpuState& state) {
    // 执行级停顿期间写回的值需要重新从寄存器堆读取
    auto& slot = state.decode_execute;
    if (slot.empty()) {
        return;
    }
    DecodeExecuteLatch& latch = slot.get();
    latch.operands = state.registers.readOperands(latch.inst.rs1, latch.inst.rs2, latch.inst.rs3);
}

void DecodeStage::flush(FpuState& state) {
    (void)state;
    drop_incoming_ = true;
}

} // namespace rvfpu
