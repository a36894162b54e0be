#include "fpu/stages/writeback_stage.h"
#include "fpu/fpu_state.h"
#include "common/debug_types.h"

namespace rvfpu {

void WritebackStage::execute(FpuState& state) {
    auto& slot = state.memory_writeback;
    if (slot.empty()) {
        return;
    }

    const MemoryWritebackLatch& latch = slot.get();
    const ControlTags& tags = latch.tags;

    if (state.inputs.stalled(PipelineStageId::WRITEBACK)) {
        // 停顿期间寄存器堆尚未更新，仍需对执行级前递
        if (tags.fp_write) {
            state.writeback_forward.producer =
                HazardProducer{true, latch.rd, true, tags.result_source, true};
            state.writeback_forward.value = selectWritebackResult(latch, 0).value;
        }
        state.writeback_stalled = true;
        dprintf(STALL, "写回级被外部停顿");
        return;
    }

    const UnitResult result = selectWritebackResult(latch, state.inputs.load_data);
    state.outputs.load_consumed = tags.result_source == ResultSource::LOAD;

    if (tags.fp_write) {
        state.registers.write(latch.rd, result.value);
        state.outputs.fp_write = RegisterWrite{true, latch.rd, result.value};
        state.writeback_forward.producer = HazardProducer{true, latch.rd, true, tags.result_source};
        state.writeback_forward.value = result.value;
        dprintf(WRITEBACK, "#%lu %s 写回 f%d = 0x%016lx (%s)", latch.sequence, opName(tags.op),
                static_cast<int>(latch.rd), result.value, resultSourceName(tags.result_source));
    } else if (tags.int_write) {
        state.outputs.int_write = RegisterWrite{true, latch.rd, result.value};
        dprintf(WRITEBACK, "#%lu %s 写回 x%d = 0x%016lx", latch.sequence, opName(tags.op),
                static_cast<int>(latch.rd), result.value);
    } else {
        dprintf(WRITEBACK, "#%lu %s 提交（无寄存器写）", latch.sequence, opName(tags.op));
    }

    // 加载与存储不产生浮点异常
    if (tags.result_source != ResultSource::LOAD && tags.result_source != ResultSource::NONE) {
        state.outputs.fflags_valid = true;
        state.outputs.fflags = result.flags.toBits();
        if (result.flags.any()) {
            dprintf(WRITEBACK, "#%lu 异常标志 [%s]", latch.sequence, result.flags.toString().c_str());
        }
    }

    state.outputs.retired = true;
    ++state.retired_count;
    slot.clear();
}

void WritebackStage::flush(FpuState& state) {
    if (state.memory_writeback.valid()) {
        dprintf(FLUSH, "冲刷写回级指令 #%lu", state.memory_writeback.get().sequence);
    }
    state.memory_writeback.clear();
}

} // namespace rvfpu
