#include "fpu/stages/memory_stage.h"
#include "fpu/fpu_state.h"
#include "common/debug_types.h"

namespace rvfpu {

void MemoryStage::execute(FpuState& state) {
    auto& slot = state.execute_memory;
    if (slot.empty()) {
        return;
    }

    const ExecuteMemoryLatch& latch = slot.get();
    const ControlTags& tags = latch.tags;

    MemoryWritebackLatch next;
    next.tags = tags;
    next.rd = latch.rd;
    next.sequence = latch.sequence;

    switch (tags.result_source) {
        case ResultSource::FMA:
            next.fma = FmaUnit::stage2(latch.fma);
            break;
        case ResultSource::ADD_CONVERT:
            next.add_convert = AddConvertUnit::stage2(latch.add_convert);
            break;
        case ResultSource::DIV_SQRT:
            next.divsqrt = latch.divsqrt;
            break;
        case ResultSource::MEMORY_STAGE:
            next.memory_stage = selectMemoryStageResult(latch);
            break;
        case ResultSource::LOAD:
        case ResultSource::NONE:
            break;
    }

    // 本级指令对执行级可见（加载数据未就绪，由冒险单元停顿）
    state.memory_forward.producer = HazardProducer{true, latch.rd, tags.fp_write, tags.result_source};
    state.memory_forward.value = selectWritebackResult(next, 0).value;

    const bool blocked = state.inputs.stalled(PipelineStageId::MEMORY) ||
                         state.memory_writeback.valid();
    if (blocked) {
        state.memory_stalled = true;
        dprintf(STALL, "访存级停顿 #%lu %s", latch.sequence, opName(tags.op));
        return;
    }

    if (tags.store) {
        const uint64_t data = tags.format == FpFormat::SINGLE ? (latch.store_data & 0xFFFFFFFFULL)
                                                              : latch.store_data;
        state.outputs.store_valid = true;
        state.outputs.store_data = data;
        dprintf(MEMORY, "#%lu 存储数据 0x%016lx", latch.sequence, data);
    }

    if (tags.result_source == ResultSource::FMA) {
        state.outputs.reportUnitFlags(next.fma.flags.toBits());
    }

    dprintf(MEMORY, "#%lu %s 进入写回级", latch.sequence, opName(tags.op));
    state.memory_writeback.advance(next);
    slot.clear();
}

void MemoryStage::flush(FpuState& state) {
    if (state.execute_memory.valid()) {
        dprintf(FLUSH, "冲刷访存级指令 #%lu", state.execute_memory.get().sequence);
    }
    state.execute_memory.clear();
}

} // namespace rvfpu
