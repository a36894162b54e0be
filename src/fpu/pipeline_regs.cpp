#include "fpu/pipeline_regs.h"

namespace rvfpu {

UnitResult selectMemoryStageResult(const ExecuteMemoryLatch& latch) {
    switch (latch.tags.mem_select) {
        case MemStageSelect::CONVERT:         return latch.convert;
        case MemStageSelect::SIGN_INJECT:     return latch.sign_inject;
        case MemStageSelect::COMPARE:         return latch.compare;
        case MemStageSelect::CLASSIFY:        return latch.classify;
        case MemStageSelect::INT_PASSTHROUGH: return latch.int_passthrough;
        case MemStageSelect::MOVE_TO_INT:     return latch.move_to_int;
        case MemStageSelect::NONE:            break;
    }
    return UnitResult{};
}

UnitResult selectWritebackResult(const MemoryWritebackLatch& latch, uint64_t load_data) {
    switch (latch.tags.result_source) {
        case ResultSource::LOAD: {
            UnitResult loaded;
            loaded.value = boxValue(latch.tags.format, load_data);
            return loaded;
        }
        case ResultSource::FMA:          return latch.fma;
        case ResultSource::ADD_CONVERT:  return latch.add_convert;
        case ResultSource::DIV_SQRT:     return latch.divsqrt;
        case ResultSource::MEMORY_STAGE: return latch.memory_stage;
        case ResultSource::NONE:         break;
    }
    return UnitResult{};
}

} // namespace rvfpu
