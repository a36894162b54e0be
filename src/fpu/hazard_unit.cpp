#include "fpu/hazard_unit.h"

namespace rvfpu {

HazardDecision HazardUnit::resolve(const std::array<RegNum, 3>& sources,
                                   const std::array<bool, 3>& uses,
                                   const HazardProducer& memory,
                                   const HazardProducer& writeback) {
    HazardDecision decision;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        if (!uses[i]) {
            continue;
        }
        if (memory.writes(sources[i])) {
            if (memory.source == ResultSource::LOAD) {
                decision.stall = true;
            }
            decision.select[i] = ForwardSelect::MEMORY;
        } else if (writeback.writes(sources[i])) {
            if (writeback.stalled && writeback.source == ResultSource::LOAD) {
                decision.stall = true;
            }
            decision.select[i] = ForwardSelect::WRITEBACK;
        }
    }
    return decision;
}

const char* HazardUnit::selectName(ForwardSelect select) {
    switch (select) {
        case ForwardSelect::REGISTER_FILE: return "RF";
        case ForwardSelect::WRITEBACK:     return "WB";
        case ForwardSelect::MEMORY:        return "MEM";
    }
    return "?";
}

} // namespace rvfpu
