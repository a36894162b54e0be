#pragma once

#include "fpu/control_tags.h"
#include <array>

namespace rvfpu {

// 操作数来源
enum class ForwardSelect : uint8_t {
    REGISTER_FILE = 0,
    WRITEBACK = 1,
    MEMORY = 2
};

/**
 * 在飞指令的写目标（访存级或写回级）
 */
struct HazardProducer {
    bool valid = false;
    RegNum rd = 0;
    bool fp_write = false;
    ResultSource source = ResultSource::NONE;
    bool stalled = false;   // 写回级被停顿，尚未提交

    bool writes(RegNum reg) const { return valid && fp_write && rd == reg; }
};

struct HazardDecision {
    std::array<ForwardSelect, 3> select{ForwardSelect::REGISTER_FILE,
                                        ForwardSelect::REGISTER_FILE,
                                        ForwardSelect::REGISTER_FILE};
    bool stall = false;
};

/**
 * 冒险检测/前递单元
 * 访存级比写回级更年轻，优先前递；访存级的浮点加载要到写回级才有数据，只能停顿
 * 写回级被停顿的加载同样没有可用数据
 */
class HazardUnit {
public:
    static HazardDecision resolve(const std::array<RegNum, 3>& sources,
                                  const std::array<bool, 3>& uses,
                                  const HazardProducer& memory,
                                  const HazardProducer& writeback);

    static const char* selectName(ForwardSelect select);
};

} // namespace rvfpu
