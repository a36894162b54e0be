#pragma once

#include "common/types.h"
#include <istream>
#include <string>
#include <vector>

namespace rvfpu {

/**
 * 指令序列文件中的一项
 */
struct TraceEntry {
    enum class Kind : uint8_t {
        SET_FRM,        // .frm N
        SET_FREG,       // .freg fN 0xHEX
        INSTRUCTION     // <hex> [int=0x..] [load=0x..]
    };

    Kind kind = Kind::INSTRUCTION;
    std::size_t line = 0;

    uint8_t frm = 0;
    RegNum reg = 0;
    uint64_t value = 0;

    Instruction instruction = 0;
    uint64_t int_operand = 0;
    bool has_load = false;
    uint64_t load_data = 0;
};

/**
 * 指令序列：每行一项，'#' 之后为注释
 */
class TraceProgram {
public:
    // 格式错误时抛出 TraceFormatException
    static TraceProgram parse(std::istream& input, const std::string& name = "<stream>");
    static TraceProgram loadFromFile(const std::string& filename);

    const std::vector<TraceEntry>& entries() const { return entries_; }
    const std::string& name() const { return name_; }
    std::size_t instructionCount() const;

private:
    static TraceEntry parseLine(const std::string& text, std::size_t line, const std::string& name);

    std::string name_;
    std::vector<TraceEntry> entries_;
};

} // namespace rvfpu
