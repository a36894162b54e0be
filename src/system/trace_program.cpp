#include "system/trace_program.h"
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace rvfpu {

namespace {

uint64_t parseNumber(const std::string& token, std::size_t line, const std::string& name) {
    try {
        std::size_t consumed = 0;
        const uint64_t value = std::stoull(token, &consumed, 0);
        if (consumed != token.size()) {
            throw TraceFormatException(fmt::format("{}:{}: 无法解析数值 '{}'", name, line, token));
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw TraceFormatException(fmt::format("{}:{}: 无法解析数值 '{}'", name, line, token));
    } catch (const std::out_of_range&) {
        throw TraceFormatException(fmt::format("{}:{}: 数值超出范围 '{}'", name, line, token));
    }
}

// 十六进制，可带或不带 0x 前缀；前导 '-' 取补码（整数操作数）
uint64_t parseHex(const std::string& token, std::size_t line, const std::string& name) {
    if (token.size() > 1 && token[0] == '-') {
        return ~parseHex(token.substr(1), line, name) + 1;
    }
    if (token.rfind("0x", 0) == 0 || token.rfind("0X", 0) == 0) {
        return parseNumber(token, line, name);
    }
    return parseNumber("0x" + token, line, name);
}

} // namespace

TraceProgram TraceProgram::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw TraceFormatException("无法打开文件: " + filename);
    }
    return parse(file, filename);
}

TraceProgram TraceProgram::parse(std::istream& input, const std::string& name) {
    TraceProgram program;
    program.name_ = name;

    std::string text;
    std::size_t line = 0;
    while (std::getline(input, text)) {
        ++line;
        const auto comment = text.find('#');
        if (comment != std::string::npos) {
            text.erase(comment);
        }
        if (text.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        program.entries_.push_back(parseLine(text, line, name));
    }
    return program;
}

TraceEntry TraceProgram::parseLine(const std::string& text, std::size_t line, const std::string& name) {
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }

    TraceEntry entry;
    entry.line = line;

    if (tokens[0] == ".frm") {
        if (tokens.size() != 2) {
            throw TraceFormatException(fmt::format("{}:{}: .frm 需要一个参数", name, line));
        }
        const uint64_t frm = parseNumber(tokens[1], line, name);
        if (frm > 7) {
            throw TraceFormatException(fmt::format("{}:{}: frm 取值 {} 超出 0-7", name, line, frm));
        }
        entry.kind = TraceEntry::Kind::SET_FRM;
        entry.frm = static_cast<uint8_t>(frm);
        return entry;
    }

    if (tokens[0] == ".freg") {
        if (tokens.size() != 3 || tokens[1].size() < 2 || tokens[1][0] != 'f') {
            throw TraceFormatException(fmt::format("{}:{}: 用法 .freg fN <hex>", name, line));
        }
        const uint64_t reg = parseNumber(tokens[1].substr(1), line, name);
        if (reg >= 32) {
            throw TraceFormatException(fmt::format("{}:{}: 寄存器 {} 超出范围", name, line, tokens[1]));
        }
        entry.kind = TraceEntry::Kind::SET_FREG;
        entry.reg = static_cast<RegNum>(reg);
        entry.value = parseHex(tokens[2], line, name);
        return entry;
    }

    if (tokens[0][0] == '.') {
        throw TraceFormatException(fmt::format("{}:{}: 未知指示符 {}", name, line, tokens[0]));
    }

    entry.kind = TraceEntry::Kind::INSTRUCTION;
    const uint64_t word = parseHex(tokens[0], line, name);
    if (word > 0xFFFFFFFFULL) {
        throw TraceFormatException(fmt::format("{}:{}: 指令字超过32位", name, line));
    }
    entry.instruction = static_cast<Instruction>(word);

    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const std::string& option = tokens[i];
        if (option.rfind("int=", 0) == 0) {
            entry.int_operand = parseHex(option.substr(4), line, name);
        } else if (option.rfind("load=", 0) == 0) {
            entry.has_load = true;
            entry.load_data = parseHex(option.substr(5), line, name);
        } else {
            throw TraceFormatException(fmt::format("{}:{}: 未知选项 {}", name, line, option));
        }
    }
    return entry;
}

std::size_t TraceProgram::instructionCount() const {
    std::size_t count = 0;
    for (const auto& entry : entries_) {
        if (entry.kind == TraceEntry::Kind::INSTRUCTION) {
            ++count;
        }
    }
    return count;
}

} // namespace rvfpu
