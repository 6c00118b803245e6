#include <cstdio>

#include "instruction.h"

namespace {

std::string format(const char *fmt, unsigned a = 0, unsigned b = 0, unsigned c = 0)
{
    char buffer[64];
    snprintf(buffer, sizeof(buffer), fmt, a, b, c);
    return buffer;
}

struct Disassembler
{
    std::string operator()(const insn::CLS&) { return "CLS"; }
    std::string operator()(const insn::RET&) { return "RET"; }
    std::string operator()(const insn::JP& op) { return format("JP %03X", op.address); }
    std::string operator()(const insn::CALL& op) { return format("CALL %03X", op.address); }
    std::string operator()(const insn::SE_IMM& op) { return format("SE V%X, %02X", op.x, op.value); }
    std::string operator()(const insn::SNE_IMM& op) { return format("SNE V%X, %02X", op.x, op.value); }
    std::string operator()(const insn::SE_REG& op) { return format("SE V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::SNE_REG& op) { return format("SNE V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::LD_IMM& op) { return format("LD V%X, %02X", op.x, op.value); }
    std::string operator()(const insn::ADD_IMM& op) { return format("ADD V%X, %02X", op.x, op.value); }
    std::string operator()(const insn::LD_REG& op) { return format("LD V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::OR& op) { return format("OR V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::AND& op) { return format("AND V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::XOR& op) { return format("XOR V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::ADD& op) { return format("ADD V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::SUB& op) { return format("SUB V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::SHR& op) { return format("SHR V%X", op.x); }
    std::string operator()(const insn::SUBN& op) { return format("SUBN V%X, V%X", op.x, op.y); }
    std::string operator()(const insn::SHL& op) { return format("SHL V%X", op.x); }
    std::string operator()(const insn::LD_I& op) { return format("LD I, %03X", op.address); }
    std::string operator()(const insn::JP_V0& op) { return format("JP V0, %03X", op.address); }
    std::string operator()(const insn::RND& op) { return format("RND V%X, %02X", op.x, op.mask); }
    std::string operator()(const insn::DRW& op) { return format("DRW V%X, V%X, %X", op.x, op.y, op.rows); }
    std::string operator()(const insn::SKP& op) { return format("SKP V%X", op.x); }
    std::string operator()(const insn::SKNP& op) { return format("SKNP V%X", op.x); }
    std::string operator()(const insn::LD_VX_DT& op) { return format("LD V%X, DT", op.x); }
    std::string operator()(const insn::LD_VX_K& op) { return format("LD V%X, K", op.x); }
    std::string operator()(const insn::LD_DT_VX& op) { return format("LD DT, V%X", op.x); }
    std::string operator()(const insn::LD_ST_VX& op) { return format("LD ST, V%X", op.x); }
    std::string operator()(const insn::ADD_I& op) { return format("ADD I, V%X", op.x); }
    std::string operator()(const insn::LD_F& op) { return format("LD F, V%X", op.x); }
    std::string operator()(const insn::LD_B& op) { return format("LD B, V%X", op.x); }
    std::string operator()(const insn::LD_IVX& op) { return format("LD [I], V%X", op.x); }
    std::string operator()(const insn::LD_VXI& op) { return format("LD V%X, [I]", op.x); }
};

}

std::string disassemble(const Instruction& instruction)
{
    return std::visit(Disassembler{}, instruction);
}

void disassemble(uint16_t pc, uint16_t instructionWord)
{
    auto instruction = decode(instructionWord);
    if(instruction) {
        printf("%04X: (%04X) %s\n", pc, instructionWord, disassemble(*instruction).c_str());
    } else {
        printf("%04X: (%04X) ???\n", pc, instructionWord);
    }
}
