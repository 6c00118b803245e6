#include "instruction.h"

enum InstructionHighNybble
{
    INSN_SYS = 0x0,
    INSN_JP = 0x1,
    INSN_CALL = 0x2,
    INSN_SE_IMM = 0x3,
    INSN_SNE_IMM = 0x4,
    INSN_SE_REG = 0x5,
    INSN_LD_IMM = 0x6,
    INSN_ADD_IMM = 0x7,
    INSN_ALU = 0x8,
    INSN_SNE_REG = 0x9,
    INSN_LD_I = 0xA,
    INSN_JP_V0 = 0xB,
    INSN_RND = 0xC,
    INSN_DRW = 0xD,
    INSN_SKP = 0xE,
    INSN_LD_SPECIAL = 0xF,
};

enum SYSOpcode
{
    SYS_CLS = 0x0E0,
    SYS_RET = 0x0EE,
};

enum ALUOpcode {
    ALU_LD = 0x0,
    ALU_OR = 0x1,
    ALU_AND = 0x2,
    ALU_XOR = 0x3,
    ALU_ADD = 0x4,
    ALU_SUB = 0x5,
    ALU_SHR = 0x6,
    ALU_SUBN = 0x7,
    ALU_SHL = 0xE,
};

enum SKPOpcode {
    SKP_KEY = 0x9E,
    SKNP_KEY = 0xA1,
};

enum SPECIALOpcode
{
    SPECIAL_GET_DELAY = 0x07,
    SPECIAL_KEYWAIT = 0x0A,
    SPECIAL_SET_DELAY = 0x15,
    SPECIAL_SET_SOUND = 0x18,
    SPECIAL_ADD_INDEX = 0x1E,
    SPECIAL_LD_DIGIT = 0x29,
    SPECIAL_LD_BCD = 0x33,
    SPECIAL_LD_IVX = 0x55,
    SPECIAL_LD_VXI = 0x65,
};

std::optional<Instruction> decode(uint16_t instructionWord)
{
    uint8_t imm8Argument = instructionWord & 0x00FF;
    uint8_t imm4Argument = instructionWord & 0x000F;
    uint16_t imm12Argument = instructionWord & 0x0FFF;
    uint8_t xArgument = (instructionWord & 0x0F00) >> 8;
    uint8_t yArgument = (instructionWord & 0x00F0) >> 4;
    int highNybble = instructionWord >> 12;

    switch(highNybble) {
        case INSN_SYS: {
            switch(imm12Argument) {
                case SYS_CLS: return insn::CLS{};
                case SYS_RET: return insn::RET{};
                default: return std::nullopt; // 0nnn SYS calls into host machine code
            }
        }
        case INSN_JP: return insn::JP{imm12Argument};
        case INSN_CALL: return insn::CALL{imm12Argument};
        case INSN_SE_IMM: return insn::SE_IMM{xArgument, imm8Argument};
        case INSN_SNE_IMM: return insn::SNE_IMM{xArgument, imm8Argument};
        case INSN_SE_REG: {
            if(imm4Argument != 0) {
                return std::nullopt;
            }
            return insn::SE_REG{xArgument, yArgument};
        }
        case INSN_LD_IMM: return insn::LD_IMM{xArgument, imm8Argument};
        case INSN_ADD_IMM: return insn::ADD_IMM{xArgument, imm8Argument};
        case INSN_ALU: {
            switch(imm4Argument) {
                case ALU_LD: return insn::LD_REG{xArgument, yArgument};
                case ALU_OR: return insn::OR{xArgument, yArgument};
                case ALU_AND: return insn::AND{xArgument, yArgument};
                case ALU_XOR: return insn::XOR{xArgument, yArgument};
                case ALU_ADD: return insn::ADD{xArgument, yArgument};
                case ALU_SUB: return insn::SUB{xArgument, yArgument};
                case ALU_SHR: return insn::SHR{xArgument, yArgument};
                case ALU_SUBN: return insn::SUBN{xArgument, yArgument};
                case ALU_SHL: return insn::SHL{xArgument, yArgument};
                default: return std::nullopt;
            }
        }
        case INSN_SNE_REG: {
            if(imm4Argument != 0) {
                return std::nullopt;
            }
            return insn::SNE_REG{xArgument, yArgument};
        }
        case INSN_LD_I: return insn::LD_I{imm12Argument};
        case INSN_JP_V0: return insn::JP_V0{imm12Argument};
        case INSN_RND: return insn::RND{xArgument, imm8Argument};
        case INSN_DRW: return insn::DRW{xArgument, yArgument, imm4Argument};
        case INSN_SKP: {
            switch(imm8Argument) {
                case SKP_KEY: return insn::SKP{xArgument};
                case SKNP_KEY: return insn::SKNP{xArgument};
                default: return std::nullopt;
            }
        }
        case INSN_LD_SPECIAL: {
            switch(imm8Argument) {
                case SPECIAL_GET_DELAY: return insn::LD_VX_DT{xArgument};
                case SPECIAL_KEYWAIT: return insn::LD_VX_K{xArgument};
                case SPECIAL_SET_DELAY: return insn::LD_DT_VX{xArgument};
                case SPECIAL_SET_SOUND: return insn::LD_ST_VX{xArgument};
                case SPECIAL_ADD_INDEX: return insn::ADD_I{xArgument};
                case SPECIAL_LD_DIGIT: return insn::LD_F{xArgument};
                case SPECIAL_LD_BCD: return insn::LD_B{xArgument};
                case SPECIAL_LD_IVX: return insn::LD_IVX{xArgument};
                case SPECIAL_LD_VXI: return insn::LD_VXI{xArgument};
                default: return std::nullopt;
            }
        }
    }
    return std::nullopt;
}
