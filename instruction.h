#ifndef PHOSPHOR8_INSTRUCTION_H
#define PHOSPHOR8_INSTRUCTION_H

#include <optional>
#include <string>
#include <variant>
#include <cstdint>

// One struct per CHIP-8 instruction.  x and y are register numbers, the
// address fields are already masked to 12 bits.
namespace insn
{
    struct CLS {};                                      // 00E0
    struct RET {};                                      // 00EE
    struct JP { uint16_t address; };                    // 1nnn
    struct CALL { uint16_t address; };                  // 2nnn
    struct SE_IMM { uint8_t x; uint8_t value; };        // 3xkk
    struct SNE_IMM { uint8_t x; uint8_t value; };       // 4xkk
    struct SE_REG { uint8_t x; uint8_t y; };            // 5xy0
    struct LD_IMM { uint8_t x; uint8_t value; };        // 6xkk
    struct ADD_IMM { uint8_t x; uint8_t value; };       // 7xkk
    struct LD_REG { uint8_t x; uint8_t y; };            // 8xy0
    struct OR { uint8_t x; uint8_t y; };                // 8xy1
    struct AND { uint8_t x; uint8_t y; };               // 8xy2
    struct XOR { uint8_t x; uint8_t y; };               // 8xy3
    struct ADD { uint8_t x; uint8_t y; };               // 8xy4
    struct SUB { uint8_t x; uint8_t y; };               // 8xy5
    struct SHR { uint8_t x; uint8_t y; };               // 8xy6
    struct SUBN { uint8_t x; uint8_t y; };              // 8xy7
    struct SHL { uint8_t x; uint8_t y; };               // 8xyE
    struct SNE_REG { uint8_t x; uint8_t y; };           // 9xy0
    struct LD_I { uint16_t address; };                  // Annn
    struct JP_V0 { uint16_t address; };                 // Bnnn
    struct RND { uint8_t x; uint8_t mask; };            // Cxkk
    struct DRW { uint8_t x; uint8_t y; uint8_t rows; }; // Dxyn
    struct SKP { uint8_t x; };                          // Ex9E
    struct SKNP { uint8_t x; };                         // ExA1
    struct LD_VX_DT { uint8_t x; };                     // Fx07
    struct LD_VX_K { uint8_t x; };                      // Fx0A
    struct LD_DT_VX { uint8_t x; };                     // Fx15
    struct LD_ST_VX { uint8_t x; };                     // Fx18
    struct ADD_I { uint8_t x; };                        // Fx1E
    struct LD_F { uint8_t x; };                         // Fx29
    struct LD_B { uint8_t x; };                         // Fx33
    struct LD_IVX { uint8_t x; };                       // Fx55
    struct LD_VXI { uint8_t x; };                       // Fx65
}

typedef std::variant<
    insn::CLS, insn::RET, insn::JP, insn::CALL,
    insn::SE_IMM, insn::SNE_IMM, insn::SE_REG, insn::SNE_REG,
    insn::LD_IMM, insn::ADD_IMM,
    insn::LD_REG, insn::OR, insn::AND, insn::XOR, insn::ADD, insn::SUB, insn::SHR, insn::SUBN, insn::SHL,
    insn::LD_I, insn::JP_V0, insn::RND, insn::DRW,
    insn::SKP, insn::SKNP,
    insn::LD_VX_DT, insn::LD_VX_K, insn::LD_DT_VX, insn::LD_ST_VX,
    insn::ADD_I, insn::LD_F, insn::LD_B, insn::LD_IVX, insn::LD_VXI
> Instruction;

// Classify a 16-bit instruction word.  Returns an empty optional for words
// that match no instruction.
std::optional<Instruction> decode(uint16_t instructionWord);

std::string disassemble(const Instruction& instruction);

// Print "PC: (WORD) MNEMONIC" to stdout, or "???" for undecodable words.
void disassemble(uint16_t pc, uint16_t instructionWord);

#endif // PHOSPHOR8_INSTRUCTION_H
