// ==============================================================================
// Instruction Decoder Tests
// ==============================================================================

#include "test_support.h"
#include "fault.h"
#include "instruction.h"

template <class T>
static bool decodesAs(uint16_t word) {
    auto d = decode(word);
    return d && std::holds_alternative<T>(*d);
}

void test_decode_system() {
    std::cout << "--- System instructions ---\n";
    check(decodesAs<insn::CLS>(0x00E0), "00E0 is CLS");
    check(decodesAs<insn::RET>(0x00EE), "00EE is RET");
    check(!decode(0x0000), "0000 is not an instruction");
    check(!decode(0x0123), "0nnn SYS is rejected");
    check(!decode(0x00FF), "SCHIP 00FF is rejected");
}

void test_decode_jumps() {
    std::cout << "--- Jumps ---\n";
    auto d = decode(0x1ABC);
    check(d && std::get<insn::JP>(*d).address == 0xABC, "1ABC is JP ABC");
    d = decode(0x2FFF);
    check(d && std::get<insn::CALL>(*d).address == 0xFFF, "2FFF is CALL FFF");
    d = decode(0xB123);
    check(d && std::get<insn::JP_V0>(*d).address == 0x123, "B123 is JP V0, 123");
    d = decode(0xA456);
    check(d && std::get<insn::LD_I>(*d).address == 0x456, "A456 is LD I, 456");
}

void test_decode_register_fields() {
    std::cout << "--- Register fields ---\n";
    auto d = decode(0x3A42);
    check(d && std::get<insn::SE_IMM>(*d).x == 0xA && std::get<insn::SE_IMM>(*d).value == 0x42, "3A42 fields");
    d = decode(0x4B07);
    check(d && std::get<insn::SNE_IMM>(*d).x == 0xB && std::get<insn::SNE_IMM>(*d).value == 0x07, "4B07 fields");
    d = decode(0x5120);
    check(d && std::get<insn::SE_REG>(*d).x == 1 && std::get<insn::SE_REG>(*d).y == 2, "5120 fields");
    d = decode(0x9340);
    check(d && std::get<insn::SNE_REG>(*d).x == 3 && std::get<insn::SNE_REG>(*d).y == 4, "9340 fields");
    d = decode(0xD12F);
    check(d && std::get<insn::DRW>(*d).x == 1 && std::get<insn::DRW>(*d).y == 2 && std::get<insn::DRW>(*d).rows == 0xF,
        "D12F fields");
    d = decode(0xC5F0);
    check(d && std::get<insn::RND>(*d).x == 5 && std::get<insn::RND>(*d).mask == 0xF0, "C5F0 fields");
}

void test_decode_alu() {
    std::cout << "--- ALU ---\n";
    check(decodesAs<insn::LD_REG>(0x8120), "8xy0 LD");
    check(decodesAs<insn::OR>(0x8121), "8xy1 OR");
    check(decodesAs<insn::AND>(0x8122), "8xy2 AND");
    check(decodesAs<insn::XOR>(0x8123), "8xy3 XOR");
    check(decodesAs<insn::ADD>(0x8124), "8xy4 ADD");
    check(decodesAs<insn::SUB>(0x8125), "8xy5 SUB");
    check(decodesAs<insn::SHR>(0x8126), "8xy6 SHR");
    check(decodesAs<insn::SUBN>(0x8127), "8xy7 SUBN");
    check(decodesAs<insn::SHL>(0x812E), "8xyE SHL");
    for (uint16_t n : {0x8u, 0x9u, 0xAu, 0xBu, 0xCu, 0xDu, 0xFu}) {
        check(!decode(0x8120 | n), "8xy" + std::to_string(n) + " is rejected");
    }
    check(decodesAs<insn::ADD_IMM>(0x7F01), "7xkk ADD imm");
    check(decodesAs<insn::LD_IMM>(0x6F01), "6xkk LD imm");
}

void test_decode_low_nibble_variants() {
    std::cout << "--- Low nibble checks ---\n";
    check(!decode(0x5121), "5xy1 is rejected");
    check(!decode(0x912F), "9xyF is rejected");
}

void test_decode_keys_and_special() {
    std::cout << "--- E and F series ---\n";
    check(decodesAs<insn::SKP>(0xE39E), "Ex9E SKP");
    check(decodesAs<insn::SKNP>(0xE3A1), "ExA1 SKNP");
    check(!decode(0xE300), "Ex00 is rejected");
    check(decodesAs<insn::LD_VX_DT>(0xF207), "Fx07");
    check(decodesAs<insn::LD_VX_K>(0xF20A), "Fx0A");
    check(decodesAs<insn::LD_DT_VX>(0xF215), "Fx15");
    check(decodesAs<insn::LD_ST_VX>(0xF218), "Fx18");
    check(decodesAs<insn::ADD_I>(0xF21E), "Fx1E");
    check(decodesAs<insn::LD_F>(0xF229), "Fx29");
    check(decodesAs<insn::LD_B>(0xF233), "Fx33");
    check(decodesAs<insn::LD_IVX>(0xF255), "Fx55");
    check(decodesAs<insn::LD_VXI>(0xF265), "Fx65");
    check(!decode(0xF230), "SCHIP Fx30 is rejected");
    check(!decode(0xF000), "XO-CHIP F000 is rejected");
    check(!decode(0xF2FF), "FxFF is rejected");
}

void test_decode_exhaustive() {
    std::cout << "--- Every word ---\n";
    int known = 0;
    for (uint32_t word = 0; word <= 0xFFFF; word++) {
        if (decode(static_cast<uint16_t>(word))) {
            known++;
        }
    }
    // CLS and RET, every word of 1-4, 6, 7 and A-D, 5xy0 and 9xy0,
    // 9 ALU ops per register pair, 2 key ops and 9 F ops per register
    int expected = 2 + 10 * 4096 + 2 * 256 + 9 * 256 + 2 * 16 + 9 * 16;
    check(known == expected, "number of decodable words is " + std::to_string(expected));
}

void test_disassembly() {
    std::cout << "--- Disassembly ---\n";
    check(disassemble(*decode(0x00E0)) == "CLS", "CLS text");
    check(disassemble(*decode(0x1ABC)) == "JP ABC", "JP text");
    check(disassemble(*decode(0x3A42)) == "SE VA, 42", "SE text");
    check(disassemble(*decode(0x8124)) == "ADD V1, V2", "ADD text");
    check(disassemble(*decode(0xD125)) == "DRW V1, V2, 5", "DRW text");
    check(disassemble(*decode(0xF355)) == "LD [I], V3", "store text");
    check(disassemble(*decode(0xF365)) == "LD V3, [I]", "load text");
}

void test_fault_description() {
    std::cout << "--- Fault text ---\n";
    Fault fault;
    fault.kind = DECODE_FAULT;
    fault.pc = 0x204;
    fault.instructionWord = 0x0123;
    check(describeFault(fault) == "0204: (0123) ??? - unknown instruction", "decode fault text");

    fault.kind = MEMORY_FAULT;
    fault.pc = 0x300;
    fault.instructionWord = 0xF255;
    fault.address = 0x1001;
    check(describeFault(fault) == "0300: (F255) LD [I], V2 - memory access out of range at 1001", "memory fault text");

    check(isFault(STACK_OVERFLOW) && isFault(STACK_UNDERFLOW) && !isFault(CONTINUE) && !isFault(WAITING_FOR_KEY),
        "fault classification");
}

int main() {
    std::cout << "=== Decoder Tests ===\n\n";

    test_decode_system();
    test_decode_jumps();
    test_decode_register_fields();
    test_decode_alu();
    test_decode_low_nibble_variants();
    test_decode_keys_and_special();
    test_decode_exhaustive();
    test_disassembly();
    test_fault_description();

    return report("Decoder Tests");
}
