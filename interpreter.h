#ifndef PHOSPHOR8_INTERPRETER_H
#define PHOSPHOR8_INTERPRETER_H

#include <array>
#include <random>
#include <cstdio>
#include <cstdint>

#include "debug.h"
#include "display.h"
#include "fault.h"
#include "instruction.h"
#include "memory.h"

constexpr int REGISTER_COUNT = 16;
constexpr int STACK_DEPTH = 16;
constexpr int KEY_COUNT = 16;
constexpr uint16_t INSTRUCTION_SIZE = 2;

// MEMORY provides contains(), read(), store(), fetch() and
// getDigitLocation() like Memory.  INTERFACE provides pressed(key),
// startSound() and stopSound().
template <class MEMORY, class INTERFACE>
struct Chip8Interpreter
{
    uint64_t clock = 0;

    std::array<uint8_t, REGISTER_COUNT> registers = {0};
    std::array<uint16_t, STACK_DEPTH> stack = {0};
    uint8_t sp = 0;
    uint16_t I = 0;
    uint16_t pc = PROGRAM_START;
    uint8_t DT = 0;
    uint8_t ST = 0;

    Fault fault;

    std::random_device r;
    std::default_random_engine e1;
    std::uniform_int_distribution<int> uniform_dist;

    bool waitingForKeyPress = false;
    bool waitingForKeyRelease = false;
    uint8_t keyPressed = 0;
    uint8_t keyDestinationRegister = 0;

    explicit Chip8Interpreter(uint16_t initialPC = PROGRAM_START) :
        pc(initialPC),
        e1(r()),
        uniform_dist(0, 255)
    {
    }

    void reset(uint16_t initialPC = PROGRAM_START)
    {
        clock = 0;
        registers.fill(0);
        stack.fill(0);
        sp = 0;
        I = 0;
        pc = initialPC;
        DT = 0;
        ST = 0;
        fault = Fault();
        waitingForKeyPress = false;
        waitingForKeyRelease = false;
    }

    void seed(uint32_t value)
    {
        e1.seed(value);
    }

    bool soundActive() const
    {
        return ST > 0;
    }

    // Step over the instruction that last faulted.  pc stays within 12 bits.
    void skipInstruction()
    {
        pc = (pc + INSTRUCTION_SIZE) & ADDRESS_MASK;
    }

    // 60Hz timer decrement.
    void tick(INTERFACE& interface)
    {
        if(DT > 0) {
            DT--;
        }
        if(ST > 0) {
            ST--;
            if(ST == 0) {
                interface.stopSound();
            }
        }
    }

    // Fetch, decode and execute one instruction.  On a fault nothing is
    // modified, pc still addresses the faulting instruction and "fault"
    // describes it.
    StepResult step(MEMORY& memory, PhosphorDisplay& display, INTERFACE& interface)
    {
        if(waitingForKeyPress) {

            bool isPressed = false;
            uint8_t whichKey = 0;

            for(uint8_t i = 0; i < KEY_COUNT; i++) {
                if(interface.pressed(i)) {
                    isPressed = true;
                    whichKey = i;
                }
            }

            if(isPressed) {
                if(debug & DEBUG_KEYS) {
                    printf("pressed %d now wait for release\n", whichKey);
                }
                keyPressed = whichKey;
                waitingForKeyPress = false;
                waitingForKeyRelease = true;
            }
            return WAITING_FOR_KEY;
        }

        if(waitingForKeyRelease) {
            if(interface.pressed(keyPressed)) {
                return WAITING_FOR_KEY;
            }
            if(debug & DEBUG_KEYS) {
                printf("key wait over\n");
            }
            waitingForKeyRelease = false;
            registers[keyDestinationRegister] = keyPressed;
            return CONTINUE;
        }

        Cycle cycle{memory, display, interface, 0, static_cast<uint16_t>((pc + INSTRUCTION_SIZE) & ADDRESS_MASK)};

        uint8_t bytes[INSTRUCTION_SIZE];
        if(!memory.fetch(pc, bytes, INSTRUCTION_SIZE)) {
            return recordFault(MEMORY_FAULT, cycle, pc + INSTRUCTION_SIZE - 1);
        }
        cycle.instructionWord = bytes[0] * 256 + bytes[1];

        if(debug & DEBUG_STATE) {
            printf("CHIP8: clk:%llu pc:%04X I:%04X ", static_cast<unsigned long long>(clock), pc, I);
            for(int i = 0; i < REGISTER_COUNT; i++) {
                printf("%02X ", registers[i]);
            }
            puts("");
        }

        if(debug & DEBUG_ASM) {
            disassemble(pc, cycle.instructionWord);
        }

        auto instruction = decode(cycle.instructionWord);
        if(!instruction) {
            return recordFault(DECODE_FAULT, cycle);
        }

        StepResult result = std::visit([&](const auto& op) { return execute(op, cycle); }, *instruction);
        if(result == CONTINUE) {
            pc = cycle.nextPC;
            clock++;
        }
        return result;
    }

private:

    struct Cycle
    {
        MEMORY& memory;
        PhosphorDisplay& display;
        INTERFACE& interface;
        uint16_t instructionWord;
        uint16_t nextPC;
    };

    StepResult recordFault(StepResult kind, const Cycle& cycle, uint32_t address = 0)
    {
        fault.kind = kind;
        fault.pc = pc;
        fault.instructionWord = cycle.instructionWord;
        fault.address = address;
        return kind;
    }

    void skipNext(Cycle& cycle)
    {
        cycle.nextPC = (cycle.nextPC + INSTRUCTION_SIZE) & ADDRESS_MASK;
    }

    void storeALUResult(int destination, uint8_t result, bool f)
    {
        registers[destination] = result;
        registers[0xF] = f ? 1 : 0;
    }

    StepResult execute(const insn::CLS&, Cycle& cycle) // 00E0 - CLS - Clear the display.
    {
        cycle.display.clear();
        return CONTINUE;
    }

    StepResult execute(const insn::RET&, Cycle& cycle) // 00EE - RET - Return from a subroutine.
    {
        if(sp == 0) {
            return recordFault(STACK_UNDERFLOW, cycle);
        }
        sp--;
        cycle.nextPC = stack[sp];
        return CONTINUE;
    }

    StepResult execute(const insn::JP& op, Cycle& cycle) // 1nnn - JP addr
    {
        cycle.nextPC = op.address & ADDRESS_MASK;
        return CONTINUE;
    }

    StepResult execute(const insn::CALL& op, Cycle& cycle) // 2nnn - CALL addr - push the return address, then jump.
    {
        if(sp >= STACK_DEPTH) {
            return recordFault(STACK_OVERFLOW, cycle);
        }
        stack[sp] = cycle.nextPC;
        sp++;
        cycle.nextPC = op.address & ADDRESS_MASK;
        return CONTINUE;
    }

    StepResult execute(const insn::SE_IMM& op, Cycle& cycle) // 3xkk - SE Vx, byte
    {
        if(registers[op.x] == op.value) {
            skipNext(cycle);
        }
        return CONTINUE;
    }

    StepResult execute(const insn::SNE_IMM& op, Cycle& cycle) // 4xkk - SNE Vx, byte
    {
        if(registers[op.x] != op.value) {
            skipNext(cycle);
        }
        return CONTINUE;
    }

    StepResult execute(const insn::SE_REG& op, Cycle& cycle) // 5xy0 - SE Vx, Vy
    {
        if(registers[op.x] == registers[op.y]) {
            skipNext(cycle);
        }
        return CONTINUE;
    }

    StepResult execute(const insn::SNE_REG& op, Cycle& cycle) // 9xy0 - SNE Vx, Vy
    {
        if(registers[op.x] != registers[op.y]) {
            skipNext(cycle);
        }
        return CONTINUE;
    }

    StepResult execute(const insn::LD_IMM& op, Cycle&) // 6xkk - LD Vx, byte
    {
        registers[op.x] = op.value;
        return CONTINUE;
    }

    StepResult execute(const insn::ADD_IMM& op, Cycle&) // 7xkk - ADD Vx, byte - VF untouched.
    {
        registers[op.x] = registers[op.x] + op.value;
        return CONTINUE;
    }

    StepResult execute(const insn::LD_REG& op, Cycle&) // 8xy0 - LD Vx, Vy
    {
        registers[op.x] = registers[op.y];
        return CONTINUE;
    }

    StepResult execute(const insn::OR& op, Cycle&) // 8xy1 - OR Vx, Vy
    {
        registers[op.x] |= registers[op.y];
        return CONTINUE;
    }

    StepResult execute(const insn::AND& op, Cycle&) // 8xy2 - AND Vx, Vy
    {
        registers[op.x] &= registers[op.y];
        return CONTINUE;
    }

    StepResult execute(const insn::XOR& op, Cycle&) // 8xy3 - XOR Vx, Vy
    {
        registers[op.x] ^= registers[op.y];
        return CONTINUE;
    }

    StepResult execute(const insn::ADD& op, Cycle&) // 8xy4 - ADD Vx, Vy - VF = carry.
    {
        int sum = registers[op.x] + registers[op.y];
        storeALUResult(op.x, sum & 0xFF, sum > 0xFF);
        return CONTINUE;
    }

    StepResult execute(const insn::SUB& op, Cycle&) // 8xy5 - SUB Vx, Vy - VF = NOT borrow.
    {
        uint8_t result = registers[op.x] - registers[op.y];
        storeALUResult(op.x, result, registers[op.x] >= registers[op.y]);
        return CONTINUE;
    }

    StepResult execute(const insn::SUBN& op, Cycle&) // 8xy7 - SUBN Vx, Vy - Vx = Vy - Vx, VF = NOT borrow.
    {
        uint8_t result = registers[op.y] - registers[op.x];
        storeALUResult(op.x, result, registers[op.y] >= registers[op.x]);
        return CONTINUE;
    }

    StepResult execute(const insn::SHR& op, Cycle&) // 8xy6 - SHR Vx - VF = bit shifted out.
    {
        uint8_t value = registers[op.x];
        storeALUResult(op.x, value >> 1, value & 0x01);
        return CONTINUE;
    }

    StepResult execute(const insn::SHL& op, Cycle&) // 8xyE - SHL Vx - VF = bit shifted out.
    {
        uint8_t value = registers[op.x];
        storeALUResult(op.x, value << 1, value & 0x80);
        return CONTINUE;
    }

    StepResult execute(const insn::LD_I& op, Cycle&) // Annn - LD I, addr
    {
        I = op.address & ADDRESS_MASK;
        return CONTINUE;
    }

    StepResult execute(const insn::JP_V0& op, Cycle& cycle) // Bnnn - JP V0, addr
    {
        cycle.nextPC = (op.address + registers[0]) & ADDRESS_MASK;
        return CONTINUE;
    }

    StepResult execute(const insn::RND& op, Cycle&) // Cxkk - RND Vx, byte - random byte AND kk.
    {
        registers[op.x] = uniform_dist(e1) & op.mask;
        return CONTINUE;
    }

    StepResult execute(const insn::DRW& op, Cycle& cycle)
    {
        // Dxyn - DRW Vx, Vy, nibble - Display n-byte sprite starting at memory location I at (Vx, Vy), set VF = collision.
        // Sprites are XORed onto the existing screen. If this causes any pixels to be erased,
        // VF is set to 1, otherwise it is set to 0. If the sprite is positioned so part of it
        // is outside the coordinates of the display, it wraps around to the opposite side of
        // the screen.
        uint8_t sprite[16];
        if(!cycle.memory.fetch(I, sprite, op.rows)) {
            return recordFault(MEMORY_FAULT, cycle, I + op.rows - 1);
        }
        uint32_t originX = registers[op.x];
        uint32_t originY = registers[op.y];
        bool erased = false;
        for(uint32_t rowIndex = 0; rowIndex < op.rows; rowIndex++) {
            uint8_t byte = sprite[rowIndex];
            for(uint32_t bitIndex = 0; bitIndex < 8; bitIndex++) {
                if((byte >> (7 - bitIndex)) & 0x1) {
                    uint32_t x = (originX + bitIndex) % DISPLAY_WIDTH;
                    uint32_t y = (originY + rowIndex) % DISPLAY_HEIGHT;
                    if(debug & DEBUG_DRAW) {
                        printf("draw %d %d (%d)\n", x, y, x + y * DISPLAY_WIDTH);
                    }
                    erased |= cycle.display.draw(x, y);
                }
            }
        }
        registers[0xF] = erased ? 1 : 0;
        return CONTINUE;
    }

    StepResult execute(const insn::SKP& op, Cycle& cycle) // Ex9E - SKP Vx - Skip next instruction if key Vx is down.
    {
        uint8_t key = registers[op.x] & 0xF;
        if(cycle.interface.pressed(key)) {
            if(debug & DEBUG_KEYS) {
                printf("clock %llu, pc %04X, SKP_KEY, key %d pressed\n", static_cast<unsigned long long>(clock), pc, key);
            }
            skipNext(cycle);
        }
        return CONTINUE;
    }

    StepResult execute(const insn::SKNP& op, Cycle& cycle) // ExA1 - SKNP Vx - Skip next instruction if key Vx is up.
    {
        uint8_t key = registers[op.x] & 0xF;
        if(!cycle.interface.pressed(key)) {
            skipNext(cycle);
        } else {
            if(debug & DEBUG_KEYS) {
                printf("clock %llu, pc %04X, SKNP_KEY, key %d pressed\n", static_cast<unsigned long long>(clock), pc, key);
            }
        }
        return CONTINUE;
    }

    StepResult execute(const insn::LD_VX_DT& op, Cycle&) // Fx07 - LD Vx, DT
    {
        registers[op.x] = DT;
        return CONTINUE;
    }

    StepResult execute(const insn::LD_VX_K& op, Cycle&) // Fx0A - LD Vx, K - Wait for a key press and release, store the key in Vx.
    {
        if(debug & DEBUG_KEYS) {
            printf("waiting for key\n");
        }
        waitingForKeyPress = true;
        keyDestinationRegister = op.x;
        return CONTINUE;
    }

    StepResult execute(const insn::LD_DT_VX& op, Cycle&) // Fx15 - LD DT, Vx
    {
        DT = registers[op.x];
        return CONTINUE;
    }

    StepResult execute(const insn::LD_ST_VX& op, Cycle& cycle) // Fx18 - LD ST, Vx
    {
        bool wasSounding = ST > 0;
        ST = registers[op.x];
        if((ST > 0) && !wasSounding) {
            cycle.interface.startSound();
        } else if((ST == 0) && wasSounding) {
            cycle.interface.stopSound();
        }
        return CONTINUE;
    }

    StepResult execute(const insn::ADD_I& op, Cycle&) // Fx1E - ADD I, Vx - VF = 1 if I passes 0xFFF.
    {
        uint32_t sum = I + registers[op.x];
        I = sum & ADDRESS_MASK;
        registers[0xF] = (sum > ADDRESS_MASK) ? 1 : 0;
        return CONTINUE;
    }

    StepResult execute(const insn::LD_F& op, Cycle& cycle) // Fx29 - LD F, Vx - I = font glyph for digit Vx.
    {
        I = cycle.memory.getDigitLocation(registers[op.x]);
        return CONTINUE;
    }

    StepResult execute(const insn::LD_B& op, Cycle& cycle) // Fx33 - LD B, Vx - BCD of Vx at I, I+1, I+2.
    {
        uint8_t value = registers[op.x];
        uint8_t digits[3] = {
            static_cast<uint8_t>(value / 100),
            static_cast<uint8_t>((value % 100) / 10),
            static_cast<uint8_t>(value % 10),
        };
        if(!cycle.memory.store(I, digits, 3)) {
            return recordFault(MEMORY_FAULT, cycle, I + 2);
        }
        return CONTINUE;
    }

    StepResult execute(const insn::LD_IVX& op, Cycle& cycle) // Fx55 - LD [I], Vx - Store V0 through Vx at I.  I is unchanged.
    {
        if(!cycle.memory.store(I, registers.data(), op.x + 1)) {
            return recordFault(MEMORY_FAULT, cycle, I + op.x);
        }
        return CONTINUE;
    }

    StepResult execute(const insn::LD_VXI& op, Cycle& cycle) // Fx65 - LD Vx, [I] - Load V0 through Vx from I.  I is unchanged.
    {
        if(!cycle.memory.fetch(I, registers.data(), op.x + 1)) {
            return recordFault(MEMORY_FAULT, cycle, I + op.x);
        }
        return CONTINUE;
    }
};

#endif // PHOSPHOR8_INTERPRETER_H
