#ifndef PHOSPHOR8_MACHINE_H
#define PHOSPHOR8_MACHINE_H

#include <algorithm>
#include <vector>
#include <cstdio>
#include <cstdint>

#include "debug.h"
#include "display.h"
#include "fault.h"
#include "interpreter.h"
#include "memory.h"
#include "timer.h"

constexpr int DEFAULT_CYCLES_PER_FRAME = 10;

// Everything one CHIP-8 session mutates, plus the per-frame schedule that
// drives it.
template <class INTERFACE>
struct Chip8Machine
{
    Memory memory;
    PhosphorDisplay display;
    Chip8Interpreter<Memory, INTERFACE> interpreter;
    TimerClock timerClock;
    std::vector<uint8_t> program;
    int cyclesPerFrame = DEFAULT_CYCLES_PER_FRAME;
    uint64_t frames = 0;

    explicit Chip8Machine(int cyclesPerFrame = DEFAULT_CYCLES_PER_FRAME, float decay = DEFAULT_DECAY) :
        display(decay)
    {
        setCyclesPerFrame(cyclesPerFrame);
    }

    // Replace the program and restart.  Returns false, leaving the machine
    // untouched, if the ROM does not fit above PROGRAM_START.
    bool loadProgram(const std::vector<uint8_t>& rom, INTERFACE& interface)
    {
        if(rom.size() > PROGRAM_CAPACITY) {
            return false;
        }
        program = rom;
        return restart(interface);
    }

    // Reload the current program and reset registers, timers and display.
    // A tone that was playing is stopped along with the sound timer.
    bool restart(INTERFACE& interface)
    {
        if(interpreter.soundActive()) {
            interface.stopSound();
        }
        memory.reset();
        if(!memory.loadProgram(program)) {
            return false;
        }
        interpreter.reset(PROGRAM_START);
        display.reset();
        timerClock.reset();
        frames = 0;
        return true;
    }

    void setCyclesPerFrame(int cycles)
    {
        cyclesPerFrame = std::max(cycles, 1);
    }

    void setDecay(float decay)
    {
        display.setDecay(decay);
    }

    // One rendered frame: run cyclesPerFrame instructions, then the 60Hz
    // timers for the wall-clock time that passed, then the phosphor.  An
    // instruction fault ends the frame's instructions early and is
    // returned; the timers and phosphor still advance.
    StepResult runFrame(INTERFACE& interface, double elapsedSeconds)
    {
        StepResult result = CONTINUE;
        int cycles = 0;
        while(cycles < cyclesPerFrame) {
            result = interpreter.step(memory, display, interface);
            cycles++;
            if(isFault(result)) {
                break;
            }
        }

        int ticks = timerClock.advance(elapsedSeconds);
        for(int i = 0; i < ticks; i++) {
            interpreter.tick(interface);
        }

        display.advanceFrame();
        frames++;

        if(debug & DEBUG_TIMING) {
            printf("frame %llu: %d cycles, %d timer ticks, DT %d, ST %d\n",
                static_cast<unsigned long long>(frames), cycles, ticks, interpreter.DT, interpreter.ST);
        }

        return result;
    }
};

#endif // PHOSPHOR8_MACHINE_H
