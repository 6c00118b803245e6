// ==============================================================================
// Machine / Frame Scheduler Tests
// ==============================================================================

#include "test_support.h"
#include "timer.h"

void test_timer_clock() {
    std::cout << "--- Timer clock ---\n";
    TimerClock timerClock;
    check(timerClock.advance(1.0 / 60.0) == 1, "one period is one tick");
    check(timerClock.advance(0.05) == 3, "three periods at once");
    check(timerClock.advance(0.01) == 0, "partial period carries");
    check(timerClock.advance(0.01) == 1, "carried remainder completes a tick");
    check(timerClock.advance(-1.0) == 0, "negative time is ignored");

    int ticks = 0;
    for (int i = 0; i < 600; i++) {
        ticks += timerClock.advance(1.0 / 60.0);
    }
    check(ticks == 600, "ten seconds of frames is 600 ticks");
}

void test_cycles_per_frame() {
    std::cout << "--- Cycles per frame ---\n";
    TestInterface interface;
    Chip8Machine<TestInterface> machine(10);
    check(machine.loadProgram(romFromWords({0x7001, 0x1200}), interface), "loop loads");
    check(machine.runFrame(interface, 1.0 / 60.0) == CONTINUE, "frame runs");
    check(machine.interpreter.clock == 10, "ten instructions ran");
    check(machine.interpreter.registers[0] == 5, "five increments");

    machine.setCyclesPerFrame(4);
    machine.runFrame(interface, 1.0 / 60.0);
    check(machine.interpreter.clock == 14, "rate change applies next frame");

    machine.setCyclesPerFrame(0);
    check(machine.cyclesPerFrame == 1, "rate is at least 1");
}

void test_draw_visible_same_frame() {
    std::cout << "--- Frame ordering ---\n";
    TestInterface interface;
    Chip8Machine<TestInterface> machine(3, 0.5f);
    check(machine.loadProgram(romFromWords({0x6000, 0xF029, 0xD005}), interface), "draw ROM loads");
    machine.runFrame(interface, 0.0);
    check(machine.display.brightness(0, 0) == 1.0f, "last-cycle draw reaches this frame's phosphor");
    check(machine.frames == 1, "frame counted");
}

void test_timer_independent_of_rate() {
    std::cout << "--- Timer independence ---\n";
    std::vector<uint8_t> rom = romFromWords({0x603C, 0xF015, 0x1204});

    TestInterface slowInterface, fastInterface;
    Chip8Machine<TestInterface> slow(5);
    Chip8Machine<TestInterface> fast(50);
    check(slow.loadProgram(rom, slowInterface) && fast.loadProgram(rom, fastInterface), "timer ROM loads");

    bool same = true;
    for (int frame = 0; frame < 30; frame++) {
        slow.runFrame(slowInterface, 1.0 / 60.0);
        fast.runFrame(fastInterface, 1.0 / 60.0);
        same = same && (slow.interpreter.DT == fast.interpreter.DT);
    }
    check(same, "DT matches every frame at 5 and 50 cycles per frame");
    check(slow.interpreter.DT == 30, "30 frames of 1/60s is 30 ticks");

    TestInterface halfInterface;
    Chip8Machine<TestInterface> halfSpeed(5);
    check(halfSpeed.loadProgram(rom, halfInterface), "timer ROM loads again");
    for (int frame = 0; frame < 60; frame++) {
        halfSpeed.runFrame(halfInterface, 1.0 / 120.0);
    }
    check(halfSpeed.interpreter.DT == 30, "120Hz frames still tick at 60Hz");
}

void test_sound_through_frames() {
    std::cout << "--- Sound ---\n";
    TestInterface interface;
    Chip8Machine<TestInterface> machine(10);
    check(machine.loadProgram(romFromWords({0x6002, 0xF018, 0x1204}), interface), "sound ROM loads");
    machine.runFrame(interface, 1.0 / 60.0);
    check(interface.soundStarts == 1 && machine.interpreter.soundActive(), "tone started");
    machine.runFrame(interface, 1.0 / 60.0);
    check(!machine.interpreter.soundActive() && interface.soundStops == 1, "tone stopped after two ticks");
}

void test_restart_silences_tone() {
    std::cout << "--- Restart while sounding ---\n";
    TestInterface interface;
    Chip8Machine<TestInterface> machine(10);
    check(machine.loadProgram(romFromWords({0x60FF, 0xF018, 0x1204}), interface), "long tone ROM loads");
    machine.runFrame(interface, 1.0 / 60.0);
    check(machine.interpreter.soundActive() && interface.soundStops == 0, "tone playing");
    check(machine.restart(interface), "restart succeeds");
    check(interface.soundStops == 1 && !machine.interpreter.soundActive(), "restart stops the tone");
    check(machine.restart(interface) && interface.soundStops == 1, "restart while silent leaves the tone alone");

    machine.runFrame(interface, 1.0 / 60.0);
    check(interface.soundStarts == 2, "tone playing again");
    check(machine.loadProgram(romFromWords({0x1200}), interface), "new ROM loads");
    check(interface.soundStops == 2, "loading a new ROM stops the tone");
}

void test_fault_ends_frame() {
    std::cout << "--- Faults ---\n";
    TestInterface interface;
    Chip8Machine<TestInterface> machine(10, 0.5f);
    check(machine.loadProgram(romFromWords({0x6005, 0xF015, 0x0123}), interface), "faulting ROM loads");
    machine.display.draw(0, 0);
    check(machine.runFrame(interface, 1.0 / 60.0) == DECODE_FAULT, "frame reports the fault");
    check(machine.interpreter.clock == 2, "instructions stop at the fault");
    check(machine.interpreter.fault.pc == 0x204, "fault pc");
    check(machine.interpreter.DT == 4, "timers still tick");
    check(machine.display.brightness(0, 0) == 1.0f, "phosphor still advances");
}

void test_load_and_restart() {
    std::cout << "--- Load / restart ---\n";
    TestInterface interface;
    Chip8Machine<TestInterface> machine;
    check(!machine.loadProgram(std::vector<uint8_t>(PROGRAM_CAPACITY + 1, 0x12), interface), "oversized ROM rejected");
    check(machine.loadProgram(std::vector<uint8_t>(PROGRAM_CAPACITY, 0x12), interface), "ROM filling memory accepted");
    check(machine.memory.read(0xFFF) == 0x12, "last byte loaded");

    check(machine.loadProgram(romFromWords({0x6A07, 0x1202}), interface), "small ROM loads");
    check(!machine.loadProgram(std::vector<uint8_t>(PROGRAM_CAPACITY + 1, 0), interface), "oversized ROM rejected again");
    machine.runFrame(interface, 0.0);
    check(machine.interpreter.registers[0xA] == 7, "small ROM still loaded");

    machine.display.draw(9, 9);
    check(machine.restart(interface), "restart succeeds");
    check(machine.interpreter.registers[0xA] == 0 && machine.interpreter.pc == PROGRAM_START, "restart resets registers");
    check(!machine.display.lit(9, 9) && machine.frames == 0, "restart resets display");
    check(machine.memory.read(0x200) == 0x6A && machine.memory.read(0xFFF) == 0, "restart reloads the program");
}

void test_memory_write_rejects_out_of_range() {
    std::cout << "--- Memory bounds ---\n";
    Memory memory;
    check(memory.write(0xFFF, 0x42) && memory.read(0xFFF) == 0x42, "last byte writable");
    check(!memory.write(0x1000, 0x42), "write past the end rejected");
    check(memory.read(FONT_START) == 0xF0, "font resident after construction");
    check(Memory::contains(0xFFE, 2) && !Memory::contains(0xFFE, 3), "range check");
}

int main() {
    std::cout << "=== Machine Tests ===\n\n";

    test_timer_clock();
    test_cycles_per_frame();
    test_draw_visible_same_frame();
    test_timer_independent_of_rate();
    test_sound_through_frames();
    test_restart_silences_tone();
    test_fault_ends_frame();
    test_load_and_restart();
    test_memory_write_rejects_out_of_range();

    return report("Machine Tests");
}
