#include <cstdio>

#include "fault.h"
#include "instruction.h"

const char *stepResultName(StepResult result)
{
    switch(result) {
        case CONTINUE: return "continue";
        case WAITING_FOR_KEY: return "waiting for key";
        case DECODE_FAULT: return "unknown instruction";
        case MEMORY_FAULT: return "memory access out of range";
        case STACK_OVERFLOW: return "stack overflow";
        case STACK_UNDERFLOW: return "stack underflow";
    }
    return "unknown result";
}

std::string describeFault(const Fault& fault)
{
    char buffer[128];
    auto instruction = decode(fault.instructionWord);
    std::string text = instruction ? disassemble(*instruction) : "???";
    if(fault.kind == MEMORY_FAULT) {
        snprintf(buffer, sizeof(buffer), "%04X: (%04X) %s - %s at %04X",
            fault.pc, fault.instructionWord, text.c_str(), stepResultName(fault.kind), fault.address);
    } else {
        snprintf(buffer, sizeof(buffer), "%04X: (%04X) %s - %s",
            fault.pc, fault.instructionWord, text.c_str(), stepResultName(fault.kind));
    }
    return buffer;
}
