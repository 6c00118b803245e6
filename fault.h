#ifndef PHOSPHOR8_FAULT_H
#define PHOSPHOR8_FAULT_H

#include <string>
#include <cstdint>

#include "memory.h"

enum StepResult {
    CONTINUE,
    WAITING_FOR_KEY,
    DECODE_FAULT,
    MEMORY_FAULT,
    STACK_OVERFLOW,
    STACK_UNDERFLOW,
};

// The instruction that could not complete.  address is only meaningful for
// MEMORY_FAULT.
struct Fault
{
    StepResult kind = CONTINUE;
    uint16_t pc = 0;
    uint16_t instructionWord = 0;
    uint32_t address = 0;
};

inline bool isFault(StepResult result)
{
    return (result != CONTINUE) && (result != WAITING_FOR_KEY);
}

// The instruction word itself could not be read; there is nothing to skip.
inline bool isFetchFault(const Fault& fault)
{
    return (fault.kind == MEMORY_FAULT) && (fault.pc >= MEMORY_SIZE - 1);
}

const char *stepResultName(StepResult result);

std::string describeFault(const Fault& fault);

#endif // PHOSPHOR8_FAULT_H
