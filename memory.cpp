#include <algorithm>

#include "memory.h"

const std::array<uint8_t, 16 * FONT_GLYPH_BYTES> digitSprites = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

Memory::Memory()
{
    reset();
}

void Memory::reset()
{
    memory.fill(0);
    std::copy(digitSprites.begin(), digitSprites.end(), memory.begin() + FONT_START);
}

bool Memory::loadProgram(const std::vector<uint8_t>& rom)
{
    if(rom.size() > PROGRAM_CAPACITY) {
        return false;
    }
    std::fill(memory.begin() + PROGRAM_START, memory.end(), 0);
    std::copy(rom.begin(), rom.end(), memory.begin() + PROGRAM_START);
    return true;
}

bool Memory::store(uint32_t addr, const uint8_t *src, uint32_t count)
{
    if(!contains(addr, count)) {
        return false;
    }
    std::copy(src, src + count, memory.begin() + addr);
    return true;
}

bool Memory::fetch(uint32_t addr, uint8_t *dst, uint32_t count) const
{
    if(!contains(addr, count)) {
        return false;
    }
    std::copy(memory.begin() + addr, memory.begin() + addr + count, dst);
    return true;
}
