#ifndef PHOSPHOR8_MEMORY_H
#define PHOSPHOR8_MEMORY_H

#include <array>
#include <vector>
#include <cstdint>

constexpr uint32_t MEMORY_SIZE = 4096;
constexpr uint16_t ADDRESS_MASK = 0x0FFF;
constexpr uint16_t FONT_START = 0x050;
constexpr uint16_t FONT_GLYPH_BYTES = 5;
constexpr uint16_t PROGRAM_START = 0x200;
constexpr uint32_t PROGRAM_CAPACITY = MEMORY_SIZE - PROGRAM_START;

extern const std::array<uint8_t, 16 * FONT_GLYPH_BYTES> digitSprites;

// 4K of byte-addressable RAM.  The font lives below PROGRAM_START and
// programs are loaded at PROGRAM_START.
struct Memory
{
    std::array<uint8_t, MEMORY_SIZE> memory;

    Memory();

    // Zero all memory and reinstall the font.
    void reset();

    // Copy a ROM image to PROGRAM_START after clearing the program region.
    // Returns false without touching memory if the image does not fit.
    bool loadProgram(const std::vector<uint8_t>& rom);

    // true if [addr, addr + count) lies entirely inside memory
    static bool contains(uint32_t addr, uint32_t count = 1)
    {
        return (addr < MEMORY_SIZE) && (count <= MEMORY_SIZE - addr);
    }

    uint8_t read(uint32_t addr) const
    {
        return memory[addr & ADDRESS_MASK];
    }

    // Rejects writes outside memory rather than wrapping them.
    bool write(uint32_t addr, uint8_t v)
    {
        if(!contains(addr)) {
            return false;
        }
        memory[addr] = v;
        return true;
    }

    // All-or-nothing block transfers; false if any byte is out of range.
    bool store(uint32_t addr, const uint8_t *src, uint32_t count);
    bool fetch(uint32_t addr, uint8_t *dst, uint32_t count) const;

    uint16_t getDigitLocation(uint8_t digit) const
    {
        return FONT_START + (digit & 0xF) * FONT_GLYPH_BYTES;
    }
};

#endif // PHOSPHOR8_MEMORY_H
