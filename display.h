#ifndef PHOSPHOR8_DISPLAY_H
#define PHOSPHOR8_DISPLAY_H

#include <array>
#include <cstdint>

constexpr int DISPLAY_WIDTH = 64;
constexpr int DISPLAY_HEIGHT = 32;

constexpr float DEFAULT_DECAY = 0.75f;
constexpr float MAX_DECAY = 0.99f;

// Intensities below this are snapped to zero so afterglow ends in a
// finite number of frames.  Past the floor a fading pixel reads 0 rather
// than the exact initial * decay^n, a difference under one 8-bit shade.
constexpr float INTENSITY_FLOOR = 1.0f / 1024.0f;

// The CHIP-8 monochrome screen.  "pixels" is the 1-bit screen the
// interpreter XORs sprites into; "intensity" is the simulated phosphor
// brightness the renderer displays.  Each frame a lit pixel is driven to
// full brightness and an unlit pixel fades by the decay factor, which hides
// the flicker of games that erase and redraw sprites every frame.
struct PhosphorDisplay
{
    std::array<std::array<uint8_t, DISPLAY_WIDTH>, DISPLAY_HEIGHT> pixels;
    std::array<std::array<float, DISPLAY_WIDTH>, DISPLAY_HEIGHT> intensity;
    bool displayChanged = true;

    explicit PhosphorDisplay(float decay = DEFAULT_DECAY);

    // XOR one pixel, coordinates already wrapped.  Returns true if a lit
    // pixel was turned off.
    bool draw(uint32_t x, uint32_t y)
    {
        auto& pixel = pixels.at(y).at(x);
        bool erased = pixel != 0;
        pixel ^= 1;
        displayChanged = true;
        return erased;
    }

    // Clear the 1-bit screen; the phosphor keeps fading.
    void clear();

    // Clear both the 1-bit screen and the phosphor.
    void reset();

    // Once per rendered frame, after all of the frame's instructions.
    void advanceFrame();

    // Clamped to [0, MAX_DECAY].  0 shows the raw 1-bit screen.
    void setDecay(float d);
    float getDecay() const { return decay; }

    bool lit(int x, int y) const { return pixels.at(y).at(x) != 0; }
    float brightness(int x, int y) const { return intensity.at(y).at(x); }

private:
    float decay;
};

#endif // PHOSPHOR8_DISPLAY_H
