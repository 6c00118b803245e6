#include <algorithm>

#include "display.h"

PhosphorDisplay::PhosphorDisplay(float decay)
{
    setDecay(decay);
    reset();
}

void PhosphorDisplay::clear()
{
    for(auto& rowOfPixels : pixels) {
        rowOfPixels.fill(0);
    }
    displayChanged = true;
}

void PhosphorDisplay::reset()
{
    clear();
    for(auto& rowOfIntensities : intensity) {
        rowOfIntensities.fill(0.0f);
    }
}

void PhosphorDisplay::advanceFrame()
{
    for(int y = 0; y < DISPLAY_HEIGHT; y++) {
        for(int x = 0; x < DISPLAY_WIDTH; x++) {
            float& glow = intensity[y][x];
            if(pixels[y][x]) {
                glow = 1.0f;
            } else if(glow > 0.0f) {
                glow *= decay;
                if(glow < INTENSITY_FLOOR) {
                    glow = 0.0f;
                }
                displayChanged = true;
            }
        }
    }
}

void PhosphorDisplay::setDecay(float d)
{
    // also rejects NaN
    if(!(d > 0.0f)) {
        d = 0.0f;
    }
    decay = std::min(d, MAX_DECAY);
}
