#pragma once

#include <cstdint>

namespace yframe {

//=============================================================================
// xterm-256 palette
//
//   0..15   ANSI base colors
//   16..231 6x6x6 color cube (levels 0, 95, 135, 175, 215, 255)
//   232..255 grayscale ramp (8 + 10k)
//
// Used to downgrade truecolor styles for terminals without 24-bit color.
//=============================================================================

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb&) const = default;
};

Rgb rgbForIndex(uint8_t index);

// Nearest of the cube, the grayscale ramp and the 16 base colors
uint8_t nearestIndex256(uint8_t r, uint8_t g, uint8_t b);

// Nearest of the 16 base colors only
uint8_t nearestIndex16(uint8_t r, uint8_t g, uint8_t b);

} // namespace yframe
