#pragma once

#include <yframe/term-caps.h>

#include <cstdint>

namespace yframe {

// Rendering fidelity tiers. Larger values are higher fidelity.
enum class RenderStrategy : uint8_t {
    AsciiFallback = 0,
    BasicAnsi16 = 1,
    Enhanced256 = 2,
    RichTruecolorText = 3,
    SixelGraphics = 4,
    FullGraphics = 5
};

// Total, pure and monotone: a superset of capabilities never selects a
// lower tier than the subset does
RenderStrategy selectStrategy(const TermCaps& caps) noexcept;

bool supportsColor(RenderStrategy strategy) noexcept;
bool supportsGraphics(RenderStrategy strategy) noexcept;

// Number of colors the tier can address (0 for ascii fallback)
uint32_t colorCount(RenderStrategy strategy) noexcept;

const char* toString(RenderStrategy strategy) noexcept;

// Colors SGR may address. Independent of the tier: a graphics terminal can
// still be limited to 256 colors or have color switched off (NO_COLOR).
enum class ColorDepth : uint8_t {
    None = 0,
    Ansi16 = 1,
    Palette256 = 2,
    Truecolor = 3
};

// Depth the tier itself can address
ColorDepth colorDepth(RenderStrategy strategy) noexcept;

// Highest depth the color caps allow, capped by the tier
ColorDepth colorDepth(const TermCaps& caps, RenderStrategy strategy) noexcept;

const char* toString(ColorDepth depth) noexcept;

} // namespace yframe
