#include <yframe/render-strategy.h>

#include <algorithm>

namespace yframe {

RenderStrategy selectStrategy(const TermCaps& caps) noexcept {
    if (caps.kittyGraphics) return RenderStrategy::FullGraphics;
    if (caps.sixel) return RenderStrategy::SixelGraphics;
    if (caps.truecolor) return RenderStrategy::RichTruecolorText;
    if (caps.color256) return RenderStrategy::Enhanced256;
    if (caps.color16) return RenderStrategy::BasicAnsi16;
    return RenderStrategy::AsciiFallback;
}

bool supportsColor(RenderStrategy strategy) noexcept {
    return strategy != RenderStrategy::AsciiFallback;
}

bool supportsGraphics(RenderStrategy strategy) noexcept {
    return strategy == RenderStrategy::FullGraphics ||
           strategy == RenderStrategy::SixelGraphics;
}

uint32_t colorCount(RenderStrategy strategy) noexcept {
    switch (strategy) {
    case RenderStrategy::FullGraphics:
    case RenderStrategy::SixelGraphics:
    case RenderStrategy::RichTruecolorText:
        return 16777216;
    case RenderStrategy::Enhanced256:
        return 256;
    case RenderStrategy::BasicAnsi16:
        return 16;
    case RenderStrategy::AsciiFallback:
        return 0;
    }
    return 0;
}

const char* toString(RenderStrategy strategy) noexcept {
    switch (strategy) {
    case RenderStrategy::FullGraphics: return "full_graphics";
    case RenderStrategy::SixelGraphics: return "sixel_graphics";
    case RenderStrategy::RichTruecolorText: return "rich_truecolor_text";
    case RenderStrategy::Enhanced256: return "enhanced_256";
    case RenderStrategy::BasicAnsi16: return "basic_ansi_16";
    case RenderStrategy::AsciiFallback: return "ascii_fallback";
    }
    return "unknown";
}

ColorDepth colorDepth(RenderStrategy strategy) noexcept {
    switch (strategy) {
    case RenderStrategy::FullGraphics:
    case RenderStrategy::SixelGraphics:
    case RenderStrategy::RichTruecolorText:
        return ColorDepth::Truecolor;
    case RenderStrategy::Enhanced256:
        return ColorDepth::Palette256;
    case RenderStrategy::BasicAnsi16:
        return ColorDepth::Ansi16;
    case RenderStrategy::AsciiFallback:
        return ColorDepth::None;
    }
    return ColorDepth::None;
}

ColorDepth colorDepth(const TermCaps& caps, RenderStrategy strategy) noexcept {
    ColorDepth depth = ColorDepth::None;
    if (caps.truecolor) {
        depth = ColorDepth::Truecolor;
    } else if (caps.color256) {
        depth = ColorDepth::Palette256;
    } else if (caps.color16) {
        depth = ColorDepth::Ansi16;
    }
    return std::min(depth, colorDepth(strategy));
}

const char* toString(ColorDepth depth) noexcept {
    switch (depth) {
    case ColorDepth::None: return "none";
    case ColorDepth::Ansi16: return "16";
    case ColorDepth::Palette256: return "256";
    case ColorDepth::Truecolor: return "truecolor";
    }
    return "unknown";
}

} // namespace yframe
