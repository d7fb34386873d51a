#pragma once

#include <yframe/damage-rect.h>
#include <yframe/painter.h>
#include <yframe/result.hpp>
#include <yframe/surface.h>

#include <cstdint>
#include <functional>
#include <vector>

namespace yframe {

using PaintFn = std::function<Result<void>(Painter&)>;

//=============================================================================
// Memory - double-buffered surfaces
//
// front: what was presented last. back: scratch for the frame being painted.
//
// renderWith(paint):
//   1. blank the back surface
//   2. paint into it
//   3. diff back against front
//   4. swap, the painted surface becomes front
//   5. return the spans
//
// If painting or diffing fails nothing is swapped and front stays
// authoritative.
//=============================================================================

class Memory {
public:
    Memory(uint16_t width, uint16_t height, WidthMethod widthMethod = WidthMethod::Grapheme);

    Result<std::vector<Span>> renderWith(const PaintFn& paint);

    // Next pass reports every cell as changed
    void invalidate();

    // Resizes both surfaces and invalidates
    void resize(uint16_t width, uint16_t height);

    const Surface& front() const { return _front; }
    const Surface& back() const { return _back; }

    uint16_t width() const { return _front.width(); }
    uint16_t height() const { return _front.height(); }

private:
    Surface _front;
    Surface _back;
    WidthMethod _widthMethod;
};

} // namespace yframe
