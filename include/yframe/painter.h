#pragma once

#include <yframe/cell.h>
#include <yframe/damage-rect.h>
#include <yframe/surface.h>
#include <yframe/unicode.h>

#include <cstdint>
#include <string_view>

namespace yframe {

//=============================================================================
// Painter - bounded write API into a Surface
//
// Coordinates are relative to the painter's origin. Everything outside the
// clip rectangle is dropped silently: drawing past a component's area is a
// normal outcome, not an error. sub() hands a child component a painter whose
// origin and clip are its own area, intersected with the parent's clip.
//=============================================================================

class Painter {
public:
    explicit Painter(Surface& surface, WidthMethod widthMethod = WidthMethod::Grapheme);

    Painter sub(const Rect& area) const;

    // Size of the drawable area
    int width() const { return _clip.right() - _originX; }
    int height() const { return _clip.bottom() - _originY; }

    void setStyle(const Style& style) { _style = style; }
    const Style& style() const { return _style; }

    WidthMethod widthMethod() const { return _widthMethod; }

    // Write one codepoint with the current style. Wide codepoints take two
    // columns, combining marks attach to the cell at (x, y). Returns false
    // when nothing was written.
    bool putChar(int x, int y, uint32_t codepoint);

    bool putCell(int x, int y, const Cell& cell);

    // Write UTF-8 text starting at (x, y) on one row. Returns the number of
    // columns advanced, including clipped ones.
    int writeText(int x, int y, std::string_view text);

    void fill(const Rect& area, uint32_t codepoint);

private:
    Painter(Surface& surface, WidthMethod widthMethod, int originX, int originY, const Rect& clip);

    bool visible(int absX, int absY) const { return _clip.contains(absX, absY); }
    bool attachCombining(int absX, int absY, uint32_t mark);

    Surface* _surface;
    WidthMethod _widthMethod;
    int _originX = 0;
    int _originY = 0;
    Rect _clip;  // absolute surface coordinates
    Style _style;
};

} // namespace yframe
