#include <yframe/painter.h>

namespace yframe {

Painter::Painter(Surface& surface, WidthMethod widthMethod)
    : _surface(&surface), _widthMethod(widthMethod),
      _clip{0, 0, surface.width(), surface.height()} {}

Painter::Painter(Surface& surface, WidthMethod widthMethod, int originX, int originY, const Rect& clip)
    : _surface(&surface), _widthMethod(widthMethod),
      _originX(originX), _originY(originY), _clip(clip) {}

Painter Painter::sub(const Rect& area) const {
    Rect absolute{_originX + area.x, _originY + area.y, area.width, area.height};
    Painter child(*_surface, _widthMethod, absolute.x, absolute.y, absolute.intersect(_clip));
    child._style = _style;
    return child;
}

bool Painter::attachCombining(int absX, int absY, uint32_t mark) {
    if (!visible(absX, absY)) return false;
    Cell target = _surface->at(absX, absY);
    if (target.isContinuation()) {
        if (absX == 0) return false;
        absX -= 1;
        target = _surface->at(absX, absY);
    }
    if (!target.addCombining(mark)) return false;
    _surface->set(absX, absY, target);
    return true;
}

bool Painter::putChar(int x, int y, uint32_t codepoint) {
    int w = codepointWidth(codepoint, _widthMethod);
    if (w < 0 || codepoint == INVALID_CODEPOINT) return false;

    const int absX = _originX + x;
    const int absY = _originY + y;

    if (w == 0) return attachCombining(absX, absY, codepoint);

    Cell cell;
    cell.codepoint = codepoint;
    cell.width = static_cast<uint8_t>(w);
    cell.style = _style;
    return putCell(x, y, cell);
}

bool Painter::putCell(int x, int y, const Cell& cell) {
    if (cell.isContinuation() || cell.codepoint == INVALID_CODEPOINT) return false;

    const int absX = _originX + x;
    const int absY = _originY + y;
    if (!visible(absX, absY)) return false;

    if (cell.isWide() && !visible(absX + 1, absY)) {
        // Right half would be clipped, show a blank instead of half a glyph
        return _surface->set(absX, absY, Cell::blank(cell.style)).has_value();
    }
    return _surface->set(absX, absY, cell).has_value();
}

int Painter::writeText(int x, int y, std::string_view text) {
    int col = x;
    int lastCol = -1;
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp = 0;
        size_t n = decodeUtf8(text, pos, cp);
        pos += n;

        int w = codepointWidth(cp, _widthMethod);
        if (w < 0) continue;
        if (w == 0) {
            if (lastCol >= 0) attachCombining(_originX + lastCol, _originY + y, cp);
            continue;
        }
        putChar(col, y, cp);
        lastCol = col;
        col += w;
    }
    return col - x;
}

void Painter::fill(const Rect& area, uint32_t codepoint) {
    int w = codepointWidth(codepoint, _widthMethod);
    if (w <= 0) return;
    for (int row = area.y; row < area.bottom(); row++) {
        for (int col = area.x; col + w <= area.right(); col += w) {
            putChar(col, row, codepoint);
        }
    }
}

} // namespace yframe
