#include <yframe/surface.h>
#include <yframe/unicode.h>

#include <algorithm>

namespace yframe {

Surface::Surface(uint16_t width, uint16_t height)
    : _width(width), _height(height),
      _cells(static_cast<size_t>(width) * height) {}

Cell Surface::get(int x, int y) const {
    if (!contains(x, y)) return Cell{};
    return _cells[cellIndex(x, y)];
}

void Surface::breakWideAt(int x, int y) {
    const Cell& current = _cells[cellIndex(x, y)];
    if (current.isContinuation() && x > 0) {
        Cell& primary = _cells[cellIndex(x - 1, y)];
        if (primary.isWide()) primary = Cell::blank(primary.style);
    } else if (current.isWide() && x + 1 < _width) {
        Cell& cont = _cells[cellIndex(x + 1, y)];
        if (cont.isContinuation()) cont = Cell::blank(cont.style);
    }
}

std::optional<Cell> Surface::set(int x, int y, const Cell& cell) {
    if (!contains(x, y)) return std::nullopt;
    if (cell.isContinuation()) return std::nullopt;

    Cell previous = _cells[cellIndex(x, y)];
    breakWideAt(x, y);

    if (cell.isWide()) {
        if (x + 1 >= _width) {
            // Half a glyph can't be shown
            _cells[cellIndex(x, y)] = Cell::blank(cell.style);
            return previous;
        }
        breakWideAt(x + 1, y);
        _cells[cellIndex(x, y)] = cell;
        _cells[cellIndex(x + 1, y)] = Cell::continuation(cell.style);
        return previous;
    }

    _cells[cellIndex(x, y)] = cell;
    return previous;
}

void Surface::clear(const Cell& fill) {
    Cell c = fill;
    if (c.isContinuation() || c.isWide()) c = Cell::blank(fill.style);
    std::fill(_cells.begin(), _cells.end(), c);
}

void Surface::resize(uint16_t width, uint16_t height) {
    _width = width;
    _height = height;
    _cells.assign(static_cast<size_t>(width) * height, Cell{});
}

Snapshot Surface::dump() const {
    Snapshot snap;
    snap.width = _width;
    snap.height = _height;
    snap.offsets.resize(static_cast<size_t>(_height) * (_width + 1u));
    snap.bytes.reserve(static_cast<size_t>(_height) * (_width + 1u));

    size_t slot = 0;
    for (int y = 0; y < _height; y++) {
        for (int x = 0; x < _width; x++) {
            snap.offsets[slot++] = static_cast<uint32_t>(snap.bytes.size());
            const Cell& c = _cells[cellIndex(x, y)];
            if (c.isContinuation()) continue;
            if (c.codepoint == INVALID_CODEPOINT) {
                snap.bytes.push_back(' ');
                continue;
            }
            appendUtf8(snap.bytes, c.codepoint);
            for (uint32_t mark : c.combining) {
                if (mark != 0) appendUtf8(snap.bytes, mark);
            }
        }
        snap.offsets[slot++] = static_cast<uint32_t>(snap.bytes.size());
        snap.bytes.push_back('\n');
    }
    return snap;
}

} // namespace yframe
