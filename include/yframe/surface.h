#pragma once

#include <yframe/cell.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yframe {

//=============================================================================
// Snapshot - byte image of a Surface
//
// Row-major, one '\n' appended per row. Primary cells contribute their UTF-8
// bytes (plus combining marks), continuation cells contribute nothing.
// offset(row, col) maps a cell to its first byte; offset(row, width) is the
// position of the row's '\n'. For single-byte content offset(row, col) is
// row * (width + 1) + col.
//=============================================================================

struct Snapshot {
    std::string bytes;
    uint16_t width = 0;
    uint16_t height = 0;
    std::vector<uint32_t> offsets;  // height * (width + 1) entries

    size_t offset(uint16_t row, uint16_t col) const {
        return offsets[static_cast<size_t>(row) * (width + 1u) + col];
    }

    // Bytes for columns [col, col + length) of row
    std::string_view slice(uint16_t row, uint16_t col, uint16_t length) const {
        size_t begin = offset(row, col);
        size_t end = offset(row, static_cast<uint16_t>(col + length));
        return std::string_view(bytes).substr(begin, end - begin);
    }
};

//=============================================================================
// Surface - fixed-size grid of cells
//
// Out-of-bounds reads return a blank cell, out-of-bounds writes are ignored.
// set() keeps wide glyphs whole: overwriting either half of a wide glyph
// blanks the other half, and a wide cell that does not fit before the right
// edge is stored as a blank.
//=============================================================================

class Surface {
public:
    Surface(uint16_t width = 0, uint16_t height = 0);

    uint16_t width() const { return _width; }
    uint16_t height() const { return _height; }

    bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < _width && y < _height;
    }

    Cell get(int x, int y) const;

    // Unchecked access, caller guarantees contains(x, y)
    const Cell& at(int x, int y) const { return _cells[cellIndex(x, y)]; }

    // Returns the previous cell, or nullopt when (x, y) is out of bounds or
    // cell is a bare continuation
    std::optional<Cell> set(int x, int y, const Cell& cell);

    void clear(const Cell& fill = Cell{});
    void resize(uint16_t width, uint16_t height);

    Snapshot dump() const;

    const std::vector<Cell>& cells() const { return _cells; }

private:
    size_t cellIndex(int x, int y) const {
        return static_cast<size_t>(y) * _width + static_cast<size_t>(x);
    }

    // Blank the partner of a wide glyph that is about to lose one half
    void breakWideAt(int x, int y);

    uint16_t _width;
    uint16_t _height;
    std::vector<Cell> _cells;
};

} // namespace yframe
