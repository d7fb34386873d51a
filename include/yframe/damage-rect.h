#pragma once

#include <cstdint>

namespace yframe {

// Maximal run of changed cells on one row
struct Span {
    uint16_t row = 0;
    uint16_t column = 0;
    uint16_t length = 0;

    uint16_t end() const { return static_cast<uint16_t>(column + length); }  // exclusive

    bool operator==(const Span&) const = default;
};

// Rectangle of cells. Used for coalesced damage and for component areas.
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int right() const { return x + width; }    // exclusive
    int bottom() const { return y + height; }  // exclusive
    bool empty() const { return width <= 0 || height <= 0; }

    bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }

    Rect intersect(const Rect& other) const {
        int l = x > other.x ? x : other.x;
        int t = y > other.y ? y : other.y;
        int r = right() < other.right() ? right() : other.right();
        int b = bottom() < other.bottom() ? bottom() : other.bottom();
        if (r <= l || b <= t) return Rect{l, t, 0, 0};
        return Rect{l, t, r - l, b - t};
    }

    bool operator==(const Rect&) const = default;
};

} // namespace yframe
