#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace yframe {

// Codepoint stored in the slot right of a wide (two column) glyph
constexpr uint32_t WIDE_CONTINUATION = 0xFFFE;

// Codepoint no paint operation can store; marks cells that must be repainted
constexpr uint32_t INVALID_CODEPOINT = 0;

constexpr size_t MAX_COMBINING = 2;

struct Color {
    enum class Kind : uint8_t {
        Default = 0,
        Indexed16 = 1,
        Indexed256 = 2,
        Rgb = 3
    };

    Kind kind = Kind::Default;
    uint8_t index = 0;
    uint8_t r = 0, g = 0, b = 0;

    static constexpr Color defaultColor() { return Color{}; }
    static constexpr Color indexed16(uint8_t i) { return Color{Kind::Indexed16, static_cast<uint8_t>(i & 0x0F), 0, 0, 0}; }
    static constexpr Color indexed256(uint8_t i) { return Color{Kind::Indexed256, i, 0, 0, 0}; }
    static constexpr Color rgb(uint8_t r, uint8_t g, uint8_t b) { return Color{Kind::Rgb, 0, r, g, b}; }

    bool isDefault() const { return kind == Kind::Default; }

    bool operator==(const Color&) const = default;
};

enum class Underline : uint8_t {
    None = 0,
    Single = 1,
    Double = 2,
    Curly = 3,
    Dotted = 4,
    Dashed = 5
};

// Text attributes packed into one byte
// Bit layout: [inverse][dim][strikethrough][underline(3)][italic][bold]
struct CellAttrs {
    uint8_t _bold : 1 = 0;
    uint8_t _italic : 1 = 0;
    uint8_t _underline : 3 = 0;  // Underline enum value
    uint8_t _strikethrough : 1 = 0;
    uint8_t _dim : 1 = 0;
    uint8_t _inverse : 1 = 0;

    Underline underline() const { return static_cast<Underline>(_underline); }
    void setUnderline(Underline u) { _underline = static_cast<uint8_t>(u) & 0x7; }

    bool any() const {
        return _bold || _italic || _underline || _strikethrough || _dim || _inverse;
    }

    bool operator==(const CellAttrs&) const = default;
};

struct Style {
    Color fg;
    Color bg;
    CellAttrs attrs;
    std::optional<Color> underlineColor;
    std::string hyperlink;  // OSC 8 target, empty when the cell is not a link

    bool isDefault() const {
        return fg.isDefault() && bg.isDefault() && !attrs.any() &&
               !underlineColor && hyperlink.empty();
    }

    bool operator==(const Style&) const = default;
};

//=============================================================================
// Cell - one terminal character position
//
// A wide glyph occupies two cells: the primary (width 2) and a continuation
// cell (WIDE_CONTINUATION, width 0) carrying the same style. The continuation
// is maintained by Surface and never written on its own.
//=============================================================================

struct Cell {
    uint32_t codepoint = ' ';
    uint8_t width = 1;
    Style style;
    std::array<uint32_t, MAX_COMBINING> combining{};  // 0 = unused slot

    static Cell blank(const Style& style = Style{}) {
        Cell c;
        c.style = style;
        return c;
    }

    static Cell continuation(const Style& style) {
        Cell c;
        c.codepoint = WIDE_CONTINUATION;
        c.width = 0;
        c.style = style;
        return c;
    }

    // Never equal to anything a Painter stores
    static Cell invalid() {
        Cell c;
        c.codepoint = INVALID_CODEPOINT;
        return c;
    }

    bool isContinuation() const { return width == 0 && codepoint == WIDE_CONTINUATION; }
    bool isWide() const { return width == 2; }

    // Attach a combining mark, returns false when all slots are taken
    bool addCombining(uint32_t mark) {
        for (auto& slot : combining) {
            if (slot == 0) {
                slot = mark;
                return true;
            }
        }
        return false;
    }

    bool operator==(const Cell&) const = default;
};

} // namespace yframe
