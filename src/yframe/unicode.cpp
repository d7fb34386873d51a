#include <yframe/unicode.h>

#include <algorithm>
#include <iterator>

namespace yframe {

namespace {

struct Range {
    uint32_t first;
    uint32_t last;
};

// Combining marks and zero-width format characters
constexpr Range ZERO_WIDTH[] = {
    {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x05BF, 0x05BF},
    {0x05C1, 0x05C2}, {0x05C4, 0x05C5}, {0x05C7, 0x05C7}, {0x0610, 0x061A},
    {0x064B, 0x065F}, {0x0670, 0x0670}, {0x06D6, 0x06DC}, {0x06DF, 0x06E4},
    {0x06E7, 0x06E8}, {0x06EA, 0x06ED}, {0x0900, 0x0902}, {0x093C, 0x093C},
    {0x0941, 0x0948}, {0x094D, 0x094D}, {0x0E31, 0x0E31}, {0x0E34, 0x0E3A},
    {0x0E47, 0x0E4E}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF}, {0x200B, 0x200F},
    {0x2028, 0x202E}, {0x2060, 0x2064}, {0x20D0, 0x20FF}, {0xFE00, 0xFE0F},
    {0xFE20, 0xFE2F}, {0xFEFF, 0xFEFF}, {0xE0100, 0xE01EF},
};

// East Asian Wide and Fullwidth blocks
constexpr Range WIDE[] = {
    {0x1100, 0x115F}, {0x231A, 0x231B}, {0x2329, 0x232A}, {0x2E80, 0x303E},
    {0x3041, 0x33FF}, {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xA000, 0xA4CF},
    {0xA960, 0xA97F}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE10, 0xFE19},
    {0xFE30, 0xFE6F}, {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x20000, 0x2FFFD},
    {0x30000, 0x3FFFD},
};

// Emoji presentation blocks, width depends on the terminal's measuring method
constexpr Range EMOJI[] = {
    {0x1F1E6, 0x1F1FF}, {0x1F300, 0x1F64F}, {0x1F680, 0x1F6FF},
    {0x1F900, 0x1F9FF}, {0x1FA70, 0x1FAFF},
};

template<size_t N>
bool inTable(const Range (&table)[N], uint32_t cp) noexcept {
    auto it = std::upper_bound(std::begin(table), std::end(table), cp,
                               [](uint32_t value, const Range& r) { return value < r.first; });
    if (it == std::begin(table)) return false;
    --it;
    return cp >= it->first && cp <= it->last;
}

bool isValidScalar(uint32_t cp) noexcept {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

} // namespace

bool isCombining(uint32_t codepoint) noexcept {
    return inTable(ZERO_WIDTH, codepoint);
}

int codepointWidth(uint32_t codepoint, WidthMethod method) noexcept {
    if (!isValidScalar(codepoint)) return -1;
    if (codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0)) return -1;
    if (codepoint < 0x300) return 1;
    if (inTable(ZERO_WIDTH, codepoint)) return 0;
    if (inTable(WIDE, codepoint)) return 2;
    if (inTable(EMOJI, codepoint)) {
        return method == WidthMethod::Grapheme ? 2 : 1;
    }
    return 1;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (!isValidScalar(codepoint)) codepoint = REPLACEMENT_CHARACTER;

    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

size_t decodeUtf8(std::string_view text, size_t pos, uint32_t& codepoint) noexcept {
    if (pos >= text.size()) {
        codepoint = 0;
        return 0;
    }

    const auto lead = static_cast<uint8_t>(text[pos]);
    size_t len = 0;
    uint32_t cp = 0;
    uint32_t minValue = 0;

    if (lead < 0x80) {
        codepoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
        minValue = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
        minValue = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
        minValue = 0x10000;
    } else {
        codepoint = REPLACEMENT_CHARACTER;
        return 1;
    }

    if (pos + len > text.size()) {
        codepoint = REPLACEMENT_CHARACTER;
        return 1;
    }

    for (size_t i = 1; i < len; i++) {
        const auto cont = static_cast<uint8_t>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            codepoint = REPLACEMENT_CHARACTER;
            return 1;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    // Overlong encodings and surrogates are rejected
    if (cp < minValue || !isValidScalar(cp)) {
        codepoint = REPLACEMENT_CHARACTER;
        return len;
    }

    codepoint = cp;
    return len;
}

} // namespace yframe
