#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace yframe {

// How the attached terminal measures emoji and other ambiguous glyphs
enum class WidthMethod : uint8_t {
    Grapheme = 0,  // emoji presentation sequences take two columns
    Wcwidth = 1    // classic wcwidth tables, emoji take one column
};

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Display width in columns: 0 for combining marks, 1 or 2 for printable
// codepoints, -1 for C0/C1 controls and invalid scalar values.
int codepointWidth(uint32_t codepoint, WidthMethod method = WidthMethod::Grapheme) noexcept;

bool isCombining(uint32_t codepoint) noexcept;

// Append the UTF-8 encoding of codepoint (U+FFFD for invalid values)
void appendUtf8(std::string& out, uint32_t codepoint);

// Decode one codepoint starting at pos. Returns the number of bytes consumed
// (at least 1 while pos < text.size()). Malformed input yields U+FFFD.
size_t decodeUtf8(std::string_view text, size_t pos, uint32_t& codepoint) noexcept;

} // namespace yframe
