#pragma once

#include <yframe/cell.h>
#include <yframe/render-strategy.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace yframe::ansi {

//=============================================================================
// Escape sequence encoders
//
// Pure string builders, nothing here touches a file descriptor. The Terminal
// and the demo tool write the results through a Writer.
//=============================================================================

// Private modes
constexpr std::string_view ALT_SCREEN_ENTER = "\033[?1049h";
constexpr std::string_view ALT_SCREEN_EXIT = "\033[?1049l";
constexpr std::string_view CURSOR_HIDE = "\033[?25l";
constexpr std::string_view CURSOR_SHOW = "\033[?25h";
constexpr std::string_view SYNC_BEGIN = "\033[?2026h";
constexpr std::string_view SYNC_END = "\033[?2026l";
constexpr std::string_view MOUSE_ENABLE = "\033[?1000;1002;1003;1006h";
constexpr std::string_view MOUSE_DISABLE = "\033[?1000;1002;1003;1006l";
constexpr std::string_view BRACKETED_PASTE_ENABLE = "\033[?2004h";
constexpr std::string_view BRACKETED_PASTE_DISABLE = "\033[?2004l";
constexpr std::string_view FOCUS_ENABLE = "\033[?1004h";
constexpr std::string_view FOCUS_DISABLE = "\033[?1004l";

constexpr std::string_view SGR_RESET = "\033[0m";
constexpr std::string_view CURSOR_DOWN = "\033[B";

// Payloads longer than this are sent as multiple kitty graphics chunks
constexpr size_t KITTY_CHUNK_SIZE = 4096;

// row and col are 1-based
std::string cursorPosition(int row, int col);
std::string cursorBack(int columns);

std::string base64Encode(std::string_view data);
std::string base64Encode(const std::vector<uint8_t>& data);

// Full SGR for a style ("\033[0;...m"), colors downgraded to depth. Attributes
// are kept at ColorDepth::None. Empty for AsciiFallback.
std::string sgr(const Style& style, RenderStrategy strategy, ColorDepth depth);

// Same, at the depth the strategy itself can address
std::string sgr(const Style& style, RenderStrategy strategy);

// OSC 8
std::string hyperlinkOpen(std::string_view uri);
std::string hyperlinkClose();

// Kitty graphics transmission: ESC_G f=<format>,i=<id>,s=<w>,v=<h>;<base64> ESC\.
// Chunked form splits the base64 payload, every chunk but the last carries m=1.
std::string kittyTransmit(int format, uint32_t id, int width, int height,
                          const std::vector<uint8_t>& data);
std::string kittyTransmitChunked(int format, uint32_t id, int width, int height,
                                 const std::vector<uint8_t>& data);

// OSC 1337
std::string iterm2Badge(std::string_view text);

// OSC 133 shell integration markers
std::string finalTermPromptStart();
std::string finalTermCommandStart();
std::string finalTermCommandExecuted(std::string_view id);
std::string finalTermCommandFinished(int exitCode);

std::string clipboardCopy(std::string_view text);  // OSC 52
std::string notify(std::string_view text);         // OSC 9
std::string windowTitle(std::string_view title);   // OSC 0

// DCS passthrough so tmux forwards the sequence to the outer terminal
std::string tmuxWrap(std::string_view sequence);

} // namespace yframe::ansi
