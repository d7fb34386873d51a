#pragma once

#include <yframe/damage-rect.h>
#include <yframe/memory.h>
#include <yframe/render-strategy.h>
#include <yframe/result.hpp>
#include <yframe/term-caps.h>
#include <yframe/terminal-modes.h>
#include <yframe/terminal-options.h>
#include <yframe/writer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace yframe {

//=============================================================================
// Terminal - one rendering session on one output channel
//
// Owns the double buffer and the mode guard. Each frame:
//   renderWith(paint) -> Memory diff -> (coalesce) -> present(units)
//
// present() cursor-addresses every unit and copies its bytes from the front
// surface snapshot, adding SGR runs for styled cells. A failed write leaves
// the Memory invalidated so that the next pass repaints everything.
//=============================================================================

class Terminal {
public:
    using Ptr = std::unique_ptr<Terminal>;

    static Result<Ptr> create(uint16_t width, uint16_t height, const TermCaps& caps,
                              const TerminalOptions& options, Writer::Ptr writer) noexcept;

    // Runs deinit()
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    Result<std::vector<Span>> renderWith(const PaintFn& paint);

    // Emit the given regions of the front surface
    Result<void> present(const std::vector<Rect>& units);

    // Following frames go to writer. Modes are restored on the old channel and
    // enabled again on the new one, the next frame is a full repaint. The switch
    // happens even when restoring the old channel fails, that error is returned.
    Result<void> setWriter(Writer::Ptr writer);

    Result<void> resize(uint16_t width, uint16_t height);

    // Restore every enabled mode. Idempotent.
    Result<void> deinit();

    //-------------------------------------------------------------------------
    // Out-of-band sequences. Each is gated by its capability and returns false
    // without writing when the terminal lacks it. Wrapped for tmux passthrough
    // when the session runs inside tmux.
    //-------------------------------------------------------------------------

    Result<bool> copyToClipboard(std::string_view text);  // OSC 52
    Result<bool> notify(std::string_view text);           // OSC 9
    Result<bool> setBadge(std::string_view text);         // OSC 1337

    // OSC 133 shell integration marks
    Result<bool> markPromptStart();
    Result<bool> markCommandStart();
    Result<bool> markCommandExecuted(std::string_view id);
    Result<bool> markCommandFinished(int exitCode);

    // Kitty graphics transmission, chunked above ansi::KITTY_CHUNK_SIZE
    Result<bool> transmitImage(int format, uint32_t id, int width, int height,
                               const std::vector<uint8_t>& data);

    bool active() const { return _modes != nullptr; }

    RenderStrategy strategy() const { return _strategy; }
    ColorDepth colorDepth() const { return _colorDepth; }
    const TermCaps& caps() const { return _caps; }
    const TerminalOptions& options() const { return _options; }
    const Memory& memory() const { return _memory; }
    const TerminalModes* modes() const { return _modes.get(); }

    uint16_t width() const { return _memory.width(); }
    uint16_t height() const { return _memory.height(); }

private:
    Terminal(uint16_t width, uint16_t height, const TermCaps& caps,
             const TerminalOptions& options, Writer::Ptr writer) noexcept;

    Result<void> init() noexcept;

    Result<bool> writeSequence(bool supported, const std::string& sequence, const char* what);

    // Grow a unit so it neither starts nor ends inside a wide glyph
    Rect alignToGlyphs(const Rect& unit) const;

    // Append the escape traffic for one unit
    void encodeUnit(const Rect& unit, const Snapshot& snapshot, std::string& out) const;
    void encodeStyledRow(int row, int col, int width, const Snapshot& snapshot, std::string& out) const;
    bool unitHasDefaultStyle(const Rect& unit) const;

    Result<void> writeBatched(const std::vector<Rect>& units, const Snapshot& snapshot);
    Result<void> writeUnbatched(const std::vector<Rect>& units, const Snapshot& snapshot);

    TermCaps _caps;
    TerminalOptions _options;
    RenderStrategy _strategy;
    ColorDepth _colorDepth;
    Writer::Ptr _writer;
    Memory _memory;
    TerminalModes::Ptr _modes;
};

} // namespace yframe
