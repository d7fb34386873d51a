#include <yframe/ansi.h>
#include <yframe/config.h>
#include <yframe/diff.h>
#include <yframe/terminal.h>
#include <ytrace/ytrace.hpp>

namespace yframe {

TerminalOptions TerminalOptions::fromConfig(const Config& config) {
    TerminalOptions o;
    o.batched = config.get<bool>(Config::KEY_RENDERING_BATCHED, o.batched);
    o.coalesce = config.get<bool>(Config::KEY_RENDERING_COALESCE, o.coalesce);
    o.syncOutput = config.get<bool>(Config::KEY_RENDERING_SYNC_OUTPUT, o.syncOutput);
    o.altScreen = config.get<bool>(Config::KEY_TERMINAL_ALT_SCREEN, o.altScreen);
    o.hideCursor = config.get<bool>(Config::KEY_TERMINAL_HIDE_CURSOR, o.hideCursor);
    o.mouse = config.get<bool>(Config::KEY_TERMINAL_MOUSE, o.mouse);
    o.bracketedPaste = config.get<bool>(Config::KEY_TERMINAL_BRACKETED_PASTE, o.bracketedPaste);
    o.focusEvents = config.get<bool>(Config::KEY_TERMINAL_FOCUS_EVENTS, o.focusEvents);
    o.rawInput = config.get<bool>(Config::KEY_TERMINAL_RAW_INPUT, o.rawInput);
    return o;
}

//=============================================================================
// Lifecycle
//=============================================================================

Terminal::Terminal(uint16_t width, uint16_t height, const TermCaps& caps,
                   const TerminalOptions& options, Writer::Ptr writer) noexcept
    : _caps(caps), _options(options), _strategy(selectStrategy(caps)),
      _colorDepth(yframe::colorDepth(caps, _strategy)), _writer(std::move(writer)),
      _memory(width, height, caps.widthMethod) {}

Result<Terminal::Ptr> Terminal::create(uint16_t width, uint16_t height, const TermCaps& caps,
                                       const TerminalOptions& options, Writer::Ptr writer) noexcept {
    if (!writer) {
        return Err<Ptr>("Terminal: null writer");
    }
    auto term = Ptr(new Terminal(width, height, caps, options, std::move(writer)));
    if (auto res = term->init(); !res) {
        return Err<Ptr>("Failed to initialize Terminal", res);
    }
    return term;
}

Result<void> Terminal::init() noexcept {
    auto modes = TerminalModes::create(_writer, _caps, _options);
    if (!modes) {
        return Err("Failed to set up terminal modes", modes);
    }
    _modes = std::move(*modes);

    // Nothing on screen is known yet
    _memory.invalidate();

    yinfo("Terminal: {}x{} strategy={} colors={} batched={} coalesce={} sync={}",
          width(), height(), toString(_strategy), toString(_colorDepth), _options.batched,
          _options.coalesce, _modes->syncOutput());
    return Ok();
}

Terminal::~Terminal() {
    if (auto res = deinit(); !res) {
        ywarn("Terminal: deinit on destruction failed: {}", res.error().message());
    }
}

Result<void> Terminal::deinit() {
    if (!_modes) return Ok();
    auto res = _modes->restore();
    _modes.reset();
    if (!res) {
        return Err("Failed to restore terminal", res);
    }
    ydebug("Terminal: deinitialized");
    return Ok();
}

Result<void> Terminal::setWriter(Writer::Ptr writer) {
    if (!writer) {
        return Err("Terminal: null writer");
    }

    Result<void> restored = Ok();
    bool wasActive = _modes != nullptr;
    if (wasActive) {
        restored = _modes->restore();
        _modes.reset();
        if (!restored) {
            ywarn("Terminal: previous channel not fully restored: {}", restored.error().message());
        }
    }

    _writer = std::move(writer);
    _memory.invalidate();

    if (wasActive) {
        auto modes = TerminalModes::create(_writer, _caps, _options);
        if (!modes) {
            return Err("Failed to set up terminal modes on the new writer", modes);
        }
        _modes = std::move(*modes);
    }

    if (!restored) {
        return Err("Failed to restore the previous writer", restored);
    }
    ydebug("Terminal: writer switched");
    return Ok();
}

Result<void> Terminal::resize(uint16_t width, uint16_t height) {
    if (!_modes) {
        return Err("Terminal: resize after deinit");
    }
    _memory.resize(width, height);
    ydebug("Terminal: resized to {}x{}", width, height);
    return Ok();
}

//=============================================================================
// Out-of-band sequences
//=============================================================================

Result<bool> Terminal::writeSequence(bool supported, const std::string& sequence,
                                     const char* what) {
    if (!_modes) {
        return Err<bool>(std::string("Terminal: ") + what + " after deinit");
    }
    if (!supported) {
        ydebug("Terminal: {} not supported, skipped", what);
        return false;
    }
    std::string out = _caps.needsTmuxPassthrough ? ansi::tmuxWrap(sequence) : sequence;
    if (auto res = _writer->write(out); !res) {
        return Err<bool>(std::string("Failed to write ") + what, res);
    }
    return true;
}

Result<bool> Terminal::copyToClipboard(std::string_view text) {
    return writeSequence(_caps.clipboardOsc52, ansi::clipboardCopy(text), "clipboard copy");
}

Result<bool> Terminal::notify(std::string_view text) {
    return writeSequence(_caps.notifyOsc9, ansi::notify(text), "notification");
}

Result<bool> Terminal::setBadge(std::string_view text) {
    return writeSequence(_caps.iterm2Osc1337, ansi::iterm2Badge(text), "badge");
}

Result<bool> Terminal::markPromptStart() {
    return writeSequence(_caps.finalTermOsc133, ansi::finalTermPromptStart(), "prompt mark");
}

Result<bool> Terminal::markCommandStart() {
    return writeSequence(_caps.finalTermOsc133, ansi::finalTermCommandStart(), "command mark");
}

Result<bool> Terminal::markCommandExecuted(std::string_view id) {
    return writeSequence(_caps.finalTermOsc133, ansi::finalTermCommandExecuted(id),
                         "command mark");
}

Result<bool> Terminal::markCommandFinished(int exitCode) {
    return writeSequence(_caps.finalTermOsc133, ansi::finalTermCommandFinished(exitCode),
                         "command mark");
}

Result<bool> Terminal::transmitImage(int format, uint32_t id, int width, int height,
                                     const std::vector<uint8_t>& data) {
    std::string sequence;
    if (_caps.kittyGraphics) {
        sequence = ansi::kittyTransmitChunked(format, id, width, height, data);
    }
    return writeSequence(_caps.kittyGraphics, sequence, "image");
}

//=============================================================================
// Frame pipeline
//=============================================================================

Result<std::vector<Span>> Terminal::renderWith(const PaintFn& paint) {
    if (!_modes) {
        return Err<std::vector<Span>>("Terminal: render after deinit");
    }

    auto spans = _memory.renderWith(paint);
    if (!spans) {
        return Err<std::vector<Span>>("Failed to render frame", spans);
    }
    if (spans->empty()) {
        return spans;
    }

    std::vector<Rect> units;
    if (_options.coalesce) {
        auto rects = diffCoalesce(*spans);
        if (!rects) {
            _memory.invalidate();
            return Err<std::vector<Span>>("Failed to coalesce damage", rects);
        }
        units = std::move(*rects);
    } else {
        units = spansToRects(*spans);
    }

    if (auto res = present(units); !res) {
        return Err<std::vector<Span>>("Failed to present frame", res);
    }

    ytrace("Terminal: frame spans={} units={}", spans->size(), units.size());
    return spans;
}

Result<void> Terminal::present(const std::vector<Rect>& units) {
    if (!_modes) {
        return Err("Terminal: present after deinit");
    }
    if (units.empty()) return Ok();

    Rect screen{0, 0, width(), height()};
    std::vector<Rect> aligned;
    aligned.reserve(units.size());
    for (const auto& unit : units) {
        if (unit.empty() || unit.intersect(screen) != unit) {
            return Err("Terminal: unit outside the surface");
        }
        aligned.push_back(alignToGlyphs(unit));
    }

    Snapshot snapshot = _memory.front().dump();

    auto res = _options.batched ? writeBatched(aligned, snapshot)
                                : writeUnbatched(aligned, snapshot);
    if (!res) {
        // The screen is in an unknown state
        _memory.invalidate();
        return res;
    }
    return Ok();
}

Result<void> Terminal::writeBatched(const std::vector<Rect>& units, const Snapshot& snapshot) {
    std::string frame;
    frame.reserve(snapshot.bytes.size() + units.size() * 16);

    bool sync = _modes->syncOutput();
    if (sync) frame += ansi::SYNC_BEGIN;
    for (const auto& unit : units) {
        encodeUnit(unit, snapshot, frame);
    }
    if (sync) frame += ansi::SYNC_END;

    if (auto res = _writer->write(frame); !res) {
        return Err("Failed to write frame", res);
    }
    return Ok();
}

Result<void> Terminal::writeUnbatched(const std::vector<Rect>& units, const Snapshot& snapshot) {
    bool sync = _modes->syncOutput();
    if (sync) {
        if (auto res = _writer->write(ansi::SYNC_BEGIN); !res) {
            return Err("Failed to begin synchronized update", res);
        }
    }

    Result<void> first = Ok();
    std::string out;
    for (const auto& unit : units) {
        out.clear();
        encodeUnit(unit, snapshot, out);
        if (auto res = _writer->write(out); !res) {
            first = Err("Failed to write unit", res);
            break;
        }
    }

    // Always close the update, the terminal would stay frozen otherwise
    if (sync) {
        if (auto res = _writer->write(ansi::SYNC_END); !res && first) {
            first = Err("Failed to end synchronized update", res);
        }
    }
    return first;
}

//=============================================================================
// Encoding
//=============================================================================

Rect Terminal::alignToGlyphs(const Rect& unit) const {
    const Surface& front = _memory.front();
    Rect aligned = unit;
    bool changed = true;
    while (changed) {
        changed = false;
        for (int y = aligned.y; y < aligned.bottom(); y++) {
            if (aligned.x > 0 && front.at(aligned.x, y).isContinuation()) {
                aligned.x--;
                aligned.width++;
                changed = true;
            }
            if (aligned.right() < width() && front.at(aligned.right() - 1, y).isWide()) {
                aligned.width++;
                changed = true;
            }
        }
    }
    return aligned;
}

bool Terminal::unitHasDefaultStyle(const Rect& unit) const {
    const Surface& front = _memory.front();
    for (int y = unit.y; y < unit.bottom(); y++) {
        for (int x = unit.x; x < unit.right(); x++) {
            if (!front.at(x, y).style.isDefault()) return false;
        }
    }
    return true;
}

void Terminal::encodeUnit(const Rect& unit, const Snapshot& snapshot, std::string& out) const {
    bool raw = _strategy == RenderStrategy::AsciiFallback || unitHasDefaultStyle(unit);
    bool touchesRightMargin = unit.right() >= width();

    for (int row = unit.y; row < unit.bottom(); row++) {
        if (row == unit.y || touchesRightMargin) {
            out += ansi::cursorPosition(row + 1, unit.x + 1);
        } else {
            out += ansi::CURSOR_DOWN;
            out += ansi::cursorBack(unit.width);
        }

        if (raw) {
            out += snapshot.slice(static_cast<uint16_t>(row), static_cast<uint16_t>(unit.x),
                                  static_cast<uint16_t>(unit.width));
        } else {
            encodeStyledRow(row, unit.x, unit.width, snapshot, out);
        }
    }

    if (!raw) out += ansi::SGR_RESET;
}

void Terminal::encodeStyledRow(int row, int col, int width, const Snapshot& snapshot,
                               std::string& out) const {
    const Surface& front = _memory.front();
    bool links = _caps.hyperlinkOsc8;
    const std::string* openLink = nullptr;

    int x = col;
    while (x < col + width) {
        const Style& style = front.at(x, row).style;
        int runEnd = x + 1;
        while (runEnd < col + width && front.at(runEnd, row).style == style) {
            runEnd++;
        }

        if (links) {
            bool changed = openLink ? *openLink != style.hyperlink : !style.hyperlink.empty();
            if (changed) {
                if (openLink) out += ansi::hyperlinkClose();
                openLink = nullptr;
                if (!style.hyperlink.empty()) {
                    out += ansi::hyperlinkOpen(style.hyperlink);
                    openLink = &style.hyperlink;
                }
            }
        }

        out += ansi::sgr(style, _strategy, _colorDepth);
        out += snapshot.slice(static_cast<uint16_t>(row), static_cast<uint16_t>(x),
                              static_cast<uint16_t>(runEnd - x));
        x = runEnd;
    }

    if (openLink) out += ansi::hyperlinkClose();
}

} // namespace yframe
