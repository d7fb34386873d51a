#include <yframe/ansi.h>
#include <yframe/terminal-modes.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace yframe {

const char* toString(TerminalMode mode) {
    switch (mode) {
    case TerminalMode::RawInput: return "raw-input";
    case TerminalMode::SyncOutput: return "sync-output";
    case TerminalMode::AltScreen: return "alt-screen";
    case TerminalMode::HideCursor: return "hide-cursor";
    case TerminalMode::Mouse: return "mouse";
    case TerminalMode::BracketedPaste: return "bracketed-paste";
    case TerminalMode::FocusEvents: return "focus-events";
    }
    return "unknown";
}

Result<TerminalModes::Ptr> TerminalModes::create(Writer::Ptr writer, const TermCaps& caps,
                                                 const TerminalOptions& options) noexcept {
    if (!writer) {
        return Err<Ptr>("TerminalModes: null writer");
    }
    auto modes = Ptr(new TerminalModes(std::move(writer), options.inputFd));
    if (auto res = modes->init(caps, options); !res) {
        return Err<Ptr>("Failed to enable terminal modes", res);
    }
    return modes;
}

TerminalModes::~TerminalModes() {
    if (auto res = restore(); !res) {
        ywarn("TerminalModes: restore on destruction failed: {}", res.error().message());
    }
}

Result<void> TerminalModes::init(const TermCaps& caps, const TerminalOptions& options) noexcept {
    const std::pair<TerminalMode, bool> plan[] = {
        {TerminalMode::RawInput, options.rawInput},
        {TerminalMode::SyncOutput, options.syncOutput && caps.synchronizedOutput},
        {TerminalMode::AltScreen, options.altScreen},
        {TerminalMode::HideCursor, options.hideCursor},
        {TerminalMode::Mouse, options.mouse && caps.sgrMouse},
        {TerminalMode::BracketedPaste, options.bracketedPaste && caps.bracketedPaste},
        {TerminalMode::FocusEvents, options.focusEvents && caps.focusEvents},
    };

    for (const auto& [mode, wanted] : plan) {
        if (!wanted) continue;
        if (auto res = enable(mode); !res) {
            ywarn("TerminalModes: enabling {} failed, rolling back", toString(mode));
            if (auto rb = restore(); !rb) {
                ywarn("TerminalModes: rollback incomplete: {}", rb.error().message());
            }
            return Err(std::string("Failed to enable ") + toString(mode), res);
        }
        _enabled.push_back(mode);
        ydebug("TerminalModes: enabled {}", toString(mode));
    }
    return Ok();
}

Result<void> TerminalModes::restore() {
    Result<void> first = Ok();

    while (!_enabled.empty()) {
        TerminalMode mode = _enabled.back();
        _enabled.pop_back();
        if (auto res = disable(mode); !res) {
            ywarn("TerminalModes: restoring {} failed: {}", toString(mode), res.error().message());
            if (first) {
                first = Err(std::string("Failed to restore ") + toString(mode), res);
            }
        }
    }
    return first;
}

bool TerminalModes::isEnabled(TerminalMode mode) const {
    return std::find(_enabled.begin(), _enabled.end(), mode) != _enabled.end();
}

Result<void> TerminalModes::enable(TerminalMode mode) {
    switch (mode) {
    case TerminalMode::RawInput: {
        if (tcgetattr(_inputFd, &_origTermios) != 0) {
            return Err(std::string("tcgetattr failed: ") + strerror(errno));
        }
        struct termios raw = _origTermios;
        cfmakeraw(&raw);
        // Keep output post-processing so '\n' still returns the carriage
        raw.c_oflag |= OPOST;
        if (tcsetattr(_inputFd, TCSANOW, &raw) != 0) {
            return Err(std::string("tcsetattr failed: ") + strerror(errno));
        }
        return Ok();
    }
    case TerminalMode::SyncOutput:
        return Ok();
    case TerminalMode::AltScreen:
        return _writer->write(ansi::ALT_SCREEN_ENTER);
    case TerminalMode::HideCursor:
        return _writer->write(ansi::CURSOR_HIDE);
    case TerminalMode::Mouse:
        return _writer->write(ansi::MOUSE_ENABLE);
    case TerminalMode::BracketedPaste:
        return _writer->write(ansi::BRACKETED_PASTE_ENABLE);
    case TerminalMode::FocusEvents:
        return _writer->write(ansi::FOCUS_ENABLE);
    }
    return Err("unknown terminal mode");
}

Result<void> TerminalModes::disable(TerminalMode mode) {
    switch (mode) {
    case TerminalMode::RawInput:
        if (tcsetattr(_inputFd, TCSANOW, &_origTermios) != 0) {
            return Err(std::string("tcsetattr failed: ") + strerror(errno));
        }
        return Ok();
    case TerminalMode::SyncOutput:
        return _writer->write(ansi::SYNC_END);
    case TerminalMode::AltScreen:
        return _writer->write(ansi::ALT_SCREEN_EXIT);
    case TerminalMode::HideCursor:
        return _writer->write(ansi::CURSOR_SHOW);
    case TerminalMode::Mouse:
        return _writer->write(ansi::MOUSE_DISABLE);
    case TerminalMode::BracketedPaste:
        return _writer->write(ansi::BRACKETED_PASTE_DISABLE);
    case TerminalMode::FocusEvents:
        return _writer->write(ansi::FOCUS_DISABLE);
    }
    return Err("unknown terminal mode");
}

} // namespace yframe
