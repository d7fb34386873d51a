#pragma once

#include <yframe/result.hpp>
#include <yframe/term-caps.h>
#include <yframe/terminal-options.h>
#include <yframe/writer.h>

#include <memory>
#include <vector>

#include <termios.h>

namespace yframe {

enum class TerminalMode : uint8_t {
    RawInput,
    SyncOutput,
    AltScreen,
    HideCursor,
    Mouse,
    BracketedPaste,
    FocusEvents
};

const char* toString(TerminalMode mode);

//=============================================================================
// TerminalModes - RAII guard over terminal modes
//
// create() enables, in order: raw input, synchronized output, alternate
// screen, hidden cursor, mouse reporting, bracketed paste, focus events.
// restore() undoes them in reverse order. Every step is attempted even when
// an earlier one fails and the first error is returned. The destructor
// restores whatever is still enabled.
//
// Synchronized output is a session flag: enabling it writes nothing, its
// restore step writes ESC[?2026l so an interrupted frame can't leave the
// terminal frozen.
//=============================================================================

class TerminalModes {
public:
    using Ptr = std::unique_ptr<TerminalModes>;

    static Result<Ptr> create(Writer::Ptr writer, const TermCaps& caps,
                              const TerminalOptions& options) noexcept;

    ~TerminalModes();

    TerminalModes(const TerminalModes&) = delete;
    TerminalModes& operator=(const TerminalModes&) = delete;

    // Idempotent
    Result<void> restore();

    bool isEnabled(TerminalMode mode) const;
    bool syncOutput() const { return isEnabled(TerminalMode::SyncOutput); }

    // Modes currently enabled, in enable order
    const std::vector<TerminalMode>& enabled() const { return _enabled; }

private:
    TerminalModes(Writer::Ptr writer, int inputFd)
        : _writer(std::move(writer)), _inputFd(inputFd) {}

    Result<void> init(const TermCaps& caps, const TerminalOptions& options) noexcept;

    Result<void> enable(TerminalMode mode);
    Result<void> disable(TerminalMode mode);

    Writer::Ptr _writer;
    int _inputFd;
    struct termios _origTermios = {};
    std::vector<TerminalMode> _enabled;
};

} // namespace yframe
