#pragma once

#include <unistd.h>

namespace yframe {

class Config;

// Session settings. Each terminal mode is additionally gated by the
// matching TermCaps flag where one exists.
struct TerminalOptions {
    bool batched = true;     // one write per frame instead of one per unit
    bool coalesce = true;    // merge aligned spans into rectangles
    bool syncOutput = true;
    bool altScreen = true;
    bool hideCursor = true;
    bool mouse = false;
    bool bracketedPaste = false;
    bool focusEvents = false;
    bool rawInput = false;
    int inputFd = STDIN_FILENO;  // termios target for rawInput

    static TerminalOptions fromConfig(const Config& config);
};

} // namespace yframe
