#pragma once

#include <yframe/unicode.h>

#include <cstdint>
#include <string>
#include <unordered_map>

namespace yframe {

class Config;

//=============================================================================
// TermCaps - escape-sequence families the attached terminal understands
//
// Computed once per session (detectCaps) and read-only afterwards.
//=============================================================================

struct TermCaps {
    bool truecolor = false;
    bool color256 = false;
    bool color16 = false;
    bool hyperlinkOsc8 = false;
    bool clipboardOsc52 = false;
    bool notifyOsc9 = false;
    bool finalTermOsc133 = false;
    bool iterm2Osc1337 = false;
    bool kittyGraphics = false;
    bool sixel = false;
    bool bracketedPaste = false;
    bool focusEvents = false;
    bool sgrMouse = false;
    bool synchronizedOutput = false;
    bool needsTmuxPassthrough = false;
    WidthMethod widthMethod = WidthMethod::Grapheme;

    bool operator==(const TermCaps&) const = default;
};

// Terminal programs with a known capability profile
enum class Program : uint8_t {
    Kitty,
    WezTerm,
    ITerm2,
    AppleTerminal,
    VTE,
    Alacritty,
    Konsole,
    Xterm,
    VSCode,
    WindowsTerminal,
    LinuxConsole,
    Unknown
};

using EnvMap = std::unordered_map<std::string, std::string>;

const char* toString(Program program);

// Baseline assumed for an unidentified terminal
TermCaps defaultCaps();

// Profile of a known program (defaultCaps() overlaid with its entries)
TermCaps capsForProgram(Program program);

Program detectProgram(const EnvMap& env);

// Environment inspection: program profile, then COLORTERM / TERM / NO_COLOR
// refinements, then multiplexer overlays
TermCaps detectCaps(const EnvMap& env);

// Snapshot of the process environment
EnvMap processEnv();

// Apply "caps.<flag>" overrides from configuration
TermCaps applyCapsOverrides(TermCaps caps, const Config& config);

std::string describe(const TermCaps& caps);

} // namespace yframe
