#include <yframe/config.h>
#include <yframe/term-caps.h>
#include <ytrace/ytrace.hpp>

#include <sstream>
#include <string_view>

extern char** environ;

namespace yframe {

namespace {

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
        if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
        if (ca != cb) return false;
    }
    return true;
}

const std::string* lookup(const EnvMap& env, const char* name) {
    auto it = env.find(name);
    if (it == env.end()) return nullptr;
    return &it->second;
}

void setAllColors(TermCaps& caps, bool enabled) {
    caps.truecolor = enabled;
    caps.color256 = enabled;
    caps.color16 = enabled;
}

} // namespace

const char* toString(Program program) {
    switch (program) {
    case Program::Kitty: return "kitty";
    case Program::WezTerm: return "wezterm";
    case Program::ITerm2: return "iterm2";
    case Program::AppleTerminal: return "apple-terminal";
    case Program::VTE: return "vte";
    case Program::Alacritty: return "alacritty";
    case Program::Konsole: return "konsole";
    case Program::Xterm: return "xterm";
    case Program::VSCode: return "vscode";
    case Program::WindowsTerminal: return "windows-terminal";
    case Program::LinuxConsole: return "linux-console";
    case Program::Unknown: return "unknown";
    }
    return "unknown";
}

TermCaps defaultCaps() {
    TermCaps caps;
    caps.color16 = true;
    caps.color256 = true;
    caps.bracketedPaste = true;
    caps.sgrMouse = true;
    return caps;
}

TermCaps capsForProgram(Program program) {
    TermCaps caps = defaultCaps();

    switch (program) {
    case Program::Kitty:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.clipboardOsc52 = true;
        caps.notifyOsc9 = true;
        caps.finalTermOsc133 = true;
        caps.kittyGraphics = true;
        caps.focusEvents = true;
        caps.synchronizedOutput = true;
        break;

    case Program::WezTerm:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.clipboardOsc52 = true;
        caps.notifyOsc9 = true;
        caps.finalTermOsc133 = true;
        caps.iterm2Osc1337 = true;
        caps.kittyGraphics = true;
        caps.sixel = true;
        caps.focusEvents = true;
        caps.synchronizedOutput = true;
        break;

    case Program::ITerm2:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.clipboardOsc52 = true;
        caps.notifyOsc9 = true;
        caps.finalTermOsc133 = true;
        caps.iterm2Osc1337 = true;
        caps.sixel = true;
        caps.focusEvents = true;
        caps.synchronizedOutput = true;
        break;

    case Program::AppleTerminal:
        caps.focusEvents = true;
        caps.widthMethod = WidthMethod::Wcwidth;
        break;

    case Program::VTE:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.finalTermOsc133 = true;
        caps.focusEvents = true;
        caps.synchronizedOutput = true;
        break;

    case Program::Alacritty:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.clipboardOsc52 = true;
        caps.focusEvents = true;
        caps.synchronizedOutput = true;
        break;

    case Program::Konsole:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.sixel = true;
        caps.focusEvents = true;
        break;

    case Program::Xterm:
        caps.clipboardOsc52 = true;
        caps.focusEvents = true;
        caps.widthMethod = WidthMethod::Wcwidth;
        break;

    case Program::VSCode:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.finalTermOsc133 = true;
        caps.focusEvents = true;
        caps.synchronizedOutput = true;
        break;

    case Program::WindowsTerminal:
        caps.truecolor = true;
        caps.hyperlinkOsc8 = true;
        caps.clipboardOsc52 = true;
        caps.notifyOsc9 = true;
        caps.finalTermOsc133 = true;
        caps.sixel = true;
        caps.focusEvents = true;
        caps.synchronizedOutput = true;
        break;

    case Program::LinuxConsole:
        caps.color256 = false;
        caps.bracketedPaste = false;
        caps.sgrMouse = false;
        caps.widthMethod = WidthMethod::Wcwidth;
        break;

    case Program::Unknown:
        break;
    }
    return caps;
}

Program detectProgram(const EnvMap& env) {
    if (lookup(env, "KITTY_WINDOW_ID") || lookup(env, "KITTY_PID")) return Program::Kitty;
    if (lookup(env, "WEZTERM_EXECUTABLE")) return Program::WezTerm;
    if (lookup(env, "WT_SESSION")) return Program::WindowsTerminal;
    if (lookup(env, "VSCODE_GIT_IPC_HANDLE")) return Program::VSCode;

    if (const auto* tp = lookup(env, "TERM_PROGRAM")) {
        if (*tp == "WezTerm") return Program::WezTerm;
        if (*tp == "iTerm.app") return Program::ITerm2;
        if (*tp == "Apple_Terminal") return Program::AppleTerminal;
        if (equalsIgnoreCase(*tp, "vscode")) return Program::VSCode;
    }

    if (lookup(env, "KONSOLE_VERSION")) return Program::Konsole;
    if (lookup(env, "VTE_VERSION")) return Program::VTE;

    if (const auto* term = lookup(env, "TERM")) {
        if (*term == "linux") return Program::LinuxConsole;
        if (contains(*term, "xterm-kitty")) return Program::Kitty;
        if (contains(*term, "alacritty")) return Program::Alacritty;
        if (contains(*term, "xterm")) return Program::Xterm;
        if (contains(*term, "gnome")) return Program::VTE;
        if (contains(*term, "konsole")) return Program::Konsole;
    }

    return Program::Unknown;
}

TermCaps detectCaps(const EnvMap& env) {
    Program program = detectProgram(env);
    TermCaps caps = capsForProgram(program);

    if (const auto* colorterm = lookup(env, "COLORTERM")) {
        if (*colorterm == "truecolor" || *colorterm == "24bit") {
            setAllColors(caps, true);
        }
    }

    if (const auto* term = lookup(env, "TERM")) {
        if (contains(*term, "256color")) {
            caps.color256 = true;
            caps.color16 = true;
        }
        if (*term == "dumb") {
            setAllColors(caps, false);
            caps.bracketedPaste = false;
            caps.focusEvents = false;
            caps.sgrMouse = false;
            caps.synchronizedOutput = false;
        }
    }

    if (const auto* noColor = lookup(env, "NO_COLOR"); noColor && !noColor->empty()) {
        setAllColors(caps, false);
    }

    if (lookup(env, "TMUX")) {
        caps.needsTmuxPassthrough = true;
    }

    ydebug("detectCaps: program={} {}", toString(program), describe(caps));
    return caps;
}

EnvMap processEnv() {
    EnvMap env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) continue;
        env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return env;
}

TermCaps applyCapsOverrides(TermCaps caps, const Config& config) {
    auto overlay = [&](const char* key, bool& field) {
        if (auto v = config.get<bool>(std::string("caps.") + key)) field = *v;
    };

    overlay("truecolor", caps.truecolor);
    overlay("color256", caps.color256);
    overlay("color16", caps.color16);
    overlay("hyperlink-osc8", caps.hyperlinkOsc8);
    overlay("clipboard-osc52", caps.clipboardOsc52);
    overlay("notify-osc9", caps.notifyOsc9);
    overlay("finalterm-osc133", caps.finalTermOsc133);
    overlay("iterm2-osc1337", caps.iterm2Osc1337);
    overlay("kitty-graphics", caps.kittyGraphics);
    overlay("sixel", caps.sixel);
    overlay("bracketed-paste", caps.bracketedPaste);
    overlay("focus-events", caps.focusEvents);
    overlay("sgr-mouse", caps.sgrMouse);
    overlay("synchronized-output", caps.synchronizedOutput);
    overlay("tmux-passthrough", caps.needsTmuxPassthrough);

    if (auto method = config.get<std::string>("caps.width-method")) {
        if (*method == "wcwidth") {
            caps.widthMethod = WidthMethod::Wcwidth;
        } else if (*method == "grapheme") {
            caps.widthMethod = WidthMethod::Grapheme;
        } else {
            ywarn("Unknown caps.width-method '{}', keeping detected value", *method);
        }
    }
    return caps;
}

std::string describe(const TermCaps& caps) {
    std::ostringstream ss;
    ss << "truecolor=" << caps.truecolor
       << " color256=" << caps.color256
       << " color16=" << caps.color16
       << " osc8=" << caps.hyperlinkOsc8
       << " osc52=" << caps.clipboardOsc52
       << " osc9=" << caps.notifyOsc9
       << " osc133=" << caps.finalTermOsc133
       << " osc1337=" << caps.iterm2Osc1337
       << " kitty=" << caps.kittyGraphics
       << " sixel=" << caps.sixel
       << " paste=" << caps.bracketedPaste
       << " focus=" << caps.focusEvents
       << " mouse=" << caps.sgrMouse
       << " sync=" << caps.synchronizedOutput
       << " tmux=" << caps.needsTmuxPassthrough
       << " width=" << (caps.widthMethod == WidthMethod::Grapheme ? "grapheme" : "wcwidth");
    return ss.str();
}

} // namespace yframe
