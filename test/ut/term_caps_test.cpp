//=============================================================================
// Capability Detection / Strategy Selection Tests
//=============================================================================

#include <boost/ut.hpp>
#include <yframe/render-strategy.h>
#include <yframe/term-caps.h>

#include <array>
#include <cstdint>

using namespace boost::ut;
using namespace yframe;

namespace {

// The flags selectStrategy looks at, as bits of an index
TermCaps capsFromBits(uint32_t bits) {
    TermCaps caps;
    caps.kittyGraphics = bits & 1u;
    caps.sixel = bits & 2u;
    caps.truecolor = bits & 4u;
    caps.color256 = bits & 8u;
    caps.color16 = bits & 16u;
    return caps;
}

} // namespace

suite render_strategy_tests = [] {
    "strategy table"_test = [] {
        TermCaps caps;
        expect(selectStrategy(caps) == RenderStrategy::AsciiFallback);
        caps.color16 = true;
        expect(selectStrategy(caps) == RenderStrategy::BasicAnsi16);
        caps.color256 = true;
        expect(selectStrategy(caps) == RenderStrategy::Enhanced256);
        caps.truecolor = true;
        expect(selectStrategy(caps) == RenderStrategy::RichTruecolorText);
        caps.sixel = true;
        expect(selectStrategy(caps) == RenderStrategy::SixelGraphics);
        caps.kittyGraphics = true;
        expect(selectStrategy(caps) == RenderStrategy::FullGraphics);
    };

    "kitty wins over everything"_test = [] {
        TermCaps caps;
        caps.kittyGraphics = true;
        expect(selectStrategy(caps) == RenderStrategy::FullGraphics);
    };

    "selection is deterministic"_test = [] {
        for (uint32_t bits = 0; bits < 32; bits++) {
            TermCaps caps = capsFromBits(bits);
            expect(selectStrategy(caps) == selectStrategy(caps));
        }
    };

    "selection is monotone over the capability lattice"_test = [] {
        for (uint32_t lower = 0; lower < 32; lower++) {
            for (uint32_t upper = 0; upper < 32; upper++) {
                if ((lower & upper) != lower) continue;  // upper is not a superset
                expect(selectStrategy(capsFromBits(upper)) >= selectStrategy(capsFromBits(lower)))
                    << "bits" << lower << "->" << upper;
            }
        }
    };

    "helpers"_test = [] {
        expect(!supportsColor(RenderStrategy::AsciiFallback));
        expect(supportsColor(RenderStrategy::BasicAnsi16));
        expect(supportsGraphics(RenderStrategy::FullGraphics));
        expect(supportsGraphics(RenderStrategy::SixelGraphics));
        expect(!supportsGraphics(RenderStrategy::RichTruecolorText));
        expect(colorCount(RenderStrategy::RichTruecolorText) == 16777216u);
        expect(colorCount(RenderStrategy::Enhanced256) == 256u);
        expect(colorCount(RenderStrategy::BasicAnsi16) == 16u);
        expect(colorCount(RenderStrategy::AsciiFallback) == 0u);
        expect(std::string(toString(RenderStrategy::Enhanced256)) == "enhanced_256");
    };

    "color depth follows the color caps"_test = [] {
        TermCaps caps;
        caps.kittyGraphics = true;
        expect(colorDepth(caps, selectStrategy(caps)) == ColorDepth::None);
        caps.color16 = true;
        expect(colorDepth(caps, selectStrategy(caps)) == ColorDepth::Ansi16);
        caps.color256 = true;
        expect(colorDepth(caps, selectStrategy(caps)) == ColorDepth::Palette256);
        caps.truecolor = true;
        expect(colorDepth(caps, selectStrategy(caps)) == ColorDepth::Truecolor);
    };

    "color depth is capped by the strategy"_test = [] {
        TermCaps caps;
        caps.truecolor = true;
        expect(colorDepth(caps, RenderStrategy::BasicAnsi16) == ColorDepth::Ansi16);
        expect(colorDepth(caps, RenderStrategy::AsciiFallback) == ColorDepth::None);
    };
};

suite term_caps_tests = [] {
    "program detection from the environment"_test = [] {
        expect(detectProgram({{"KITTY_WINDOW_ID", "1"}}) == Program::Kitty);
        expect(detectProgram({{"WEZTERM_EXECUTABLE", "/usr/bin/wezterm"}}) == Program::WezTerm);
        expect(detectProgram({{"WT_SESSION", "abc"}}) == Program::WindowsTerminal);
        expect(detectProgram({{"TERM_PROGRAM", "iTerm.app"}}) == Program::ITerm2);
        expect(detectProgram({{"TERM_PROGRAM", "Apple_Terminal"}}) == Program::AppleTerminal);
        expect(detectProgram({{"TERM_PROGRAM", "vscode"}}) == Program::VSCode);
        expect(detectProgram({{"VTE_VERSION", "7200"}}) == Program::VTE);
        expect(detectProgram({{"KONSOLE_VERSION", "230800"}}) == Program::Konsole);
        expect(detectProgram({{"TERM", "xterm-kitty"}}) == Program::Kitty);
        expect(detectProgram({{"TERM", "alacritty"}}) == Program::Alacritty);
        expect(detectProgram({{"TERM", "xterm-256color"}}) == Program::Xterm);
        expect(detectProgram({{"TERM", "linux"}}) == Program::LinuxConsole);
        expect(detectProgram({}) == Program::Unknown);
    };

    "program variables take precedence over TERM"_test = [] {
        expect(detectProgram({{"TERM", "xterm-256color"}, {"KITTY_PID", "42"}}) == Program::Kitty);
    };

    "kitty profile"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "xterm-kitty"}});
        expect(caps.kittyGraphics);
        expect(caps.truecolor);
        expect(caps.synchronizedOutput);
        expect(selectStrategy(caps) == RenderStrategy::FullGraphics);
    };

    "COLORTERM enables truecolor"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "xterm-256color"}, {"COLORTERM", "truecolor"}});
        expect(caps.truecolor);
        expect(selectStrategy(caps) == RenderStrategy::RichTruecolorText);
    };

    "256color TERM on an unknown program"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "screen-256color"}});
        expect(caps.color256);
        expect(!caps.truecolor);
        expect(selectStrategy(caps) == RenderStrategy::Enhanced256);
    };

    "linux console is 16 colors"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "linux"}});
        expect(selectStrategy(caps) == RenderStrategy::BasicAnsi16);
        expect(caps.widthMethod == WidthMethod::Wcwidth);
    };

    "dumb terminal falls back to ascii"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "dumb"}});
        expect(selectStrategy(caps) == RenderStrategy::AsciiFallback);
        expect(!caps.sgrMouse);
        expect(!caps.bracketedPaste);
    };

    "NO_COLOR drops colors"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "xterm-256color"}, {"NO_COLOR", "1"}});
        expect(!caps.color16);
        expect(!caps.color256);
        expect(selectStrategy(caps) == RenderStrategy::AsciiFallback);
    };

    "NO_COLOR keeps graphics but drops colors"_test = [] {
        TermCaps caps = detectCaps({{"KITTY_WINDOW_ID", "1"}, {"NO_COLOR", "1"}});
        expect(selectStrategy(caps) == RenderStrategy::FullGraphics);
        expect(colorDepth(caps, selectStrategy(caps)) == ColorDepth::None);
    };

    "empty NO_COLOR is ignored"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "xterm-256color"}, {"NO_COLOR", ""}});
        expect(caps.color256);
    };

    "tmux requests passthrough"_test = [] {
        TermCaps caps = detectCaps({{"TERM", "screen-256color"}, {"TMUX", "/tmp/tmux-0/default,1,0"}});
        expect(caps.needsTmuxPassthrough);
    };

    "detection is deterministic"_test = [] {
        EnvMap env = {{"TERM_PROGRAM", "WezTerm"}, {"COLORTERM", "24bit"}};
        expect(detectCaps(env) == detectCaps(env));
    };

    "describe mentions every flag"_test = [] {
        auto text = describe(capsForProgram(Program::WezTerm));
        expect(text.find("kitty=1") != std::string::npos);
        expect(text.find("sixel=1") != std::string::npos);
        expect(text.find("width=grapheme") != std::string::npos);
    };
};
