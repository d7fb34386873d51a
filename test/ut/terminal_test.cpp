//=============================================================================
// Terminal Tests
//
// Mode lifecycle, frame encoding and write failure handling. Output goes to
// an in-memory writer so every byte can be compared.
//=============================================================================

#include <boost/ut.hpp>
#include <yframe/ansi.h>
#include <yframe/term-caps.h>
#include <yframe/terminal.h>

#include "harness/failing_writer.h"

#include <cstdint>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace yframe;
using namespace yframe::test;

namespace {

TerminalOptions quietOptions() {
    TerminalOptions o;
    o.syncOutput = false;
    o.altScreen = false;
    o.hideCursor = false;
    o.mouse = false;
    o.bracketedPaste = false;
    o.focusEvents = false;
    o.rawInput = false;
    return o;
}

TerminalOptions allOutputModes() {
    TerminalOptions o = quietOptions();
    o.syncOutput = true;
    o.altScreen = true;
    o.hideCursor = true;
    o.mouse = true;
    o.bracketedPaste = true;
    o.focusEvents = true;
    return o;
}

TermCaps ansi16Caps() {
    TermCaps caps;
    caps.color16 = true;
    return caps;
}

TermCaps fullCaps() {
    TermCaps caps = ansi16Caps();
    caps.color256 = true;
    caps.truecolor = true;
    caps.hyperlinkOsc8 = true;
    caps.bracketedPaste = true;
    caps.focusEvents = true;
    caps.sgrMouse = true;
    caps.synchronizedOutput = true;
    return caps;
}

Result<void> noop(Painter&) { return Ok(); }

std::string modesOn() {
    return std::string(ansi::ALT_SCREEN_ENTER) + std::string(ansi::CURSOR_HIDE) +
           std::string(ansi::MOUSE_ENABLE) + std::string(ansi::BRACKETED_PASTE_ENABLE) +
           std::string(ansi::FOCUS_ENABLE);
}

std::string modesOff() {
    return std::string(ansi::FOCUS_DISABLE) + std::string(ansi::BRACKETED_PASTE_DISABLE) +
           std::string(ansi::MOUSE_DISABLE) + std::string(ansi::CURSOR_SHOW) +
           std::string(ansi::ALT_SCREEN_EXIT) + std::string(ansi::SYNC_END);
}

} // namespace

suite terminal_mode_tests = [] {
    "no modes requested writes nothing"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(4, 2, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        expect(out->data().empty());
    };

    "modes are enabled in order"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(4, 2, fullCaps(), allOutputModes(), out);
        expect(term.has_value());
        if (!term) return;
        expect(out->data() == modesOn());
        expect((*term)->modes()->syncOutput());
    };

    "deinit restores in reverse order"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(4, 2, fullCaps(), allOutputModes(), out);
        expect(term.has_value());
        if (!term) return;
        out->clear();
        expect((*term)->deinit().has_value());
        expect(out->data() == modesOff());
        expect(!(*term)->active());
    };

    "deinit is idempotent"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(4, 2, fullCaps(), allOutputModes(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->deinit().has_value());
        out->clear();
        expect((*term)->deinit().has_value());
        expect(out->data().empty());
    };

    "destructor restores the terminal"_test = [] {
        auto out = StringWriter::create();
        {
            auto term = Terminal::create(4, 2, fullCaps(), allOutputModes(), out);
            expect(term.has_value());
            out->clear();
        }
        expect(out->data() == modesOff());
    };

    "modes are gated by capabilities"_test = [] {
        auto out = StringWriter::create();
        TermCaps caps = ansi16Caps();
        auto term = Terminal::create(4, 2, caps, allOutputModes(), out);
        expect(term.has_value());
        if (!term) return;
        expect(out->data() == std::string(ansi::ALT_SCREEN_ENTER) + std::string(ansi::CURSOR_HIDE));
        expect(!(*term)->modes()->syncOutput());
    };

    "failed enable rolls back"_test = [] {
        auto out = FailingWriter::failingOn(std::string(ansi::MOUSE_ENABLE));
        auto term = Terminal::create(4, 2, fullCaps(), allOutputModes(), out);
        expect(!term.has_value());
        expect(out->data() == std::string(ansi::ALT_SCREEN_ENTER) + std::string(ansi::CURSOR_HIDE) +
                              std::string(ansi::CURSOR_SHOW) + std::string(ansi::ALT_SCREEN_EXIT) +
                              std::string(ansi::SYNC_END));
    };

    "restore attempts every step"_test = [] {
        auto out = FailingWriter::failingOn(std::string(ansi::CURSOR_SHOW));
        auto term = Terminal::create(4, 2, fullCaps(), allOutputModes(), out);
        expect(term.has_value());
        if (!term) return;

        auto res = (*term)->deinit();
        expect(!res.has_value());
        std::string tail = std::string(ansi::ALT_SCREEN_EXIT) + std::string(ansi::SYNC_END);
        expect(out->data().size() >= tail.size());
        expect(out->data().compare(out->data().size() - tail.size(), tail.size(), tail) == 0);
        expect(out->data().find(ansi::MOUSE_DISABLE) != std::string::npos);
        expect(!(*term)->active());
    };

    "setWriter restores modes on the previous channel"_test = [] {
        auto first = StringWriter::create();
        TerminalOptions options = quietOptions();
        options.altScreen = true;
        options.hideCursor = true;
        auto term = Terminal::create(2, 1, ansi16Caps(), options, first);
        expect(term.has_value());
        if (!term) return;

        std::string on = std::string(ansi::ALT_SCREEN_ENTER) + std::string(ansi::CURSOR_HIDE);
        std::string off = std::string(ansi::CURSOR_SHOW) + std::string(ansi::ALT_SCREEN_EXIT);

        auto second = StringWriter::create();
        expect((*term)->setWriter(second).has_value());
        expect(first->data() == on + off);
        expect(second->data() == on);

        expect((*term)->deinit().has_value());
        expect(second->data() == on + off);
        expect(first->data() == on + off);
    };

    "setWriter switches even when the old channel fails"_test = [] {
        auto first = FailingWriter::failingOn(std::string(ansi::ALT_SCREEN_EXIT));
        TerminalOptions options = quietOptions();
        options.altScreen = true;
        auto term = Terminal::create(2, 1, ansi16Caps(), options, first);
        expect(term.has_value());
        if (!term) return;

        auto second = StringWriter::create();
        expect(!(*term)->setWriter(second).has_value());
        expect((*term)->active());
        expect(second->data() == std::string(ansi::ALT_SCREEN_ENTER));
    };

    "setWriter rejects a null writer"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect(!(*term)->setWriter(nullptr).has_value());
    };

    "modes can be restored directly"_test = [] {
        auto out = StringWriter::create();
        TerminalOptions options = quietOptions();
        options.altScreen = true;
        auto modes = TerminalModes::create(out, ansi16Caps(), options);
        expect(modes.has_value());
        if (!modes) return;
        expect((*modes)->isEnabled(TerminalMode::AltScreen));
        expect((*modes)->restore().has_value());
        expect((*modes)->enabled().empty());
        expect(out->data() == std::string(ansi::ALT_SCREEN_ENTER) + std::string(ansi::ALT_SCREEN_EXIT));
    };
};

suite terminal_sequence_tests = [] {
    "clipboard copy needs osc 52"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto skipped = (*term)->copyToClipboard("foo");
        expect(skipped.has_value() && !*skipped);
        expect(out->data().empty());
    };

    "clipboard copy and notification are written"_test = [] {
        auto out = StringWriter::create();
        TermCaps caps = ansi16Caps();
        caps.clipboardOsc52 = true;
        caps.notifyOsc9 = true;
        auto term = Terminal::create(2, 1, caps, quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto copied = (*term)->copyToClipboard("foo");
        expect(copied.has_value() && *copied);
        auto notified = (*term)->notify("done");
        expect(notified.has_value() && *notified);
        expect(out->data() == ansi::clipboardCopy("foo") + ansi::notify("done"));
    };

    "shell marks and badge follow their caps"_test = [] {
        auto out = StringWriter::create();
        TermCaps caps = ansi16Caps();
        caps.finalTermOsc133 = true;
        auto term = Terminal::create(2, 1, caps, quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        expect((*term)->markPromptStart().has_value());
        expect((*term)->markCommandStart().has_value());
        expect((*term)->markCommandExecuted("7").has_value());
        expect((*term)->markCommandFinished(1).has_value());
        auto badge = (*term)->setBadge("x");
        expect(badge.has_value() && !*badge);
        expect(out->data() == ansi::finalTermPromptStart() + ansi::finalTermCommandStart() +
                              ansi::finalTermCommandExecuted("7") +
                              ansi::finalTermCommandFinished(1));
    };

    "images are wrapped for tmux"_test = [] {
        auto out = StringWriter::create();
        TermCaps caps = ansi16Caps();
        caps.kittyGraphics = true;
        caps.needsTmuxPassthrough = true;
        auto term = Terminal::create(2, 1, caps, quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        std::vector<uint8_t> rgb = {'f', 'o', 'o'};
        auto sent = (*term)->transmitImage(24, 7, 1, 1, rgb);
        expect(sent.has_value() && *sent);
        expect(out->data() == ansi::tmuxWrap(ansi::kittyTransmit(24, 7, 1, 1, rgb)));
        expect(out->data().starts_with("\033Ptmux;\033\033_Gf=24,i=7,s=1,v=1;Zm9v"));
    };

    "images need kitty graphics"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto sent = (*term)->transmitImage(24, 7, 1, 1, {1, 2, 3});
        expect(sent.has_value() && !*sent);
        expect(out->data().empty());
    };

    "sequences after deinit fail"_test = [] {
        auto out = StringWriter::create();
        TermCaps caps = ansi16Caps();
        caps.notifyOsc9 = true;
        auto term = Terminal::create(2, 1, caps, quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->deinit().has_value());
        expect(!(*term)->notify("late").has_value());
    };
};

suite terminal_render_tests = [] {
    "first frame repaints everything"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(5, 2, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            p.writeText(0, 0, "hi");
            return Ok();
        });
        expect(spans.has_value());
        if (!spans) return;
        expect(spans->size() == 2u);
        expect(out->writeCount() == 1u);
        expect(out->data() == "\033[1;1Hhi   \033[2;1H     ");
    };

    "only changed cells are written"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(5, 2, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto first = (*term)->renderWith([](Painter& p) -> Result<void> {
            p.writeText(0, 0, "hi");
            return Ok();
        });
        expect(first.has_value());
        out->clear();

        auto second = (*term)->renderWith([](Painter& p) -> Result<void> {
            p.writeText(0, 0, "ho");
            return Ok();
        });
        expect(second.has_value());
        expect(out->data() == "\033[1;2Ho");
    };

    "unchanged frame writes nothing"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(5, 2, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        expect((*term)->renderWith(noop).has_value());
        out->clear();
        auto spans = (*term)->renderWith(noop);
        expect(spans.has_value());
        if (!spans) return;
        expect(spans->empty());
        expect(out->writeCount() == 0u);
    };

    "coalesced rect moves down relatively"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(10, 3, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        expect((*term)->renderWith(noop).has_value());
        out->clear();
        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            p.fill(Rect{2, 0, 3, 2}, '#');
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;3H###\033[B\033[3D###");
    };

    "unbatched writes once per unit"_test = [] {
        auto out = StringWriter::create();
        TerminalOptions options = quietOptions();
        options.batched = false;
        options.coalesce = false;
        auto term = Terminal::create(10, 3, ansi16Caps(), options, out);
        expect(term.has_value());
        if (!term) return;

        expect((*term)->renderWith(noop).has_value());
        out->clear();
        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            p.fill(Rect{2, 0, 3, 2}, '#');
            return Ok();
        });
        expect(spans.has_value());
        expect(out->writeCount() == 2u);
        expect(out->data() == "\033[1;3H###\033[2;3H###");
    };

    "synchronized output wraps the frame"_test = [] {
        auto out = StringWriter::create();
        TerminalOptions options = quietOptions();
        options.syncOutput = true;
        auto term = Terminal::create(3, 1, fullCaps(), options, out);
        expect(term.has_value());
        if (!term) return;
        expect(out->data().empty());

        expect((*term)->renderWith(noop).has_value());
        expect(out->data() == "\033[?2026h\033[1;1H   \033[?2026l");
        expect(out->writeCount() == 1u);
    };

    "unbatched synchronized output"_test = [] {
        auto out = StringWriter::create();
        TerminalOptions options = quietOptions();
        options.syncOutput = true;
        options.batched = false;
        auto term = Terminal::create(3, 1, fullCaps(), options, out);
        expect(term.has_value());
        if (!term) return;

        expect((*term)->renderWith(noop).has_value());
        expect(out->writeCount() == 3u);
        expect(out->data() == "\033[?2026h\033[1;1H   \033[?2026l");
    };

    "unbatched sync end is written after a failed unit"_test = [] {
        auto out = FailingWriter::failingOn("\033[1;1H");
        TerminalOptions options = quietOptions();
        options.syncOutput = true;
        options.batched = false;
        auto term = Terminal::create(3, 1, fullCaps(), options, out);
        expect(term.has_value());
        if (!term) return;

        expect(!(*term)->renderWith(noop).has_value());
        expect(out->attempts() == 3u);
        expect(out->data() == "\033[?2026h\033[?2026l");
    };

    "styled cells get sgr runs"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(3, 1, fullCaps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->strategy() == RenderStrategy::RichTruecolorText);

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            Style bold;
            bold.attrs._bold = 1;
            p.setStyle(bold);
            p.putChar(0, 0, 'x');
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;1H\033[0;1mx\033[0m  \033[0m");
    };

    "truecolor is downgraded for the strategy"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(1, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            Style red;
            red.fg = Color::rgb(250, 0, 0);
            p.setStyle(red);
            p.putChar(0, 0, 'r');
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;1H\033[0;91mr\033[0m");
    };

    "NO_COLOR on a graphics terminal keeps attributes only"_test = [] {
        auto out = StringWriter::create();
        TermCaps caps = detectCaps({{"KITTY_WINDOW_ID", "1"}, {"NO_COLOR", "1"}});
        auto term = Terminal::create(1, 1, caps, quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->strategy() == RenderStrategy::FullGraphics);
        expect((*term)->colorDepth() == ColorDepth::None);

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            Style red;
            red.fg = Color::rgb(250, 0, 0);
            p.setStyle(red);
            p.putChar(0, 0, 'r');
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;1H\033[0mr\033[0m");
    };

    "sixel terminal with 256 colors gets palette colors"_test = [] {
        auto out = StringWriter::create();
        TermCaps caps;
        caps.sixel = true;
        caps.color256 = true;
        caps.color16 = true;
        auto term = Terminal::create(1, 1, caps, quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->strategy() == RenderStrategy::SixelGraphics);

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            Style red;
            red.fg = Color::rgb(250, 0, 0);
            p.setStyle(red);
            p.putChar(0, 0, 'r');
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;1H\033[0;38;5;196mr\033[0m");
    };

    "ascii fallback drops styling"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, TermCaps{}, quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->strategy() == RenderStrategy::AsciiFallback);

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            Style s;
            s.fg = Color::indexed16(1);
            s.attrs._bold = 1;
            p.setStyle(s);
            p.writeText(0, 0, "ok");
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;1Hok");
    };

    "hyperlinks are wrapped in osc 8"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, fullCaps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            Style link;
            link.hyperlink = "u";
            p.setStyle(link);
            p.putChar(0, 0, 'a');
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;1H\033]8;;u\033\\\033[0ma\033]8;;\033\\\033[0m \033[0m");
    };

    "wide glyphs are emitted once"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(4, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto spans = (*term)->renderWith([](Painter& p) -> Result<void> {
            p.writeText(0, 0, "\xE4\xB8\xAD" "a");
            return Ok();
        });
        expect(spans.has_value());
        expect(out->data() == "\033[1;1H\xE4\xB8\xAD" "a ");
    };

    "paint failure writes nothing"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(3, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto spans = (*term)->renderWith([](Painter&) -> Result<void> { return Err("nope"); });
        expect(!spans.has_value());
        expect(out->writeCount() == 0u);
    };

    "write failure forces a full repaint"_test = [] {
        auto out = FailingWriter::withBudget(0);
        auto term = Terminal::create(3, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;

        auto paint = [](Painter& p) -> Result<void> {
            p.writeText(0, 0, "abc");
            return Ok();
        };
        auto failed = (*term)->renderWith(paint);
        expect(!failed.has_value());

        out->setBudget(10);
        auto retried = (*term)->renderWith(paint);
        expect(retried.has_value());
        if (!retried) return;
        expect(retried->size() == 1u);
        expect(out->data() == "\033[1;1Habc");
    };

    "setWriter redirects and repaints"_test = [] {
        auto first = StringWriter::create();
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), first);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->renderWith(noop).has_value());

        auto second = StringWriter::create();
        expect((*term)->setWriter(second).has_value());
        expect((*term)->renderWith(noop).has_value());
        expect(second->data() == "\033[1;1H  ");
    };

    "resize repaints at the new size"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->renderWith(noop).has_value());

        expect((*term)->resize(3, 2).has_value());
        out->clear();
        expect((*term)->renderWith(noop).has_value());
        expect(out->data() == "\033[1;1H   \033[2;1H   ");
    };

    "present rejects units outside the surface"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect(!(*term)->present({Rect{1, 0, 5, 1}}).has_value());
    };

    "present widens units that split a wide glyph"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(4, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->renderWith([](Painter& p) -> Result<void> {
            p.writeText(0, 0, "\xE4\xB8\xAD" "a");
            return Ok();
        }).has_value());

        out->clear();
        expect((*term)->present({Rect{1, 0, 2, 1}}).has_value());
        expect(out->data() == "\033[1;1H\xE4\xB8\xAD" "a");

        out->clear();
        expect((*term)->present({Rect{0, 0, 1, 1}}).has_value());
        expect(out->data() == "\033[1;1H\xE4\xB8\xAD");
    };

    "render after deinit fails"_test = [] {
        auto out = StringWriter::create();
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), out);
        expect(term.has_value());
        if (!term) return;
        expect((*term)->deinit().has_value());
        expect(!(*term)->renderWith(noop).has_value());
    };

    "null writer is rejected"_test = [] {
        auto term = Terminal::create(2, 1, ansi16Caps(), quietOptions(), nullptr);
        expect(!term.has_value());
    };
};
