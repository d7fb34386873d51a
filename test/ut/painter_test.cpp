//=============================================================================
// Painter Tests
//
// Clipping, child painters, text and combining marks
//=============================================================================

#include <boost/ut.hpp>
#include <yframe/painter.h>

#include "harness/surface_text.h"

using namespace boost::ut;
using namespace yframe;
using namespace yframe::test;

suite painter_tests = [] {
    "putChar writes with the current style"_test = [] {
        Surface s(3, 1);
        Painter p(s);
        Style bold;
        bold.attrs._bold = 1;
        p.setStyle(bold);
        expect(p.putChar(1, 0, 'x'));
        expect(s.get(1, 0).codepoint == uint32_t('x'));
        expect(s.get(1, 0).style == bold);
    };

    "out of range coordinates are dropped"_test = [] {
        Surface s(2, 2);
        Painter p(s);
        expect(!p.putChar(-1, 0, 'x'));
        expect(!p.putChar(0, 2, 'x'));
        expect(!p.putChar(5, 5, 'x'));
        expect(text(s) == "  \n  \n");
    };

    "control characters are rejected"_test = [] {
        Surface s(2, 1);
        Painter p(s);
        expect(!p.putChar(0, 0, '\n'));
        expect(!p.putChar(0, 0, 0x1B));
        expect(!p.putChar(0, 0, 0));
        expect(text(s) == "  \n");
    };

    "sub painter has its own origin and clip"_test = [] {
        Surface s(6, 3);
        Painter p(s);
        Painter child = p.sub(Rect{2, 1, 3, 1});
        expect(child.width() == 3);
        expect(child.height() == 1);

        expect(child.putChar(0, 0, 'a'));
        expect(!child.putChar(3, 0, 'b'));
        expect(!child.putChar(0, 1, 'c'));
        expect(text(s) == "      \n  a   \n      \n");
    };

    "sub painter is clipped by its parent"_test = [] {
        Surface s(4, 1);
        Painter p(s);
        Painter child = p.sub(Rect{2, 0, 10, 1});
        expect(child.width() == 2);
        expect(child.writeText(0, 0, "abcdef") == 6);
        expect(text(s) == "  ab\n");
    };

    "writeText returns columns advanced"_test = [] {
        Surface s(6, 1);
        Painter p(s);
        expect(p.writeText(0, 0, "a\xE4\xB8\xAD" "b") == 4);
        expect(s.get(1, 0).isWide());
        expect(s.get(3, 0).codepoint == uint32_t('b'));
    };

    "combining mark attaches to the previous glyph"_test = [] {
        Surface s(3, 1);
        Painter p(s);
        expect(p.writeText(0, 0, "e\xCC\x81x") == 2);
        expect(s.get(0, 0).combining[0] == uint32_t(0x0301));
        expect(s.get(1, 0).codepoint == uint32_t('x'));
    };

    "combining mark on a continuation goes to the primary"_test = [] {
        Surface s(3, 1);
        Painter p(s);
        p.putChar(0, 0, 0x4E2D);
        expect(p.putChar(1, 0, 0x0301));
        expect(s.get(0, 0).combining[0] == uint32_t(0x0301));
    };

    "wide glyph clipped on the right becomes blank"_test = [] {
        Surface s(4, 1);
        Painter p(s);
        Painter child = p.sub(Rect{0, 0, 2, 1});
        child.putChar(1, 0, 0x4E2D);
        expect(s.get(1, 0) == Cell{});
        expect(s.get(2, 0) == Cell{});
    };

    "emoji width follows the width method"_test = [] {
        Surface a(4, 1);
        Painter grapheme(a, WidthMethod::Grapheme);
        expect(grapheme.writeText(0, 0, "\xF0\x9F\x98\x80") == 2);

        Surface b(4, 1);
        Painter wcwidth(b, WidthMethod::Wcwidth);
        expect(wcwidth.writeText(0, 0, "\xF0\x9F\x98\x80") == 1);
    };

    "fill covers the rect"_test = [] {
        Surface s(4, 3);
        Painter p(s);
        p.fill(Rect{1, 1, 2, 2}, '#');
        expect(text(s) == "    \n ## \n ## \n");
    };
};
