#include <yframe/ansi.h>
#include <yframe/palette.h>

#include <algorithm>

namespace yframe::ansi {

namespace {

constexpr char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

enum class Layer { Foreground, Background, Underline };

uint8_t to16(const Color& c) {
    if (c.kind == Color::Kind::Indexed16) return c.index;
    if (c.kind == Color::Kind::Indexed256) {
        if (c.index < 16) return c.index;
        Rgb rgb = rgbForIndex(c.index);
        return nearestIndex16(rgb.r, rgb.g, rgb.b);
    }
    return nearestIndex16(c.r, c.g, c.b);
}

uint8_t to256(const Color& c) {
    if (c.kind == Color::Kind::Rgb) return nearestIndex256(c.r, c.g, c.b);
    return c.index;
}

void appendParam(std::string& out, std::string_view param) {
    out += ';';
    out += param;
}

void appendColor(std::string& out, const Color& c, Layer layer, ColorDepth depth) {
    if (c.isDefault() || depth == ColorDepth::None) return;

    bool truecolor = depth >= ColorDepth::Truecolor;
    bool indexed = depth >= ColorDepth::Palette256;

    if (layer == Layer::Underline) {
        if (c.kind == Color::Kind::Rgb && truecolor) {
            appendParam(out, "58;2;" + std::to_string(c.r) + ";" + std::to_string(c.g) +
                             ";" + std::to_string(c.b));
        } else if (indexed) {
            appendParam(out, "58;5;" + std::to_string(to256(c)));
        }
        return;
    }

    const char* extended = layer == Layer::Foreground ? "38" : "48";

    if (c.kind == Color::Kind::Rgb && truecolor) {
        appendParam(out, std::string(extended) + ";2;" + std::to_string(c.r) + ";" +
                         std::to_string(c.g) + ";" + std::to_string(c.b));
        return;
    }
    if (c.kind != Color::Kind::Indexed16 && indexed) {
        appendParam(out, std::string(extended) + ";5;" + std::to_string(to256(c)));
        return;
    }

    uint8_t i = to16(c);
    int base = layer == Layer::Foreground ? 30 : 40;
    int code = i < 8 ? base + i : base + 60 + (i - 8);
    appendParam(out, std::to_string(code));
}

std::string kittyKeys(int format, uint32_t id, int width, int height) {
    return "f=" + std::to_string(format) + ",i=" + std::to_string(id) +
           ",s=" + std::to_string(width) + ",v=" + std::to_string(height);
}

std::string osc(std::string_view body, std::string_view terminator) {
    std::string seq;
    seq.reserve(body.size() + 4);
    seq += "\033]";
    seq += body;
    seq += terminator;
    return seq;
}

} // namespace

std::string cursorPosition(int row, int col) {
    return "\033[" + std::to_string(row) + ";" + std::to_string(col) + "H";
}

std::string cursorBack(int columns) {
    return "\033[" + std::to_string(columns) + "D";
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

std::string base64Encode(std::string_view data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    const size_t len = data.size();
    auto byte = [&](size_t k) { return static_cast<uint32_t>(static_cast<uint8_t>(data[k])); };

    while (i + 2 < len) {
        uint32_t triple = (byte(i) << 16) | (byte(i + 1) << 8) | byte(i + 2);
        result.push_back(BASE64_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 6) & 0x3F]);
        result.push_back(BASE64_CHARS[triple & 0x3F]);
        i += 3;
    }

    if (i + 1 == len) {
        uint32_t val = byte(i) << 16;
        result.push_back(BASE64_CHARS[(val >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(val >> 12) & 0x3F]);
        result += "==";
    } else if (i + 2 == len) {
        uint32_t val = (byte(i) << 16) | (byte(i + 1) << 8);
        result.push_back(BASE64_CHARS[(val >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(val >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(val >> 6) & 0x3F]);
        result.push_back('=');
    }

    return result;
}

std::string sgr(const Style& style, RenderStrategy strategy) {
    return sgr(style, strategy, colorDepth(strategy));
}

std::string sgr(const Style& style, RenderStrategy strategy, ColorDepth depth) {
    if (strategy == RenderStrategy::AsciiFallback) return {};

    std::string out = "\033[0";
    const CellAttrs& a = style.attrs;

    if (a._bold) appendParam(out, "1");
    if (a._dim) appendParam(out, "2");
    if (a._italic) appendParam(out, "3");
    if (a.underline() != Underline::None) {
        // Styled underlines are an extension, older terminals only know 4
        if (a.underline() == Underline::Single || strategy < RenderStrategy::RichTruecolorText) {
            appendParam(out, "4");
        } else {
            appendParam(out, "4:" + std::to_string(static_cast<int>(a.underline())));
        }
    }
    if (a._inverse) appendParam(out, "7");
    if (a._strikethrough) appendParam(out, "9");

    appendColor(out, style.fg, Layer::Foreground, depth);
    appendColor(out, style.bg, Layer::Background, depth);
    if (style.underlineColor) {
        appendColor(out, *style.underlineColor, Layer::Underline, depth);
    }

    out += 'm';
    return out;
}

std::string hyperlinkOpen(std::string_view uri) {
    return osc(std::string("8;;") + std::string(uri), "\033\\");
}

std::string hyperlinkClose() {
    return osc("8;;", "\033\\");
}

std::string kittyTransmit(int format, uint32_t id, int width, int height,
                          const std::vector<uint8_t>& data) {
    std::string seq = "\033_G";
    seq += kittyKeys(format, id, width, height);
    seq += ';';
    seq += base64Encode(data);
    seq += "\033\\";
    return seq;
}

std::string kittyTransmitChunked(int format, uint32_t id, int width, int height,
                                 const std::vector<uint8_t>& data) {
    std::string encoded = base64Encode(data);
    if (encoded.size() <= KITTY_CHUNK_SIZE) {
        return kittyTransmit(format, id, width, height, data);
    }

    std::string seq;
    seq.reserve(encoded.size() + (encoded.size() / KITTY_CHUNK_SIZE + 1) * 16 + 64);
    for (size_t pos = 0; pos < encoded.size(); pos += KITTY_CHUNK_SIZE) {
        size_t n = std::min(KITTY_CHUNK_SIZE, encoded.size() - pos);
        bool last = pos + n >= encoded.size();
        seq += "\033_G";
        if (pos == 0) {
            seq += kittyKeys(format, id, width, height);
            seq += ',';
        }
        seq += last ? "m=0;" : "m=1;";
        seq.append(encoded, pos, n);
        seq += "\033\\";
    }
    return seq;
}

std::string iterm2Badge(std::string_view text) {
    return osc("1337;SetBadgeFormat=" + base64Encode(text), "\a");
}

std::string finalTermPromptStart() {
    return osc("133;A", "\a");
}

std::string finalTermCommandStart() {
    return osc("133;B", "\a");
}

std::string finalTermCommandExecuted(std::string_view id) {
    return osc("133;C;" + std::string(id), "\a");
}

std::string finalTermCommandFinished(int exitCode) {
    return osc("133;D;" + std::to_string(exitCode), "\a");
}

std::string clipboardCopy(std::string_view text) {
    return osc("52;c;" + base64Encode(text), "\a");
}

std::string notify(std::string_view text) {
    return osc("9;" + std::string(text), "\a");
}

std::string windowTitle(std::string_view title) {
    return osc("0;" + std::string(title), "\a");
}

std::string tmuxWrap(std::string_view sequence) {
    std::string escaped;
    escaped.reserve(sequence.size() * 2 + 10);
    escaped += "\033Ptmux;";
    for (char c : sequence) {
        if (c == '\033') {
            escaped += "\033\033";
        } else {
            escaped += c;
        }
    }
    escaped += "\033\\";
    return escaped;
}

} // namespace yframe::ansi
