#include <yframe/unicode.h>
#include <yframe/widgets/input-field.h>

#include <algorithm>

namespace yframe::widgets {

namespace {

int textColumns(std::string_view utf8) {
    int cols = 0;
    size_t pos = 0;
    while (pos < utf8.size()) {
        uint32_t cp = 0;
        pos += decodeUtf8(utf8, pos, cp);
        cols += std::max(codepointWidth(cp), 0);
    }
    return cols;
}

} // namespace

InputField::InputField(std::string label) : _label(std::move(label)) {}

void InputField::setText(std::string_view utf8) {
    _text.clear();
    size_t pos = 0;
    while (pos < utf8.size()) {
        uint32_t cp = 0;
        pos += decodeUtf8(utf8, pos, cp);
        _text.push_back(cp);
    }
    _cursor = std::min(_cursor, _text.size());
}

std::string InputField::text() const {
    std::string out;
    for (uint32_t cp : _text) appendUtf8(out, cp);
    return out;
}

void InputField::setCursor(size_t position) {
    _cursor = std::min(position, _text.size());
}

void InputField::insert(uint32_t codepoint) {
    _text.insert(_text.begin() + static_cast<std::ptrdiff_t>(_cursor), codepoint);
    _cursor++;
}

Size InputField::measure(const Size& available) const {
    int width = textColumns(_label) + (_label.empty() ? 0 : 1) + textColumns(text()) + 1;
    return Size{std::min(width, available.width), std::min(1, available.height)};
}

Result<void> InputField::render(Painter& painter) {
    int x = 0;
    if (!_label.empty()) {
        x += painter.writeText(x, 0, _label);
        x++;
    }

    for (size_t i = 0; i <= _text.size(); i++) {
        if (i == _cursor) {
            painter.putChar(x, 0, '|');
            x++;
        }
        if (i == _text.size()) break;

        uint32_t cp = _text[i];
        int w = codepointWidth(cp, painter.widthMethod());
        if (w == 0) {
            // Combining mark joins the glyph left of it
            painter.putChar(x - 1, 0, cp);
            continue;
        }
        if (w < 0) cp = REPLACEMENT_CHARACTER;
        painter.putChar(x, 0, cp);
        x += std::max(w, 1);
    }
    return Ok();
}

bool InputField::handleEvent(const Event& event) {
    if (event.type == Event::Type::Paste) {
        size_t pos = 0;
        while (pos < event.text.size()) {
            uint32_t cp = 0;
            pos += decodeUtf8(event.text, pos, cp);
            if (cp == '\n' || cp == '\r') continue;
            if (codepointWidth(cp) < 0) continue;
            insert(cp);
        }
        return true;
    }
    if (event.type != Event::Type::Key) return false;

    switch (event.key) {
    case Key::Character:
        if (codepointWidth(event.codepoint) < 0) return false;
        insert(event.codepoint);
        return true;
    case Key::Backspace:
        if (_cursor == 0) return true;
        _cursor--;
        _text.erase(_text.begin() + static_cast<std::ptrdiff_t>(_cursor));
        return true;
    case Key::Delete:
        if (_cursor < _text.size()) {
            _text.erase(_text.begin() + static_cast<std::ptrdiff_t>(_cursor));
        }
        return true;
    case Key::Left:
        if (_cursor > 0) _cursor--;
        return true;
    case Key::Right:
        if (_cursor < _text.size()) _cursor++;
        return true;
    case Key::Home:
        _cursor = 0;
        return true;
    case Key::End:
        _cursor = _text.size();
        return true;
    default:
        return false;
    }
}

} // namespace yframe::widgets
