#include <yframe/widgets/sparkline.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace yframe::widgets {

namespace {

// U+2581..U+2588
constexpr std::array<uint32_t, 8> BLOCKS = {
    0x2581, 0x2582, 0x2583, 0x2584, 0x2585, 0x2586, 0x2587, 0x2588,
};

uint32_t glyphFor(double value) {
    if (std::isnan(value)) value = 0.0;
    value = std::clamp(value, 0.0, 1.0);
    auto level = static_cast<size_t>(std::lround(value * (BLOCKS.size() - 1)));
    return BLOCKS[level];
}

} // namespace

Sparkline::Sparkline(std::vector<double> values, size_t capacity)
    : _capacity(capacity) {
    setValues(std::move(values));
}

void Sparkline::setValues(std::vector<double> values) {
    _values = std::move(values);
    if (_capacity > 0 && _values.size() > _capacity) {
        _values.erase(_values.begin(), _values.end() - static_cast<std::ptrdiff_t>(_capacity));
    }
}

void Sparkline::push(double value) {
    _values.push_back(value);
    if (_capacity > 0 && _values.size() > _capacity) {
        _values.erase(_values.begin());
    }
}

Size Sparkline::measure(const Size& available) const {
    int width = static_cast<int>(_values.size());
    return Size{std::min(width, available.width), std::min(1, available.height)};
}

Result<void> Sparkline::render(Painter& painter) {
    int columns = painter.width();
    if (columns <= 0 || _values.empty()) return Ok();

    size_t count = std::min(_values.size(), static_cast<size_t>(columns));
    size_t first = _values.size() - count;
    for (size_t i = 0; i < count; i++) {
        painter.putChar(static_cast<int>(i), 0, glyphFor(_values[first + i]));
    }
    return Ok();
}

} // namespace yframe::widgets
