#include <yframe/unicode.h>
#include <yframe/widgets/progress-bar.h>

#include <algorithm>
#include <cmath>

namespace yframe::widgets {

ProgressBar::ProgressBar(std::string label, double value) : _label(std::move(label)) {
    setValue(value);
}

void ProgressBar::setValue(double value) {
    if (std::isnan(value)) value = 0.0;
    _value = std::clamp(value, 0.0, 1.0);
}

Size ProgressBar::measure(const Size& available) const {
    return Size{available.width, std::min(1, available.height)};
}

Result<void> ProgressBar::render(Painter& painter) {
    int x = 0;
    if (!_label.empty()) {
        x += painter.writeText(0, 0, _label);
        x++;
    }

    int barWidth = painter.width() - x;
    if (barWidth <= 0) return Ok();

    int filled = static_cast<int>(std::floor(_value * barWidth));
    for (int i = 0; i < barWidth; i++) {
        painter.putChar(x + i, 0, i < filled ? '=' : '-');
    }
    return Ok();
}

} // namespace yframe::widgets
