#pragma once

#include <yframe/component.h>

#include <cstddef>
#include <vector>

namespace yframe::widgets {

// One block glyph per sample, values in [0, 1]. When there are more samples
// than columns the most recent ones are shown.
class Sparkline : public Component {
public:
    explicit Sparkline(std::vector<double> values = {}, size_t capacity = 0);

    void setValues(std::vector<double> values);

    // Append a sample, dropping the oldest beyond capacity (0 = unbounded)
    void push(double value);

    const std::vector<double>& values() const { return _values; }

    Size measure(const Size& available) const override;
    Result<void> render(Painter& painter) override;
    const char* debugName() const override { return "Sparkline"; }

private:
    std::vector<double> _values;
    size_t _capacity;
};

} // namespace yframe::widgets
