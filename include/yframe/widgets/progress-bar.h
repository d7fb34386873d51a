#pragma once

#include <yframe/component.h>

#include <string>

namespace yframe::widgets {

// "<label> ====-----", bar fills the rest of the row
class ProgressBar : public Component {
public:
    explicit ProgressBar(std::string label = "", double value = 0.0);

    // Clamped to [0, 1]
    void setValue(double value);
    double value() const { return _value; }

    Size measure(const Size& available) const override;
    Result<void> render(Painter& painter) override;
    const char* debugName() const override { return "ProgressBar"; }

private:
    std::string _label;
    double _value = 0.0;
};

} // namespace yframe::widgets
