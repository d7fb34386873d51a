#pragma once

#include <yframe/component.h>

#include <string>
#include <string_view>
#include <vector>

namespace yframe::widgets {

// Single-line text input: "<label> <text>" with '|' drawn at the cursor
class InputField : public Component {
public:
    explicit InputField(std::string label = "");

    void setText(std::string_view utf8);
    std::string text() const;

    // Cursor position in codepoints, clamped to the text length
    void setCursor(size_t position);
    size_t cursor() const { return _cursor; }

    const std::string& label() const { return _label; }

    Size measure(const Size& available) const override;
    Result<void> render(Painter& painter) override;
    bool handleEvent(const Event& event) override;
    const char* debugName() const override { return "InputField"; }

private:
    void insert(uint32_t codepoint);

    std::string _label;
    std::vector<uint32_t> _text;
    size_t _cursor = 0;
};

} // namespace yframe::widgets
