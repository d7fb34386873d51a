#pragma once

#include <yframe/damage-rect.h>
#include <yframe/painter.h>
#include <yframe/result.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace yframe {

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size&) const = default;
};

enum class Key : uint8_t {
    None,
    Character,
    Enter,
    Escape,
    Tab,
    Backspace,
    Delete,
    Left,
    Right,
    Up,
    Down,
    Home,
    End
};

struct Event {
    enum class Type : uint8_t {
        Key,
        Paste,
        Focus,
        Blur,
        Resize,
        Mouse
    };

    Type type = Type::Key;
    Key key = Key::None;
    uint32_t codepoint = 0;  // Key::Character
    std::string text;        // Paste
    int x = 0;               // Mouse column, Resize width
    int y = 0;               // Mouse row, Resize height

    static Event character(uint32_t cp) {
        Event e;
        e.key = Key::Character;
        e.codepoint = cp;
        return e;
    }

    static Event keyPress(Key k) {
        Event e;
        e.key = k;
        return e;
    }

    static Event paste(std::string text) {
        Event e;
        e.type = Type::Paste;
        e.text = std::move(text);
        return e;
    }
};

//=============================================================================
// Component - consumer interface for widgets
//
// layout() assigns the area, render() paints into a painter scoped to that
// area. Neither may touch sibling components.
//=============================================================================

class Component {
public:
    using Ptr = std::shared_ptr<Component>;

    virtual ~Component() = default;

    // Preferred size within the available space
    virtual Size measure(const Size& available) const = 0;

    virtual void layout(const Rect& area) { _area = area; }

    virtual Result<void> render(Painter& painter) = 0;

    // Returns true when the event was consumed
    virtual bool handleEvent(const Event& event) {
        (void)event;
        return false;
    }

    virtual const char* debugName() const = 0;

    const Rect& area() const { return _area; }

protected:
    Rect _area;
};

// Render a component into its laid-out area of the parent painter
inline Result<void> renderComponent(Component& component, Painter& parent) {
    Painter painter = parent.sub(component.area());
    if (auto res = component.render(painter); !res) {
        return Err(std::string("Failed to render ") + component.debugName(), res);
    }
    return Ok();
}

} // namespace yframe
