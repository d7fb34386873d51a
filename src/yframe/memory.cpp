#include <yframe/diff.h>
#include <yframe/memory.h>
#include <ytrace/ytrace.hpp>

#include <utility>

namespace yframe {

Memory::Memory(uint16_t width, uint16_t height, WidthMethod widthMethod)
    : _front(width, height), _back(width, height), _widthMethod(widthMethod) {}

Result<std::vector<Span>> Memory::renderWith(const PaintFn& paint) {
    _back.clear();

    if (paint) {
        Painter painter(_back, _widthMethod);
        if (auto res = paint(painter); !res) {
            ydebug("Memory: paint failed, keeping front: {}", res.error().message());
            return Err<std::vector<Span>>("Paint callback failed", res);
        }
    }

    auto spans = diffSurface(_back, _front);
    if (!spans) {
        return Err<std::vector<Span>>("Failed to diff frame", spans);
    }

    std::swap(_front, _back);
    return spans;
}

void Memory::invalidate() {
    _front.clear(Cell::invalid());
}

void Memory::resize(uint16_t width, uint16_t height) {
    _front.resize(width, height);
    _back.resize(width, height);
    invalidate();
}

} // namespace yframe
