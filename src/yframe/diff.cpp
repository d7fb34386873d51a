#include <yframe/diff.h>
#include <ytrace/ytrace.hpp>

#include <map>
#include <new>
#include <string>
#include <utility>

namespace yframe {

namespace {

// Append [begin, end) of row, widened to whole glyphs and merged with a
// previous span it touches
void emitRun(std::vector<Span>& spans, const Surface& next, int row, int begin, int end) {
    if (begin > 0 && next.at(begin, row).isContinuation()) {
        begin -= 1;
    }
    if (end < next.width() && next.at(end - 1, row).isWide()) {
        end += 1;
    }

    if (!spans.empty()) {
        Span& last = spans.back();
        if (last.row == row && last.end() >= begin) {
            if (end > last.end()) last.length = static_cast<uint16_t>(end - last.column);
            return;
        }
    }
    spans.push_back(Span{static_cast<uint16_t>(row), static_cast<uint16_t>(begin),
                         static_cast<uint16_t>(end - begin)});
}

} // namespace

Result<std::vector<Span>> diffSurface(const Surface& next, const Surface& prev) {
    if (next.width() != prev.width() || next.height() != prev.height()) {
        return Err<std::vector<Span>>("diffSurface: dimension mismatch " +
                                      std::to_string(next.width()) + "x" + std::to_string(next.height()) +
                                      " vs " +
                                      std::to_string(prev.width()) + "x" + std::to_string(prev.height()));
    }

    try {
        std::vector<Span> spans;
        const int width = next.width();
        const int height = next.height();

        for (int y = 0; y < height; y++) {
            int runStart = -1;
            for (int x = 0; x < width; x++) {
                const bool differs = !(next.at(x, y) == prev.at(x, y));
                if (differs) {
                    if (runStart < 0) runStart = x;
                } else if (runStart >= 0) {
                    emitRun(spans, next, y, runStart, x);
                    runStart = -1;
                }
            }
            if (runStart >= 0) {
                emitRun(spans, next, y, runStart, width);
            }
        }

        ytrace("diffSurface: {}x{} -> {} spans", width, height, spans.size());
        return spans;
    } catch (const std::bad_alloc&) {
        return Err<std::vector<Span>>("diffSurface: out of memory");
    }
}

Result<std::vector<Rect>> diffCoalesce(const std::vector<Span>& spans) {
    try {
        std::vector<Rect> rects;
        rects.reserve(spans.size());

        // (column, length) -> index of the rect that may still grow downwards
        std::map<std::pair<uint16_t, uint16_t>, size_t> open;

        const Span* prev = nullptr;
        for (const auto& span : spans) {
            if (prev && (span.row < prev->row ||
                         (span.row == prev->row && span.column < prev->end()))) {
                return Err<std::vector<Rect>>("diffCoalesce: spans are not sorted or overlap");
            }
            prev = &span;

            if (span.length == 0) continue;

            auto key = std::make_pair(span.column, span.length);
            auto it = open.find(key);
            if (it != open.end() && rects[it->second].bottom() == span.row) {
                rects[it->second].height += 1;
                continue;
            }
            rects.push_back(Rect{span.column, span.row, span.length, 1});
            open[key] = rects.size() - 1;
        }

        ytrace("diffCoalesce: {} spans -> {} rects", spans.size(), rects.size());
        return rects;
    } catch (const std::bad_alloc&) {
        return Err<std::vector<Rect>>("diffCoalesce: out of memory");
    }
}

std::vector<Rect> spansToRects(const std::vector<Span>& spans) {
    std::vector<Rect> rects;
    rects.reserve(spans.size());
    for (const auto& span : spans) {
        rects.push_back(Rect{span.column, span.row, span.length, 1});
    }
    return rects;
}

} // namespace yframe
