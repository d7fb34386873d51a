#pragma once

#include <yframe/damage-rect.h>
#include <yframe/result.hpp>
#include <yframe/surface.h>

#include <vector>

namespace yframe {

/**
 * Compare two same-sized surfaces cell by cell.
 *
 * Returns one Span per maximal run of differing cells, sorted by row then
 * column, never overlapping. Runs are widened so that a wide glyph is always
 * covered together with its continuation column.
 *
 * Fails when the dimensions differ or the result can't be allocated.
 */
Result<std::vector<Span>> diffSurface(const Surface& next, const Surface& prev);

/**
 * Merge spans with identical (column, length) on consecutive rows into
 * rectangles. Covers exactly the cells of the input spans.
 * Input must be sorted as diffSurface produces it.
 */
Result<std::vector<Rect>> diffCoalesce(const std::vector<Span>& spans);

// One single-row Rect per span, used when coalescing is disabled
std::vector<Rect> spansToRects(const std::vector<Span>& spans);

} // namespace yframe
