#pragma once

#include <yframe/surface.h>

#include <string>

namespace yframe::test {

// Surface contents as dumped text
inline std::string text(const Surface& surface) {
    return surface.dump().bytes;
}

} // namespace yframe::test
