#pragma once

#include <cstdint>

namespace escp {

//=============================================================================
// Page geometry (EPSON LQ-2090II, condensed mode)
//=============================================================================

static constexpr uint16_t PAGE_WIDTH = 160;  // columns
static constexpr uint16_t PAGE_HEIGHT = 51;  // lines

//-----------------------------------------------------------------------------
// Position - column/row pair, relative or absolute depending on context
//-----------------------------------------------------------------------------
struct Position {
    uint16_t x = 0;
    uint16_t y = 0;

    bool operator==(const Position&) const = default;
};

//-----------------------------------------------------------------------------
// Bounds - axis-aligned box (x, y, width, height)
//-----------------------------------------------------------------------------
struct Bounds {
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;

    // Exclusive edges, widened so they never wrap
    uint32_t right() const { return uint32_t(x) + width; }
    uint32_t bottom() const { return uint32_t(y) + height; }

    // Strict AABB test: boxes that only share an edge do not intersect
    bool intersects(const Bounds& o) const {
        return right() > o.x && x < o.right() &&
               bottom() > o.y && y < o.bottom();
    }

    bool operator==(const Bounds&) const = default;
};

} // namespace escp
