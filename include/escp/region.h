#pragma once

#include <escp/result.hpp>
#include <escp/types.h>
#include <cstdint>
#include <utility>

namespace escp {

//=============================================================================
// Region - validated rectangle inside the page
//
// A Region always has non-zero size and lies entirely within the 160x51 page.
// Every operation returns new Regions; the receiver is never modified.
//=============================================================================
class Region {
public:
    static Result<Region> create(uint16_t x, uint16_t y, uint16_t width, uint16_t height);
    static Region fullPage();

    // Top part of `topHeight` lines, bottom part gets the rest
    Result<std::pair<Region, Region>> splitVertical(uint16_t topHeight) const;

    // Left part of `leftWidth` columns, right part gets the rest
    Result<std::pair<Region, Region>> splitHorizontal(uint16_t leftWidth) const;

    Result<Region> withPadding(uint16_t top, uint16_t right, uint16_t bottom, uint16_t left) const;

    uint16_t x() const { return _x; }
    uint16_t y() const { return _y; }
    uint16_t width() const { return _width; }
    uint16_t height() const { return _height; }

    Position origin() const { return {_x, _y}; }
    Bounds bounds() const { return {_x, _y, _width, _height}; }

    bool operator==(const Region&) const = default;

private:
    Region(uint16_t x, uint16_t y, uint16_t width, uint16_t height)
        : _x(x), _y(y), _width(width), _height(height) {}

    uint16_t _x;
    uint16_t _y;
    uint16_t _width;
    uint16_t _height;
};

} // namespace escp
