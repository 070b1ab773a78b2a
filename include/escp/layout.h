#pragma once

#include <escp/container.h>

namespace escp {

//=============================================================================
// Layout allocators
//
// Each allocator hands out Containers together with the position they should
// be added at in a parent of the allocator's size. Column and Row are
// cursor-based and never hand out overlapping space.
//=============================================================================

struct Area {
    Container container;
    Position position;
};

//-----------------------------------------------------------------------------
// Column - stacks full-width areas from top to bottom
//-----------------------------------------------------------------------------
class Column {
public:
    Column(uint16_t width, uint16_t height) : _width(width), _height(height) {}

    Result<Area> area(uint16_t height);

    uint16_t width() const { return _width; }
    uint16_t height() const { return _height; }
    uint16_t remaining() const { return _height - _cursor; }

private:
    uint16_t _width;
    uint16_t _height;
    uint16_t _cursor = 0;
};

//-----------------------------------------------------------------------------
// Row - places full-height areas from left to right
//-----------------------------------------------------------------------------
class Row {
public:
    Row(uint16_t width, uint16_t height) : _width(width), _height(height) {}

    Result<Area> area(uint16_t width);

    uint16_t width() const { return _width; }
    uint16_t height() const { return _height; }
    uint16_t remaining() const { return _width - _cursor; }

private:
    uint16_t _width;
    uint16_t _height;
    uint16_t _cursor = 0;
};

//-----------------------------------------------------------------------------
// Stack - every area covers the whole box; later layers draw over earlier ones
//-----------------------------------------------------------------------------
class Stack {
public:
    Stack(uint16_t width, uint16_t height) : _width(width), _height(height) {}

    Area area() const;

    uint16_t width() const { return _width; }
    uint16_t height() const { return _height; }

private:
    uint16_t _width;
    uint16_t _height;
};

} // namespace escp
