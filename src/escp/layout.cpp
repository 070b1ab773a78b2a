#include <escp/layout.h>

namespace escp {

Result<Area> Column::area(uint16_t height) {
    if (height == 0 || _width == 0) {
        return Err<Area>(InvalidDimensions{_width, height});
    }
    if (uint32_t(_cursor) + height > _height) {
        return Err<Area>(InsufficientSpace{remaining(), height, "Column"});
    }
    Area out{Container(_width, height), Position{0, _cursor}};
    _cursor += height;
    return out;
}

Result<Area> Row::area(uint16_t width) {
    if (width == 0 || _height == 0) {
        return Err<Area>(InvalidDimensions{width, _height});
    }
    if (uint32_t(_cursor) + width > _width) {
        return Err<Area>(InsufficientSpace{remaining(), width, "Row"});
    }
    Area out{Container(width, _height), Position{_cursor, 0}};
    _cursor += width;
    return out;
}

Area Stack::area() const {
    return Area{Container(_width, _height), Position{0, 0}};
}

} // namespace escp
