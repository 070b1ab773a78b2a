#include <escp/region.h>
#include <algorithm>

namespace escp {

Result<Region> Region::create(uint16_t x, uint16_t y, uint16_t width, uint16_t height) {
    if (width == 0 || height == 0) {
        return Err<Region>(InvalidDimensions{width, height});
    }
    // uint32 sums cannot wrap for 16-bit operands
    if (uint32_t(x) + width > PAGE_WIDTH || uint32_t(y) + height > PAGE_HEIGHT) {
        return Err<Region>(RegionOutOfBounds{x, y, width, height});
    }
    return Region(x, y, width, height);
}

Region Region::fullPage() {
    return Region(0, 0, PAGE_WIDTH, PAGE_HEIGHT);
}

Result<std::pair<Region, Region>> Region::splitVertical(uint16_t topHeight) const {
    if (topHeight > _height) {
        return Err<std::pair<Region, Region>>(InvalidSplit{_height, topHeight});
    }
    uint16_t bottomHeight = _height - topHeight;
    if (topHeight == 0 || bottomHeight == 0) {
        return Err<std::pair<Region, Region>>(
            InvalidDimensions{_width, topHeight == 0 ? topHeight : bottomHeight});
    }
    Region top(_x, _y, _width, topHeight);
    Region bottom(_x, static_cast<uint16_t>(_y + topHeight), _width, bottomHeight);
    return std::make_pair(top, bottom);
}

Result<std::pair<Region, Region>> Region::splitHorizontal(uint16_t leftWidth) const {
    if (leftWidth > _width) {
        return Err<std::pair<Region, Region>>(InvalidSplit{_width, leftWidth});
    }
    uint16_t rightWidth = _width - leftWidth;
    if (leftWidth == 0 || rightWidth == 0) {
        return Err<std::pair<Region, Region>>(
            InvalidDimensions{leftWidth == 0 ? leftWidth : rightWidth, _height});
    }
    Region left(_x, _y, leftWidth, _height);
    Region right(static_cast<uint16_t>(_x + leftWidth), _y, rightWidth, _height);
    return std::make_pair(left, right);
}

static uint16_t saturatingAdd(uint16_t a, uint16_t b) {
    uint32_t sum = uint32_t(a) + b;
    return static_cast<uint16_t>(std::min<uint32_t>(sum, UINT16_MAX));
}

static uint16_t saturatingSub(uint16_t a, uint16_t b) {
    return a > b ? static_cast<uint16_t>(a - b) : 0;
}

Result<Region> Region::withPadding(uint16_t top, uint16_t right, uint16_t bottom, uint16_t left) const {
    uint16_t horizontal = saturatingAdd(left, right);
    uint16_t vertical = saturatingAdd(top, bottom);

    if (horizontal >= _width || vertical >= _height) {
        return Err<Region>(InvalidDimensions{
            saturatingSub(_width, horizontal), saturatingSub(_height, vertical)});
    }

    // Both offsets are smaller than the size, so the result stays on the page
    return Region(static_cast<uint16_t>(_x + left), static_cast<uint16_t>(_y + top),
                  static_cast<uint16_t>(_width - horizontal),
                  static_cast<uint16_t>(_height - vertical));
}

} // namespace escp
