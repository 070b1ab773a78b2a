#include <escp/container.h>
#include <cassert>
#include <limits>

namespace escp {

Container::Container(uint16_t width, uint16_t height)
    : _width(width), _height(height) {
    assert(width > 0 && "Container width must be greater than zero");
    assert(height > 0 && "Container height must be greater than zero");
}

Result<void> Container::validatePlacement(uint16_t childWidth, uint16_t childHeight,
                                          Position position) const {
    constexpr uint32_t LIMIT = std::numeric_limits<uint16_t>::max();

    uint32_t right = uint32_t(position.x) + childWidth;
    if (right > LIMIT) {
        return Err(IntegerOverflow{"child position.x (" + std::to_string(position.x) +
                                   ") + width (" + std::to_string(childWidth) + ")"});
    }
    uint32_t bottom = uint32_t(position.y) + childHeight;
    if (bottom > LIMIT) {
        return Err(IntegerOverflow{"child position.y (" + std::to_string(position.y) +
                                   ") + height (" + std::to_string(childHeight) + ")"});
    }

    if (right > _width || bottom > _height) {
        return Err(ChildExceedsParent{_width, _height, childWidth, childHeight, position});
    }

    Bounds incoming{position.x, position.y, childWidth, childHeight};
    for (const auto& existing : _children) {
        if (existing.bounds().intersects(incoming)) {
            return Err(OverlappingChildren{existing.bounds(), incoming});
        }
    }
    return Ok();
}

Result<void> Container::renderTo(RenderContext& ctx, Position absolute) const {
    for (const auto& node : _children) {
        uint32_t x = uint32_t(absolute.x) + node.position.x;
        uint32_t y = uint32_t(absolute.y) + node.position.y;
        if (x > std::numeric_limits<uint16_t>::max() || y > std::numeric_limits<uint16_t>::max()) {
            return Err(IntegerOverflow{"render position (" + std::to_string(absolute.x) + ", " +
                                       std::to_string(absolute.y) + ") + child offset (" +
                                       std::to_string(node.position.x) + ", " +
                                       std::to_string(node.position.y) + ")"});
        }
        if (auto res = node.widget->renderTo(ctx, {uint16_t(x), uint16_t(y)}); !res) {
            return res;
        }
    }
    return Ok();
}

} // namespace escp
