#pragma once

#include <escp/widget.h>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace escp {

//=============================================================================
// Container - fixed-size box that places children at relative positions
//
// addChild() guarantees every child lies inside the box and that no two
// children overlap (shared edges are allowed). A rejected child is left
// untouched with the caller. Children render in insertion order.
//=============================================================================
class Container : public Widget {
public:
    // Zero width or height is a programming error (checked in debug builds)
    Container(uint16_t width, uint16_t height);

    template<uint16_t W, uint16_t H>
    static Container fixed() {
        static_assert(W > 0, "Container width must be greater than zero");
        static_assert(H > 0, "Container height must be greater than zero");
        return Container(W, H);
    }

    Container(Container&&) noexcept = default;
    Container& operator=(Container&&) noexcept = default;

    // Takes ownership of `child` only when placement succeeds
    template<typename W,
             typename = std::enable_if_t<std::is_base_of_v<Widget, std::remove_cvref_t<W>>>>
    Result<void> addChild(W&& child, Position position) {
        if (auto res = validatePlacement(child.width(), child.height(), position); !res) {
            return res;
        }
        _children.push_back({position, child.width(), child.height(),
                             std::make_unique<std::remove_cvref_t<W>>(std::forward<W>(child))});
        return Ok();
    }

    // Same contract for heap widgets, including derived unique_ptrs: `child`
    // is moved from only after placement succeeds
    template<typename W,
             typename = std::enable_if_t<std::is_base_of_v<Widget, W>>>
    Result<void> addChild(std::unique_ptr<W>&& child, Position position) {
        if (!child) {
            return Err("Container::addChild: null widget");
        }
        if (auto res = validatePlacement(child->width(), child->height(), position); !res) {
            return res;
        }
        _children.push_back({position, child->width(), child->height(), Widget::Ptr(std::move(child))});
        return Ok();
    }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return _height; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override;

    size_t childCount() const { return _children.size(); }

private:
    struct ChildNode {
        Position position;
        uint16_t width;
        uint16_t height;
        Widget::Ptr widget;

        Bounds bounds() const { return {position.x, position.y, width, height}; }
    };

    Result<void> validatePlacement(uint16_t childWidth, uint16_t childHeight,
                                   Position position) const;

    uint16_t _width;
    uint16_t _height;
    std::vector<ChildNode> _children;
};

} // namespace escp
